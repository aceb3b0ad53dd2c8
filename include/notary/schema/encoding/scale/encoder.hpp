#pragma once
#include <notary/common/critical.hpp>
#include <notary/schema/add_admin.hpp>
#include <notary/schema/admin_registry.hpp>
#include <notary/schema/approval_record.hpp>
#include <notary/schema/encoding/encoder.hpp>
#include <notary/schema/history_entry.hpp>
#include <notary/schema/initialize_admin_registry.hpp>
#include <notary/schema/remove_admin.hpp>
#include <notary/schema/sign_form_submission.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/schema/transaction_result.hpp>
#include <notary/schema/update_form_approval.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema structs are plain aggregates; the SCALE codec walks their fields in
// declaration order, so field order is part of the persisted format.
namespace notary::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  notary::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, notary::schema::bytes_t& out);

  template <typename T>
  T decode(const notary::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const notary::schema::bytes_view_t& bytes);
};

template <typename T>
notary::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    notary::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        notary::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const notary::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    notary::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const notary::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace notary::schema::encoding
