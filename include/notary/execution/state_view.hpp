#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>

namespace notary::execution {

using write_set_t = std::map<notary::schema::bytes_t, notary::schema::bytes_t>;

/// Read-through overlay for one transaction. Reads see this view's own writes
/// first, then the staged block writes, then committed storage. Nothing
/// reaches storage until the engine commits the block.
class state_view final {
 public:
  state_view(
      const notary::storage::storage<notary::storage::rocksdb_storage_tag>&
          storage,
      const write_set_t& staged);

  std::optional<notary::schema::bytes_t> load(
      const notary::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key) const {
    auto value = load(key);
    if (!value) {
      return std::nullopt;
    }
    return encoder.template decode<T>(notary::schema::bytes_view_t{*value});
  }

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value) {
    writes_[notary::schema::make_bytes(key)] = encoder.encode(value);
  }

  const write_set_t& writes() const;

 private:
  const notary::storage::storage<notary::storage::rocksdb_storage_tag>&
      storage_;
  const write_set_t& staged_;
  write_set_t writes_;
};

/// Fold a transaction's writes into the block-level write set.
void merge_writes(write_set_t& target, const write_set_t& source);

}  // namespace notary::execution
