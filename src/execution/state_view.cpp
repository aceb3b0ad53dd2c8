#include <notary/execution/state_view.hpp>

namespace notary::execution {

state_view::state_view(
    const notary::storage::storage<notary::storage::rocksdb_storage_tag>&
        storage,
    const write_set_t& staged)
    : storage_{storage}, staged_{staged} {}

std::optional<notary::schema::bytes_t> state_view::load(
    const notary::schema::bytes_view_t& key) const {
  auto owned_key = notary::schema::make_bytes(key);
  if (auto it = writes_.find(owned_key); it != std::end(writes_)) {
    return it->second;
  }
  if (auto it = staged_.find(owned_key); it != std::end(staged_)) {
    return it->second;
  }
  return storage_.load(key);
}

const write_set_t& state_view::writes() const {
  return writes_;
}

void merge_writes(write_set_t& target, const write_set_t& source) {
  for (const auto& [key, value] : source) {
    target.insert_or_assign(key, value);
  }
}

}  // namespace notary::execution
