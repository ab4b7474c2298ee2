#include <notary/storage/memory/storage.hpp>

#include <spdlog/spdlog.h>
#include <utility>

namespace notary::storage {

std::optional<notary::schema::bytes_t> storage<memory_storage_tag>::read(
    const notary::schema::bytes_view_t& key) const {
  auto staged = pending.find(notary::schema::make_bytes(key));
  if (staged != std::end(pending)) {
    return staged->second;
  }
  return read_committed(key);
}

std::optional<notary::schema::bytes_t>
storage<memory_storage_tag>::read_committed(
    const notary::schema::bytes_view_t& key) const {
  auto it = entries.find(notary::schema::make_bytes(key));
  if (it == std::end(entries)) {
    return std::nullopt;
  }
  return it->second;
}

bool storage<memory_storage_tag>::contains(
    const notary::schema::bytes_view_t& key) const {
  return read(key).has_value();
}

void storage<memory_storage_tag>::erase(
    const notary::schema::bytes_view_t& key) {
  pending.insert_or_assign(notary::schema::make_bytes(key), std::nullopt);
}

void storage<memory_storage_tag>::discard_pending() {
  if (!pending.empty()) {
    spdlog::warn("Discarding {} staged registry writes", pending.size());
  }
  pending.clear();
}

std::optional<committed_state>
storage<memory_storage_tag>::load_committed_state() const {
  return committed;
}

void storage<memory_storage_tag>::save_committed_state(
    const committed_state& state) {
  for (auto& [key, value] : pending) {
    if (value) {
      entries.insert_or_assign(key, std::move(*value));
    } else {
      entries.erase(key);
    }
  }
  pending.clear();
  committed = state;
}

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  spdlog::debug("Created in-memory storage '{}'", path);
  return storage<memory_storage_tag>{};
}

}  // namespace notary::storage
