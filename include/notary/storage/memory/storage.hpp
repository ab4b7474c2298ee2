#pragma once
#include <notary/schema/primitives.hpp>
#include <notary/storage/storage.hpp>
#include <map>
#include <optional>
#include <string_view>

// Process-local backend used for isolated registries and tests. Staged writes
// follow the same checkpoint rules as the RocksDB backend; std::nullopt in
// pending marks a staged deletion.
namespace notary::storage {

struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::map<notary::schema::bytes_t, notary::schema::bytes_t> entries;
  std::map<notary::schema::bytes_t, std::optional<notary::schema::bytes_t>>
      pending;
  std::optional<committed_state> committed;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key) const {
    auto value = read(key);
    if (!value) {
      return std::nullopt;
    }
    return {
        encoder.template decode<T>(notary::schema::make_bytes_view(*value))};
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value) {
    pending.insert_or_assign(notary::schema::make_bytes(key),
                             encoder.encode(value));
  }

  std::optional<notary::schema::bytes_t> read(
      const notary::schema::bytes_view_t& key) const;
  std::optional<notary::schema::bytes_t> read_committed(
      const notary::schema::bytes_view_t& key) const;
  bool contains(const notary::schema::bytes_view_t& key) const;
  void erase(const notary::schema::bytes_view_t& key);
  void discard_pending();
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state);
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace notary::storage
