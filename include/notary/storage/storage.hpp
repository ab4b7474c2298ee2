#pragma once
#include <notary/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace notary::storage {

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  notary::schema::hash32_t app_hash{};
};

/// Key-value backend selected by tag. Every backend specializes this template
/// with the same member set.
///
/// put and erase are staged. Reads through get, read and contains see staged
/// writes; read_committed does not. save_committed_state applies the staged
/// writes and the checkpoint together, so a crash leaves either all of a
/// block's writes or none of them.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key) const;

  /// Encode value and stage it at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value);

  /// Raw bytes at key, staged writes included.
  std::optional<notary::schema::bytes_t> read(
      const notary::schema::bytes_view_t& key) const;

  /// Raw bytes at key as of the last checkpoint.
  std::optional<notary::schema::bytes_t> read_committed(
      const notary::schema::bytes_view_t& key) const;

  /// True when a value is stored at key.
  bool contains(const notary::schema::bytes_view_t& key) const;

  /// Stage deletion of key; missing keys are ignored.
  void erase(const notary::schema::bytes_view_t& key);

  /// Drop staged writes that were not yet checkpointed.
  void discard_pending();

  /// Load the most recent committed checkpoint (height + app_hash).
  std::optional<committed_state> load_committed_state() const;

  /// Apply staged writes and persist the checkpoint (height + app_hash).
  void save_committed_state(const committed_state& state);
};

/// Construct a concrete storage backend rooted at path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace notary::storage
