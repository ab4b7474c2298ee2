#pragma once
#include <rocksdb/comparator.h>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/write_batch_with_index.h>
#include <spdlog/spdlog.h>
#include <notary/common/critical.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace notary::storage {

namespace detail {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const notary::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline notary::schema::bytes_t to_bytes(const std::string& value) {
  return {reinterpret_cast<const uint8_t*>(value.data()),
          reinterpret_cast<const uint8_t*>(value.data()) + value.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  // Indexed so reads inside a block observe the block's own writes.
  std::unique_ptr<ROCKSDB_NAMESPACE::WriteBatchWithIndex> pending;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value);

  std::optional<notary::schema::bytes_t> read(
      const notary::schema::bytes_view_t& key) const;
  std::optional<notary::schema::bytes_t> read_committed(
      const notary::schema::bytes_view_t& key) const;
  bool contains(const notary::schema::bytes_view_t& key) const;
  void erase(const notary::schema::bytes_view_t& key);
  void discard_pending();
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state);

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_open() const {
  if (!database || !pending) {
    notary::common::critical("RocksDB database is not initialized");
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const notary::schema::bytes_view_t& key) const {
  auto value = read(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(notary::schema::make_bytes_view(*value))};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const notary::schema::bytes_view_t& key,
                                       const T& value) {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = pending->Put(
      detail::to_slice(key),
      detail::to_slice(notary::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    notary::common::critical("registry write failed: {}", status.ToString());
  }
}

inline std::optional<notary::schema::bytes_t>
storage<rocksdb_storage_tag>::read(
    const notary::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = pending->GetFromBatchAndDB(
      database.get(), ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key),
      &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    notary::common::critical("registry read failed: {}", status.ToString());
  }
  return detail::to_bytes(value);
}

inline std::optional<notary::schema::bytes_t>
storage<rocksdb_storage_tag>::read_committed(
    const notary::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    notary::common::critical("registry read failed: {}", status.ToString());
  }
  return detail::to_bytes(value);
}

inline bool storage<rocksdb_storage_tag>::contains(
    const notary::schema::bytes_view_t& key) const {
  return read(key).has_value();
}

inline void storage<rocksdb_storage_tag>::erase(
    const notary::schema::bytes_view_t& key) {
  require_open();
  auto status = pending->Delete(detail::to_slice(key));
  if (!status.ok()) {
    notary::common::critical("registry delete failed: {}", status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::discard_pending() {
  require_open();
  if (pending->GetWriteBatch()->Count() > 0) {
    spdlog::warn("Discarding {} staged registry writes",
                 pending->GetWriteBatch()->Count());
  }
  pending->Clear();
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open();
  auto committed_raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    notary::common::critical("failed to load committed state: {}",
                             status.ToString());
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, notary::schema::hash32_t>>(
          notary::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    notary::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .app_hash = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) {
  require_open();
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.app_hash});
  auto put_status =
      pending->Put(std::string{detail::kCommittedHeightKey},
                   detail::to_slice(notary::schema::make_bytes_view(encoded)));
  if (!put_status.ok()) {
    notary::common::critical("failed to stage committed height {}: {}",
                             state.height, put_status.ToString());
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, pending->GetWriteBatch());
  if (!status.ok()) {
    notary::common::critical("failed to persist committed height {}: {}",
                             state.height, status.ToString());
  }
  pending->Clear();
}

}  // namespace notary::storage
