#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <bailment/common/critical.hpp>
#include <bailment/schema/encoding/scale/encoder.hpp>
#include <bailment/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace bailment::storage {

namespace detail {

using encoder_t = bailment::schema::encoding::scale_encoder_t;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const bailment::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline bailment::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline bailment::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{state.height, state.state_root, state.chain_id});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const bailment::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bailment::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<bailment::schema::bytes_t> get_raw(
      const bailment::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const bailment::schema::bytes_view_t& prefix) const;
  void apply(const write_set& writes) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<bailment::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const bailment::schema::bytes_view_t& key) const {
  if (!database) {
    bailment::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    bailment::common::critical("Failed to get value from RocksDB");
  }
  return bailment::schema::make_bytes(value);
}

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const bailment::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      bailment::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const bailment::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    bailment::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    bailment::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto committed_raw = get_raw(bailment::schema::make_bytes_view(
      std::string_view{kCommittedStateKey}));
  if (!committed_raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<std::tuple<
      int64_t, bailment::schema::hash32_t, bailment::schema::hash32_t>>(
      bailment::schema::bytes_view_t{committed_raw->data(),
                                     committed_raw->size()});
  if (!decoded.has_value()) {
    bailment::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value()),
                         .chain_id = std::get<2>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  apply(write_set{.puts = {}, .deletes = {}, .checkpoint = state});
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const bailment::schema::bytes_view_t& prefix) const {
  if (!database) {
    bailment::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    bailment::common::critical("RocksDB iteration failed");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::apply(
    const write_set& writes) const {
  if (!database) {
    bailment::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : writes.deletes) {
    auto delete_status = batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      bailment::common::critical("failed staging delete in write batch");
    }
  }
  for (const auto& [key, value] : writes.puts) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      bailment::common::critical("failed staging put in write batch");
    }
  }
  if (writes.checkpoint) {
    auto encoded = detail::encode_committed_state(*writes.checkpoint);
    auto put_status = batch.Put(std::string{kCommittedStateKey},
                                detail::to_slice(encoded));
    if (!put_status.ok()) {
      bailment::common::critical("failed staging committed state");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    bailment::common::critical("failed to commit write batch");
  }
}

}  // namespace bailment::storage
