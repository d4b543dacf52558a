#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <chronicle/common/critical.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace chronicle::storage {

namespace detail {

using encoder_t = chronicle::schema::encoding::encoder<
    chronicle::schema::encoding::scale_encoder_tag>;

inline constexpr auto kWorkflowRecordPrefix = std::string_view{"WF|REC|"};

inline std::string make_workflow_record_key(std::string_view workflow_id) {
  auto key = std::string{kWorkflowRecordPrefix};
  key.append(workflow_id);
  return key;
}

inline chronicle::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline std::string to_value(const chronicle::schema::bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()),
                     bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<chronicle::schema::workflow_record_t> load_workflow(
      std::string_view workflow_id) const;
  workflow_map_t load_workflows() const;
  bool save_workflow(const chronicle::schema::workflow_record_t& record) const;
  bool save_workflows(
      const std::vector<chronicle::schema::workflow_record_t>& records) const;
  bool remove_workflow(std::string_view workflow_id) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const chronicle::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
storage<rocksdb_storage_tag> make_read_only_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<chronicle::schema::workflow_record_t>
storage<rocksdb_storage_tag>::load_workflow(
    std::string_view workflow_id) const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    detail::make_workflow_record_key(workflow_id), &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load workflow '{}' from RocksDB: {}", workflow_id,
                  status.ToString());
    chronicle::common::critical("failed to load workflow record");
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<chronicle::schema::workflow_record_t>(
      chronicle::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    spdlog::error("Workflow record '{}' is not decodable", workflow_id);
    chronicle::common::critical("failed to decode workflow record");
  }
  return decoded;
}

inline workflow_map_t storage<rocksdb_storage_tag>::load_workflows() const {
  auto records = workflow_map_t{};
  auto prefix = chronicle::schema::make_bytes(detail::kWorkflowRecordPrefix);
  auto encoder = detail::encoder_t{};
  for (const auto& [key, value] : list_by_prefix(
           chronicle::schema::bytes_view_t{prefix.data(), prefix.size()})) {
    auto decoded = encoder.try_decode<chronicle::schema::workflow_record_t>(
        chronicle::schema::bytes_view_t{value.data(), value.size()});
    if (!decoded.has_value()) {
      spdlog::error("Workflow record under key '{}' is not decodable",
                    chronicle::schema::make_string(key));
      chronicle::common::critical("failed to decode workflow record");
    }
    auto workflow_id = decoded->workflow_id;
    records.insert_or_assign(std::move(workflow_id),
                             std::move(decoded.value()));
  }
  return records;
}

inline bool storage<rocksdb_storage_tag>::save_workflow(
    const chronicle::schema::workflow_record_t& record) const {
  return save_workflows({record});
}

inline bool storage<rocksdb_storage_tag>::save_workflows(
    const std::vector<chronicle::schema::workflow_record_t>& records) const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& record : records) {
    auto encoded = encoder.encode(record);
    auto put_status =
        batch.Put(detail::make_workflow_record_key(record.workflow_id),
                  detail::to_value(encoded));
    if (!put_status.ok()) {
      spdlog::error("Failed staging workflow '{}': {}", record.workflow_id,
                    put_status.ToString());
      return false;
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to persist {} workflow record(s): {}",
                  records.size(), write_status.ToString());
    return false;
  }
  return true;
}

inline bool storage<rocksdb_storage_tag>::remove_workflow(
    std::string_view workflow_id) const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::make_workflow_record_key(workflow_id));
  if (!status.ok()) {
    spdlog::error("Failed to remove workflow '{}': {}", workflow_id,
                  status.ToString());
    return false;
  }
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const chronicle::schema::bytes_view_t& prefix) const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
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
    chronicle::common::critical("failed to scan workflow records");
  }
  return entries;
}

}  // namespace chronicle::storage
