#pragma once
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/workflow_record.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace chronicle::storage {

using key_value_entry_t =
    std::pair<chronicle::schema::bytes_t, chronicle::schema::bytes_t>;

using workflow_map_t =
    std::map<chronicle::schema::workflow_id_t,
             chronicle::schema::workflow_record_t>;

/// Durable home of workflow records (the persistence bridge).
///
/// Reads that hit a missing key return std::nullopt. Writes report failure
/// through their return value so the engine can refuse to claim a workflow
/// is safely suspended when its record did not reach disk.
template <typename Library>
struct storage {
  /// Load one workflow record, or std::nullopt when it was never saved.
  std::optional<chronicle::schema::workflow_record_t> load_workflow(
      std::string_view workflow_id) const;

  /// Load every persisted workflow record keyed by workflow id.
  workflow_map_t load_workflows() const;

  /// Persist one workflow record; true once the write is confirmed.
  bool save_workflow(const chronicle::schema::workflow_record_t& record) const;

  /// Persist several records in one atomic write.
  bool save_workflows(
      const std::vector<chronicle::schema::workflow_record_t>& records) const;

  /// Delete a persisted record. Missing records are not an error.
  bool remove_workflow(std::string_view workflow_id) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const chronicle::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Open an existing store for inspection; every write fails.
template <typename Library>
storage<Library> make_read_only_storage(const std::string_view& path);

}  // namespace chronicle::storage
