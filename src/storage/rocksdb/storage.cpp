#include <bailment/common/critical.hpp>
#include <bailment/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace bailment::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto directory = std::filesystem::path{path};
  if (directory.has_parent_path()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(directory.parent_path(), error);
    if (error) {
      spdlog::error("Cannot create parent of ledger store {}: {}", path,
                    error.message());
      bailment::common::critical("cannot create ledger store directory");
    }
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, directory.string(), &database);
  if (!status.ok()) {
    spdlog::error("Cannot open ledger store {}: {}", path, status.ToString());
    bailment::common::critical("cannot open ledger store");
  }
  spdlog::debug("Opened ledger store {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace bailment::storage
