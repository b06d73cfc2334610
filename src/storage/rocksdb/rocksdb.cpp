/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <ranges>
#include <unordered_map>
#include <unordered_set>

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_spaces.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"
#include "utils/fd_limit.hpp"

namespace weave::storage {
  namespace fs = std::filesystem;

  namespace {
    rocksdb::ColumnFamilyOptions configureColumn(uint64_t memory_budget) {
      rocksdb::ColumnFamilyOptions options;
      options.OptimizeLevelStyleCompaction(memory_budget);
      auto table_options = RocksDb::tableOptionsConfiguration();
      options.table_factory.reset(NewBlockBasedTableFactory(table_options));
      return options;
    }

    // Certificates and headers are read back by peers' fetches and by
    // recovery, markers and indices are tiny.
    const std::unordered_map<std::string_view, double> kColumnCacheShare = {
        {"certificates", 0.4},
        {"headers", 0.3},
    };

    std::vector<rocksdb::ColumnFamilyDescriptor> configureColumnFamilies(
        const std::unordered_set<std::string> &cf_names,
        uint64_t memory_budget,
        log::Logger &log) {
      double distributed_share = 0;
      size_t count = 0;
      for (const auto &[column, share] : kColumnCacheShare) {
        if (cf_names.contains(std::string{column})) {
          distributed_share += share;
          ++count;
        }
      }
      BOOST_ASSERT_MSG(distributed_share <= 1.0,
                       "Special cache distribution must not be greater 100%");

      const auto other_columns_budget = static_cast<uint64_t>(
          cf_names.size() > count ? static_cast<double>(memory_budget)
                                        * (1.0 - distributed_share)
                                        / static_cast<double>(cf_names.size()
                                                              - count)
                                  : 0);

      std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
      for (auto &name : cf_names) {
        auto budget = other_columns_budget;
        if (auto it = kColumnCacheShare.find(name);
            it != kColumnCacheShare.end()) {
          budget = static_cast<uint64_t>(static_cast<double>(memory_budget)
                                         * it->second);
        }
        descriptors.emplace_back(name, configureColumn(budget));
        SL_DEBUG(log,
                 "Column family '{}' configured with cache_size={:.0f}Mb",
                 name,
                 static_cast<double>(budget) / 1024.0 / 1024.0);
      }
      return descriptors;
    }
  }  // namespace

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    open(app_config->database().directory,
         app_config->database().cache_size,
         0);
  }

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   const std::filesystem::path &path,
                   uint64_t memory_budget,
                   size_t max_open_files)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    open(path, memory_budget, max_open_files);
  }

  void RocksDb::open(const std::filesystem::path &path,
                     uint64_t memory_budget,
                     size_t max_open_files) {
    ro_.fill_cache = false;
    wo_.sync = true;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.optimize_filters_for_hits = true;
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(
        storage::RocksDb::tableOptionsConfiguration()));

    if (max_open_files == 0) {
      auto soft_limit = getFdLimit(logger_);
      if (not soft_limit.has_value()) {
        SL_CRITICAL(logger_, "Can't read the open files limit");
        qtils::raise(StorageError::UNKNOWN);
      }
      max_open_files = soft_limit.value() / 2;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-narrowing-conversions)
    options.max_open_files = static_cast<int>(max_open_files);

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
      SL_CRITICAL(logger_, "Can't create DB directory: {}", ec.message());
      qtils::raise(ec);
    }
    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error());
      qtils::raise(res.error());
    }

    std::vector<std::string> existing_families;
    auto status = rocksdb::DB::ListColumnFamilies(
        options, path.native(), &existing_families);
    if (not status.ok() and not status.IsPathNotFound()
        and not status.IsIOError()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path.native(),
               status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }

    std::unordered_set<std::string> all_families;
    for (size_t i = 0; i < SpacesCount; ++i) {
      all_families.emplace(spaceName(static_cast<Space>(i)));
    }
    for (auto &existing_family : existing_families) {
      auto [_, was_inserted] = all_families.insert(existing_family);
      if (was_inserted) {
        SL_WARN(logger_,
                "Column family '{}' present in database but not used by "
                "weave; Probably obsolete.",
                existing_family);
      }
    }

    auto descriptors =
        configureColumnFamilies(all_families, memory_budget, logger_);

    status = rocksdb::DB::Open(
        options, path.native(), descriptors, &column_family_handles_, &db_);
    if (not status.ok()) {
      SL_CRITICAL(logger_,
                  "Can't open database in {}: {}",
                  path.native(),
                  status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }

    SL_VERBOSE(logger_, "Current column family sizes:");
    for (const auto &handle : column_family_handles_) {
      std::string size_str;
      if (db_->GetProperty(
              handle, "rocksdb.estimate-live-data-size", &size_str)) {
        auto size_mb =
            static_cast<double>(std::stoull(size_str)) / 1024.0 / 1024.0;
        SL_VERBOSE(logger_, "  - {}: {:.2f} Mb", handle->GetName(), size_mb);
      }
    }
  }

  RocksDb::~RocksDb() {
    if (db_ == nullptr) {
      return;
    }
    auto status = db_->FlushWAL(true);
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't flush WAL: {}", status.ToString());
    }
    for (auto *handle : column_family_handles_) {
      db_->DestroyColumnFamilyHandle(handle);
    }
    status = db_->Close();
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't close database: {}", status.ToString());
    }
    delete db_;
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directory(absolute_path.native(), ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::IO_ERROR;
    }
    if (not fs::is_directory(absolute_path.native())) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::IO_ERROR;
    }
    return outcome::success();
  }

  RocksDb::ColumnFamilyHandlePtr RocksDb::getCFHandle(Space space) const {
    auto space_name = spaceName(space);
    auto column = std::ranges::find_if(
        column_family_handles_,
        [&space_name](const ColumnFamilyHandlePtr &handle) {
          return handle->GetName() == space_name;
        });
    if (column_family_handles_.end() == column) {
      qtils::raise(StorageError::INVALID_ARGUMENT);
    }
    return *column;
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(Space space) {
    std::lock_guard lock(spaces_mutex_);
    if (auto it = spaces_.find(space); it != spaces_.end()) {
      return it->second;
    }
    auto space_ptr = std::make_shared<RocksDbSpace>(
        weak_from_this(), getCFHandle(space), space, logger_);
    spaces_.emplace(space, space_ptr);
    return space_ptr;
  }

  std::unique_ptr<BufferSpacedBatch> RocksDb::createBatch() {
    return std::make_unique<RocksDbBatch>(
        shared_from_this(), getCFHandle(Space::Default), logger_);
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             RocksDb::ColumnFamilyHandlePtr column,
                             Space space,
                             log::Logger logger)
      : storage_{std::move(storage)},
        column_{column},
        space_{space},
        logger_{std::move(logger)} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    auto rocks = storage_.lock();
    if (!rocks) {
      qtils::raise(StorageError::STORAGE_GONE);
    }
    return std::make_unique<RocksDbBatch>(rocks, column_, logger_);
  }

  std::optional<size_t> RocksDbSpace::byteSizeHint() const {
    auto rocks = storage_.lock();
    if (!rocks) {
      return std::nullopt;
    }
    std::string usage;
    if (not rocks->db_->GetProperty(
            column_, "rocksdb.cur-size-all-mem-tables", &usage)) {
      SL_ERROR(logger_, "Unable to retrieve memory usage value");
      return std::nullopt;
    }
    size_t usage_bytes = 0;
    auto [_, ec] = std::from_chars(
        usage.data(), usage.data() + usage.size(), usage_bytes);
    if (ec != std::errc{}) {
      SL_ERROR(logger_, "Unable to parse memory usage value");
      return std::nullopt;
    }
    return usage_bytes;
  }

  std::unique_ptr<RocksDbSpace::Cursor> RocksDbSpace::cursor() {
    auto rocks = storage_.lock();
    if (!rocks) {
      qtils::raise(StorageError::STORAGE_GONE);
    }
    auto it = std::unique_ptr<rocksdb::Iterator>(
        rocks->db_->NewIterator(rocks->ro_, column_));
    return std::make_unique<RocksDBCursor>(std::move(it));
  }

  outcome::result<bool> RocksDbSpace::contains(const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return true;
    }
    if (status.IsNotFound()) {
      return false;
    }
    return status_as_error(status, logger_);
  }

  outcome::result<ByteVecOrView> RocksDbSpace::get(const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(value.value());
  }

  outcome::result<std::optional<ByteVecOrView>> RocksDbSpace::tryGet(
      const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    rocksdb::PinnableSlice value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(ByteVecOrView(make_buffer(value)));
    }
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Put(
        rocks->wo_, column_, make_slice(key), make_slice(std::move(value)));
    if (status.ok()) {
      return outcome::success();
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::remove(const ByteView &key) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Delete(rocks->wo_, column_, make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (!rocks) {
      return StorageError::STORAGE_GONE;
    }
    return rocks;
  }

}  // namespace weave::storage
