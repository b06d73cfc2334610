/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <mutex>

#include <boost/container/flat_map.hpp>
#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"
#include "utils/ctor_limiters.hpp"

namespace weave::app {
  class Configuration;
}

namespace weave::storage {

  /**
   * RocksDB backed SpacedStorage. Every Space is a column family; a spaced
   * batch maps onto one rocksdb::WriteBatch, so cross-space writes are
   * atomic. Writes are synced to the WAL before they are acknowledged.
   */
  class RocksDb : public SpacedStorage,
                  public std::enable_shared_from_this<RocksDb>,
                  NonCopyable,
                  NonMovable {
    using ColumnFamilyHandlePtr = rocksdb::ColumnFamilyHandle *;

   public:
    RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
            qtils::SharedRef<app::Configuration> app_config);

    /**
     * Opens a database at an explicit path. `max_open_files` of 0 lets the
     * database keep up to half of the process file descriptor limit open.
     */
    RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
            const std::filesystem::path &path,
            uint64_t memory_budget,
            size_t max_open_files = 0);

    ~RocksDb() override;

    static constexpr uint32_t kDefaultLruCacheSizeMiB = 64;
    static constexpr uint32_t kDefaultBlockSizeKiB = 16;

    std::shared_ptr<BufferStorage> getSpace(Space space) override;

    std::unique_ptr<BufferSpacedBatch> createBatch() override;

    /**
     * Prepare configuration structure
     * @param lru_cache_size_mib - LRU rocksdb cache in MiB
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint32_t lru_cache_size_mib = kDefaultLruCacheSizeMiB,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    friend class RocksDbSpace;
    friend class RocksDbBatch;

   private:
    void open(const std::filesystem::path &path,
              uint64_t memory_budget,
              size_t max_open_files);

    ColumnFamilyHandlePtr getCFHandle(Space space) const;

    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    rocksdb::DB *db_{};
    std::vector<ColumnFamilyHandlePtr> column_family_handles_;
    boost::container::flat_map<Space, std::shared_ptr<BufferStorage>> spaces_;
    std::mutex spaces_mutex_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

  class RocksDbSpace : public BufferStorage {
   public:
    ~RocksDbSpace() override = default;

    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 RocksDb::ColumnFamilyHandlePtr column,
                 Space space,
                 log::Logger logger);

    std::unique_ptr<BufferBatch> batch() override;

    std::optional<size_t> byteSizeHint() const override;

    std::unique_ptr<Cursor> cursor() override;

    outcome::result<bool> contains(const ByteView &key) const override;

    outcome::result<ByteVecOrView> get(const ByteView &key) const override;

    outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

   private:
    // gather storage instance from weak ptr
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    std::weak_ptr<RocksDb> storage_;
    RocksDb::ColumnFamilyHandlePtr column_;
    Space space_;
    log::Logger logger_;
  };
}  // namespace weave::storage
