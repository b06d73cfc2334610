/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace weave::storage {

  /// Failures of a storage backend, RocksDB statuses are mapped onto them
  enum class StorageError : uint8_t {
    NOT_SUPPORTED = 1,
    CORRUPTION,
    INVALID_ARGUMENT,
    IO_ERROR,
    NOT_FOUND,
    /// the backend was closed while a space or batch still referred to it
    STORAGE_GONE,
    UNKNOWN,
  };
  Q_ENUM_ERROR_CODE(StorageError) {
    using E = decltype(e);
    switch (e) {
      case E::NOT_SUPPORTED:
        return "Operation is not supported by the storage";
      case E::CORRUPTION:
        return "Storage data is corrupted";
      case E::INVALID_ARGUMENT:
        return "Invalid argument to the storage";
      case E::IO_ERROR:
        return "Storage I/O error";
      case E::NOT_FOUND:
        return "Entry not found in the storage";
      case E::STORAGE_GONE:
        return "Storage is closed";
      case E::UNKNOWN:
        break;
    }
    return "Unknown storage error";
  }

}  // namespace weave::storage
