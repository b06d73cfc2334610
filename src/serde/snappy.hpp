/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <snappy.h>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/bytestr.hpp>
#include <qtils/enum_error_code.hpp>

namespace weave {
  enum class SnappyError {
    UNCOMPRESS_TOO_LONG,
    UNCOMPRESS_INVALID,
  };
  Q_ENUM_ERROR_CODE(SnappyError) {
    using E = decltype(e);
    switch (e) {
      case E::UNCOMPRESS_TOO_LONG:
        return "Snappy frame declares a length above the limit";
      case E::UNCOMPRESS_INVALID:
        return "Snappy frame is corrupted";
    }
    abort();
  }

  /// Default limit for an uncompressed wire message
  constexpr size_t kMaxUncompressedSize = 16 << 20;

  inline qtils::ByteVec snappyCompress(qtils::BytesIn input) {
    std::string compressed;
    snappy::Compress(qtils::byte2str(input.data()), input.size(), &compressed);
    return qtils::ByteVec{qtils::str2byte(std::as_const(compressed))};
  }

  /// Refuses frames whose declared length exceeds `max_size` before
  /// allocating
  inline outcome::result<qtils::ByteVec> snappyUncompress(
      qtils::BytesIn compressed, size_t max_size = kMaxUncompressedSize) {
    size_t size = 0;
    if (not snappy::GetUncompressedLength(
            qtils::byte2str(compressed.data()), compressed.size(), &size)) {
      return SnappyError::UNCOMPRESS_INVALID;
    }
    if (size > max_size) {
      return SnappyError::UNCOMPRESS_TOO_LONG;
    }
    std::string uncompressed;
    if (not snappy::Uncompress(qtils::byte2str(compressed.data()),
                               compressed.size(),
                               &uncompressed)) {
      return SnappyError::UNCOMPRESS_INVALID;
    }
    return qtils::ByteVec{qtils::str2byte(std::as_const(uncompressed))};
  }
}  // namespace weave
