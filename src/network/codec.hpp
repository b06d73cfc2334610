/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>

#include "network/messages.hpp"

namespace weave::network {

  enum class CodecError : uint8_t {
    EMPTY_FRAME = 1,
    UNKNOWN_TAG,
  };
  Q_ENUM_ERROR_CODE(CodecError) {
    using E = decltype(e);
    switch (e) {
      case E::EMPTY_FRAME:
        return "Wire frame is empty";
      case E::UNKNOWN_TAG:
        return "Wire frame has an unknown message tag";
    }
    abort();
  }

  /// Frame layout: one tag byte, then the snappy-compressed SSZ body
  qtils::ByteVec encodeMessage(const Message &message);

  outcome::result<Message> decodeMessage(qtils::BytesIn frame);

}  // namespace weave::network
