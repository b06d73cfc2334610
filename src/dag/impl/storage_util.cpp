/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dag/impl/storage_util.hpp"

#include "serde/serialization.hpp"

namespace weave::dag {

  qtils::ByteVec roundKey(Round round) {
    qtils::ByteVec key(kRoundKeySize);
    for (size_t i = kRoundKeySize; i > 0; --i) {
      key[i - 1] = static_cast<uint8_t>(round & 0xff);
      round >>= 8;
    }
    return key;
  }

  qtils::ByteVec roundPrefixedKey(Round round, qtils::BytesIn suffix) {
    auto key = roundKey(round);
    key.insert(key.end(), suffix.begin(), suffix.end());
    return key;
  }

  std::optional<std::pair<Round, qtils::ByteView>> splitRoundKey(
      qtils::BytesIn key) {
    if (key.size() < kRoundKeySize) {
      return std::nullopt;
    }
    Round round = 0;
    for (size_t i = 0; i < kRoundKeySize; ++i) {
      round = (round << 8) | key[i];
    }
    return std::make_pair(round, qtils::ByteView{key.subspan(kRoundKeySize)});
  }

  qtils::ByteVec encodeMarker(Round round) {
    return encode(round).value();
  }

  std::optional<Round> decodeMarker(qtils::BytesIn value) {
    auto res = decode<Round>(value);
    if (res.has_error()) {
      return std::nullopt;
    }
    return res.value();
  }

}  // namespace weave::dag
