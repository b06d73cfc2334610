/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/codec.hpp"

#include "serde/serialization.hpp"
#include "serde/snappy.hpp"

namespace weave::network {

  namespace {
    auto encodeSszSnappy(const auto &t) {
      return snappyCompress(encode(t).value());
    }

    template <typename T>
    outcome::result<Message> decodeSszSnappy(qtils::BytesIn compressed) {
      BOOST_OUTCOME_TRY(auto uncompressed, snappyUncompress(compressed));
      BOOST_OUTCOME_TRY(auto value, decode<T>(uncompressed));
      return Message{std::move(value)};
    }

    template <size_t I = 0>
    outcome::result<Message> decodeAlternative(uint8_t tag,
                                               qtils::BytesIn body) {
      if constexpr (I < std::variant_size_v<Message>) {
        if (tag == I) {
          return decodeSszSnappy<std::variant_alternative_t<I, Message>>(
              body);
        }
        return decodeAlternative<I + 1>(tag, body);
      } else {
        return CodecError::UNKNOWN_TAG;
      }
    }
  }  // namespace

  qtils::ByteVec encodeMessage(const Message &message) {
    qtils::ByteVec frame;
    frame.push_back(static_cast<uint8_t>(message.index()));
    auto body =
        std::visit([](const auto &m) { return encodeSszSnappy(m); }, message);
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
  }

  outcome::result<Message> decodeMessage(qtils::BytesIn frame) {
    if (frame.empty()) {
      return CodecError::EMPTY_FRAME;
    }
    return decodeAlternative(frame[0], frame.subspan(1));
  }

}  // namespace weave::network
