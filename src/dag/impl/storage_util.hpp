/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/literals.hpp>

#include "types/types.hpp"

/**
 * Storage schema overview
 *
 * Headers and certificates are stored by digest in their own spaces. Each of
 * them has a round index space whose keys start with the round number in
 * big-endian form, so that a cursor walks the index in round order:
 *
 *   Headers:           header digest -> Header
 *   HeaderRounds:      round || header digest -> (empty)
 *   Certificates:      certificate digest -> Certificate
 *   CertificateRounds: round || author -> certificate digest
 *   LastVoted:         origin -> LastVote
 *   PendingBatches:    batch digest -> BatchInfo
 *   OwnHeaders:        round -> OwnProposal
 *
 * Round markers (current, gc, acked) live in the Default space under fixed
 * keys.
 */

namespace weave::dag {

  using qtils::literals::operator""_vec;

  inline const qtils::ByteVec kRoundMarkerKey = ":weave:round"_vec;
  inline const qtils::ByteVec kGcRoundMarkerKey = ":weave:gc_round"_vec;
  inline const qtils::ByteVec kAckedRoundMarkerKey = ":weave:acked_round"_vec;

  constexpr size_t kRoundKeySize = sizeof(Round);

  /// Round in big-endian representation, ordered as the number itself
  qtils::ByteVec roundKey(Round round);

  /// round || suffix
  qtils::ByteVec roundPrefixedKey(Round round, qtils::BytesIn suffix);

  /**
   * Splits a key made by roundPrefixedKey
   * @return round and the remaining suffix, or std::nullopt if the key is
   * shorter than a round
   */
  std::optional<std::pair<Round, qtils::ByteView>> splitRoundKey(
      qtils::BytesIn key);

  /// Marker value (little-endian SSZ uint64)
  qtils::ByteVec encodeMarker(Round round);

  std::optional<Round> decodeMarker(qtils::BytesIn value);

}  // namespace weave::dag
