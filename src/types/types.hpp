/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cinttypes>

#include <qtils/byte_arr.hpp>

#include "crypto/ed25519.hpp"

namespace weave {
  using Round = uint64_t;
  using Epoch = uint64_t;
  using Stake = uint64_t;
  using WorkerId = uint32_t;

  /// Milliseconds since Unix epoch
  using TimestampMs = uint64_t;

  using Digest = qtils::ByteArr<32>;

  /// Authorities are identified by their ed25519 public key
  using AuthorityId = crypto::ed25519::Public;
  using Signature = crypto::ed25519::Signature;

  constexpr Round kGenesisRound = 0;
}  // namespace weave
