/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <print>

#include <fmt/format.h>

#include "crypto/ed25519.hpp"

/// Prints a fresh validator seed and its public key
inline void cmdKeyGenerate() {
  auto seed = weave::crypto::ed25519::randomSeed();
  auto keypair = weave::crypto::ed25519::keypairFromSeed(seed);
  std::println("{}", fmt::format("{:0xx}", seed));
  std::println(
      "{}",
      fmt::format("{:0xx}", weave::crypto::ed25519::publicKey(keypair)));
}
