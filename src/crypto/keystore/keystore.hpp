/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/ed25519.hpp"

namespace weave::crypto::keystore {

  /// Validator keys this process signs with
  class KeyStore {
   public:
    virtual ~KeyStore() = default;

    virtual const std::vector<ed25519::KeyPair> &keypairs() const = 0;
  };

}  // namespace weave::crypto::keystore
