/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/keystore/keystore.hpp"
#include "log/logger.hpp"

namespace weave::app {
  class Configuration;
}

namespace weave::crypto::keystore {

  enum class KeyStoreError : uint8_t {
    INVALID_SEED = 1,
    DUPLICATE_KEY,
  };
  Q_ENUM_ERROR_CODE(KeyStoreError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_SEED:
        return "Validator key is neither a 32-byte hex seed nor a file with "
               "one";
      case E::DUPLICATE_KEY:
        return "Validator key listed twice";
    }
    abort();
  }

  /**
   * Parses an ed25519 seed given inline as hex or as a path to a file with
   * the hex seed.
   */
  outcome::result<ed25519::KeyPair> keypairFromSeedHexOrPath(
      std::string_view hex_or_path);

  class KeyStoreImpl : public KeyStore {
   public:
    /// Loads every key listed in the configuration, throws on a bad one
    KeyStoreImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<app::Configuration> config);

    explicit KeyStoreImpl(std::vector<ed25519::KeyPair> keypairs);

    const std::vector<ed25519::KeyPair> &keypairs() const override {
      return keypairs_;
    }

   private:
    std::vector<ed25519::KeyPair> keypairs_;
  };
}  // namespace weave::crypto::keystore
