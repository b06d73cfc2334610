/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keystore/keystore_impl.hpp"

#include <filesystem>

#include <boost/algorithm/string/trim.hpp>
#include <qtils/error_throw.hpp>
#include <qtils/read_file.hpp>
#include <qtils/unhex.hpp>

#include "app/configuration.hpp"

namespace weave::crypto::keystore {

  outcome::result<ed25519::KeyPair> keypairFromSeedHexOrPath(
      std::string_view hex_or_path) {
    std::string hex{hex_or_path};
    boost::trim(hex);
    ed25519::Seed seed;
    auto unhex_result = qtils::unhex0x(seed, hex, true);
    if (not unhex_result.has_value() and std::filesystem::exists(hex_or_path)) {
      BOOST_OUTCOME_TRY(hex, qtils::readText(hex_or_path));
      boost::trim(hex);
      unhex_result = qtils::unhex0x(seed, hex, true);
    }
    if (not unhex_result.has_value()) {
      return KeyStoreError::INVALID_SEED;
    }
    return ed25519::keypairFromSeed(seed);
  }

  KeyStoreImpl::KeyStoreImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<app::Configuration> config) {
    auto logger = logsys->getLogger("KeyStore", "application");
    for (auto &entry : config->validatorKeys()) {
      auto keypair_res = keypairFromSeedHexOrPath(entry);
      if (keypair_res.has_error()) {
        SL_CRITICAL(logger,
                    "Can't load validator key: {}",
                    keypair_res.error());
        qtils::raise(keypair_res.error());
      }
      auto &keypair = keypair_res.value();
      auto pub = ed25519::publicKey(keypair);
      for (auto &known : keypairs_) {
        if (ed25519::publicKey(known) == pub) {
          qtils::raise(KeyStoreError::DUPLICATE_KEY);
        }
      }
      SL_INFO(logger, "Loaded validator key {:0xx}", pub);
      keypairs_.emplace_back(keypair);
    }
    if (keypairs_.empty()) {
      SL_WARN(logger, "No validator keys configured, node runs no primary");
    }
  }

  KeyStoreImpl::KeyStoreImpl(std::vector<ed25519::KeyPair> keypairs)
      : keypairs_(std::move(keypairs)) {}

}  // namespace weave::crypto::keystore
