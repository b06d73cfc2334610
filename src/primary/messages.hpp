/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

#include "network/messages.hpp"

/**
 * Messages passed between the actors of one primary. Core is the only
 * writer of DAG state: the other actors talk to it through its inbox.
 */

namespace weave::primary {

  enum class PrimaryError : uint8_t {
    SIGNING_FAILED = 1,
  };
  Q_ENUM_ERROR_CODE(PrimaryError) {
    using E = decltype(e);
    switch (e) {
      case E::SIGNING_FAILED:
        return "Signing with the authority key failed";
    }
    abort();
  }

  enum class FetchKind : uint8_t {
    Certificates,
    Headers,
  };

  /// Core -> Synchronizer: digests to fetch from peers
  struct FetchRequest {
    FetchKind kind;
    std::vector<Digest> digests;
    /// Asked first, usually the origin of the missing vertex
    std::optional<AuthorityId> preferred;
    /// Peers known to have the digests
    std::vector<AuthorityId> hints;
  };

  /// Core -> Proposer: the current round and its parents
  struct ParentsReady {
    Round round;
    std::vector<Digest> parents;
  };

  /// Proposer -> Core: a signed and persisted own header
  struct OwnHeader {
    Header header;
  };

  /// Synchronizer -> Core
  struct FetchedCertificates {
    AuthorityId from;
    std::vector<Certificate> certificates;
  };

  /// Synchronizer -> Core
  struct FetchedHeaders {
    AuthorityId from;
    std::vector<Header> headers;
  };

  /// Synchronizer -> Core: no peer delivered the digest in time
  struct FetchUnavailable {
    FetchKind kind;
    Digest digest;
  };

  using CoreMessage = std::variant<network::Envelope,
                                   OwnHeader,
                                   FetchedCertificates,
                                   FetchedHeaders,
                                   FetchUnavailable>;

  using SynchronizerMessage = std::variant<network::Envelope, FetchRequest>;

  using ProposerMessage = ParentsReady;

  /// Called by an actor that cannot go on, e.g. on a storage fault
  using FatalHandler =
      std::function<void(std::string_view what, std::error_code error)>;

}  // namespace weave::primary
