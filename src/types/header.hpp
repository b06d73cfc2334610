/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "serde/serialization.hpp"
#include "types/batch.hpp"
#include "types/constants.hpp"

namespace weave {

  using Payload = ssz::list<BatchRef, kMaxHeaderBatches>;
  using ParentDigests = ssz::list<Digest, kMaxCommitteeSize>;

  /// Header fields covered by the author's signature
  struct HeaderPreimage : ssz::ssz_variable_size_container {
    AuthorityId author;
    Round round = 0;
    Epoch epoch = 0;
    TimestampMs created_at = 0;
    Payload payload;
    ParentDigests parents;

    SSZ_CONT(author, round, epoch, created_at, payload, parents);
  };

  /**
   * @class Header
   * A vertex proposal: one per author and round. Its digest is the hash tree
   * root of every field but the signature.
   */
  class Header : public ssz::ssz_variable_size_container {
   public:
    /// Proposing authority
    AuthorityId author;
    /// Round of the proposal, genesis is round 0
    Round round = 0;
    Epoch epoch = 0;
    /// Creation time, milliseconds since Unix epoch
    TimestampMs created_at = 0;
    /// Batches proposed in this round, in the author's order
    Payload payload;
    /// Certificate digests of round-1, pairwise distinct
    ParentDigests parents;
    /// Author's signature over digest()
    Signature signature;

    /// Digest if calculated
    mutable std::optional<Digest> digest_opt{};

    SSZ_CONT(author, round, epoch, created_at, payload, parents, signature);

    bool operator==(const Header &other) const {
      return author == other.author and round == other.round
         and epoch == other.epoch and created_at == other.created_at
         and payload == other.payload and parents == other.parents
         and signature == other.signature;
    }

    /// Cached digest, or a freshly computed one when not cached
    Digest digest() const {
      if (digest_opt.has_value()) {
        return digest_opt.value();
      }
      return computeDigest();
    }

    /// Caches the digest. Call before sharing the header between threads
    void updateDigest() const {
      digest_opt = computeDigest();
    }

   private:
    Digest computeDigest() const {
      return sszHash(HeaderPreimage{
          .author = author,
          .round = round,
          .epoch = epoch,
          .created_at = created_at,
          .payload = payload,
          .parents = parents,
      });
    }
  };

}  // namespace weave
