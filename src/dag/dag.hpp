/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "committee/committee.hpp"
#include "types/certificate.hpp"

namespace weave::dag {

  using CertificatePtr = std::shared_ptr<const Certificate>;

  /**
   * In-memory index of the live part of the DAG: certificates by digest and
   * by (round, author). Vertices refer to parents by digest only, so pruning
   * a round is removing its index entries.
   */
  class Dag {
   public:
    explicit Dag(CommitteePtr committee);

    /**
     * Adds a certificate. Parents are not checked here.
     * @return false if a certificate for its (author, round) is already
     * indexed
     */
    bool insert(CertificatePtr certificate);

    [[nodiscard]] bool contains(const Digest &digest) const;

    [[nodiscard]] CertificatePtr get(const Digest &digest) const;

    /// Certificate of `author` at `round`
    [[nodiscard]] CertificatePtr at(const AuthorityId &author,
                                    Round round) const;

    /// Certificates of the round ordered by author
    [[nodiscard]] std::vector<CertificatePtr> round(Round round) const;

    /// Digests of the round ordered by author
    [[nodiscard]] std::vector<Digest> roundDigests(Round round) const;

    /// Stake of the authors certified in the round
    [[nodiscard]] Stake roundStake(Round round) const;

    /// Highest certified round of the author
    [[nodiscard]] std::optional<Round> frontier(const AuthorityId &author) const;

    [[nodiscard]] std::optional<Round> highestRound() const;

    [[nodiscard]] size_t size() const {
      return vertices_.size();
    }

    /// Drops rounds up to and including `gc_round`
    size_t prune(Round gc_round);

   private:
    CommitteePtr committee_;
    std::map<Round, std::map<AuthorityId, Digest>> rounds_;
    std::unordered_map<Digest, CertificatePtr> vertices_;
    std::unordered_map<AuthorityId, Round> frontier_;
  };

}  // namespace weave::dag
