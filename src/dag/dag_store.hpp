/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <qtils/outcome.hpp>
#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/batch.hpp"
#include "types/certificate.hpp"
#include "types/header.hpp"

namespace weave::dag {

  /// The header this node voted for last, per origin
  struct LastVote : ssz::ssz_container {
    Round round = 0;
    Epoch epoch = 0;
    Digest header_digest;

    SSZ_CONT(round, epoch, header_digest);
    bool operator==(const LastVote &) const = default;
  };

  /// Own header with the batches it carries, sizes included
  struct OwnProposal : ssz::ssz_variable_size_container {
    Header header;
    ssz::list<BatchInfo, kMaxHeaderBatches> batches;

    SSZ_CONT(header, batches);
  };

  struct RoundMarkers {
    /// Current round of the local Core
    Round round = kGenesisRound;
    /// Rounds up to and including this one are evicted
    Round gc_round = kGenesisRound;
    /// Highest round fully acknowledged by the consensus feed consumer
    Round acked_round = kGenesisRound;
  };

  /**
   * Durable storage of the DAG and of the protocol state needed to restart
   * safely. Every method that touches more than one entry writes a single
   * atomic batch.
   */
  class DagStore {
   public:
    virtual ~DagStore() = default;

    // -- certificates --

    /// Stores certificate with its header and both round index entries
    virtual outcome::result<void> putCertificate(
        const Certificate &certificate) = 0;

    [[nodiscard]] virtual outcome::result<std::optional<Certificate>>
    getCertificate(const Digest &digest) const = 0;

    [[nodiscard]] virtual outcome::result<bool> hasCertificate(
        const Digest &digest) const = 0;

    /// Digest of the certificate of `author` at `round`, if stored
    [[nodiscard]] virtual outcome::result<std::optional<Digest>>
    certificateDigestAt(const AuthorityId &author, Round round) const = 0;

    /**
     * Certificates of rounds greater than `round`
     * @return certificates ordered by (round, author)
     */
    [[nodiscard]] virtual outcome::result<std::vector<Certificate>>
    certificatesAfter(Round round) const = 0;

    // -- headers --

    [[nodiscard]] virtual outcome::result<std::optional<Header>> getHeader(
        const Digest &digest) const = 0;

    /**
     * Stores a header that is about to be voted for together with the
     * last-vote record of its author. Must be durable before the vote leaves
     * the node.
     */
    virtual outcome::result<void> putVotedHeader(const Header &header) = 0;

    [[nodiscard]] virtual outcome::result<std::optional<LastVote>> lastVoted(
        const AuthorityId &origin) const = 0;

    [[nodiscard]] virtual outcome::result<
        std::vector<std::pair<AuthorityId, LastVote>>>
    lastVotes() const = 0;

    // -- own headers and pending batches --

    /**
     * Stores a freshly signed own header with the batches it carries and
     * removes those batches from the pending batches. This is the proposer's
     * commit point.
     */
    virtual outcome::result<void> putOwnHeader(
        const Header &header, const std::vector<BatchInfo> &batches) = 0;

    /// Own header of the highest round with its batches, if any
    [[nodiscard]] virtual outcome::result<std::optional<OwnProposal>>
    lastOwnHeader() const = 0;

    virtual outcome::result<void> putPendingBatches(
        const std::vector<BatchInfo> &batches) = 0;

    [[nodiscard]] virtual outcome::result<std::vector<BatchInfo>>
    pendingBatches() const = 0;

    // -- markers and garbage collection --

    [[nodiscard]] virtual outcome::result<RoundMarkers> markers() const = 0;

    virtual outcome::result<void> writeRound(Round round) = 0;

    virtual outcome::result<void> writeAckedRound(Round acked_round) = 0;

    /**
     * Removes headers, certificates and own headers of rounds up to and
     * including `gc_round` (the newest own header is kept), and writes the
     * gc and acked markers in the same batch.
     */
    virtual outcome::result<void> collectGarbage(Round gc_round,
                                                 Round acked_round) = 0;
  };

}  // namespace weave::dag
