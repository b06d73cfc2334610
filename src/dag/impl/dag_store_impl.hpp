/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "dag/dag_store.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"

namespace weave::dag {

  class DagStoreImpl : public DagStore {
   public:
    DagStoreImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<storage::SpacedStorage> storage);

    ~DagStoreImpl() override = default;

    // -- certificates --

    outcome::result<void> putCertificate(
        const Certificate &certificate) override;

    outcome::result<std::optional<Certificate>> getCertificate(
        const Digest &digest) const override;

    outcome::result<bool> hasCertificate(const Digest &digest) const override;

    outcome::result<std::optional<Digest>> certificateDigestAt(
        const AuthorityId &author, Round round) const override;

    outcome::result<std::vector<Certificate>> certificatesAfter(
        Round round) const override;

    // -- headers --

    outcome::result<std::optional<Header>> getHeader(
        const Digest &digest) const override;

    outcome::result<void> putVotedHeader(const Header &header) override;

    outcome::result<std::optional<LastVote>> lastVoted(
        const AuthorityId &origin) const override;

    outcome::result<std::vector<std::pair<AuthorityId, LastVote>>> lastVotes()
        const override;

    // -- own headers and pending batches --

    outcome::result<void> putOwnHeader(
        const Header &header, const std::vector<BatchInfo> &batches) override;

    outcome::result<std::optional<OwnProposal>> lastOwnHeader() const override;

    outcome::result<void> putPendingBatches(
        const std::vector<BatchInfo> &batches) override;

    outcome::result<std::vector<BatchInfo>> pendingBatches() const override;

    // -- markers and garbage collection --

    outcome::result<RoundMarkers> markers() const override;

    outcome::result<void> writeRound(Round round) override;

    outcome::result<void> writeAckedRound(Round acked_round) override;

    outcome::result<void> collectGarbage(Round gc_round,
                                         Round acked_round) override;

   private:
    outcome::result<void> putHeaderTo(storage::BufferSpacedBatch &batch,
                                      const Header &header,
                                      const Digest &digest) const;

    outcome::result<Round> readMarker(const qtils::ByteVec &key) const;

    /// Removes index entries of rounds <= gc_round and the entries they name
    outcome::result<void> collectRoundIndex(storage::BufferSpacedBatch &batch,
                                            storage::Space index_space,
                                            storage::Space data_space,
                                            Round gc_round,
                                            bool digest_in_key) const;

    log::Logger logger_;
    qtils::SharedRef<storage::SpacedStorage> storage_;
  };

}  // namespace weave::dag
