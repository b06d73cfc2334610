/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "dag/dag_store.hpp"

namespace weave::dag {

  class DagStoreMock : public DagStore {
   public:
    MOCK_METHOD(outcome::result<void>,
                putCertificate,
                (const Certificate &),
                (override));

    MOCK_METHOD(outcome::result<std::optional<Certificate>>,
                getCertificate,
                (const Digest &),
                (const, override));

    MOCK_METHOD(outcome::result<bool>,
                hasCertificate,
                (const Digest &),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<Digest>>,
                certificateDigestAt,
                (const AuthorityId &, Round),
                (const, override));

    MOCK_METHOD(outcome::result<std::vector<Certificate>>,
                certificatesAfter,
                (Round),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<Header>>,
                getHeader,
                (const Digest &),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                putVotedHeader,
                (const Header &),
                (override));

    MOCK_METHOD(outcome::result<std::optional<LastVote>>,
                lastVoted,
                (const AuthorityId &),
                (const, override));

    using LastVotes = std::vector<std::pair<AuthorityId, LastVote>>;
    MOCK_METHOD(outcome::result<LastVotes>, lastVotes, (), (const, override));

    MOCK_METHOD(outcome::result<void>,
                putOwnHeader,
                (const Header &, const std::vector<BatchInfo> &),
                (override));

    MOCK_METHOD(outcome::result<std::optional<OwnProposal>>,
                lastOwnHeader,
                (),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                putPendingBatches,
                (const std::vector<BatchInfo> &),
                (override));

    MOCK_METHOD(outcome::result<std::vector<BatchInfo>>,
                pendingBatches,
                (),
                (const, override));

    MOCK_METHOD(outcome::result<RoundMarkers>, markers, (), (const, override));

    MOCK_METHOD(outcome::result<void>, writeRound, (Round), (override));

    MOCK_METHOD(outcome::result<void>, writeAckedRound, (Round), (override));

    MOCK_METHOD(outcome::result<void>,
                collectGarbage,
                (Round, Round),
                (override));
  };

}  // namespace weave::dag
