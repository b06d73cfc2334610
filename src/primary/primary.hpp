/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "primary/consensus_feed.hpp"
#include "primary/core.hpp"
#include "primary/digest_board.hpp"
#include "primary/evidence_log.hpp"
#include "primary/proposer.hpp"
#include "primary/synchronizer.hpp"

namespace weave::primary {

  /**
   * @class Primary
   * One authority's mempool primary: Core, Proposer and Synchronizer
   * connected by bounded channels, with the digest board fed by workers and
   * the consensus feed read by the consensus stage.
   */
  class Primary {
   public:
    Primary(qtils::SharedRef<log::LoggingSystem> logsys,
            Parameters params,
            CommitteePtr committee,
            crypto::ed25519::KeyPair keypair,
            qtils::SharedRef<dag::DagStore> store,
            qtils::SharedRef<network::PeerNetwork> network,
            qtils::SharedRef<clock::SteadyClock> steady_clock,
            qtils::SharedRef<clock::SystemClock> system_clock,
            FatalHandler on_fatal);

    ~Primary();

    /// Restores state from the store, must precede start()
    bool prepare();

    void start(std::shared_ptr<Watchdog> watchdog);

    void stop();

    /// Called by a local worker for each sealed batch
    outcome::result<void> reportBatch(const BatchInfo &batch);

    [[nodiscard]] CoreSnapshot snapshot() const {
      return core_->snapshot();
    }

    [[nodiscard]] const AuthorityId &self() const {
      return self_;
    }

    ConsensusFeed &feed() {
      return *feed_;
    }

    EvidenceLog &evidence() {
      return *evidence_;
    }

    DigestBoard &board() {
      return *board_;
    }

   private:
    /// Routes a message from a peer to the actor serving it
    void route(network::Envelope envelope);

    log::Logger logger_;
    const Parameters params_;
    const AuthorityId self_;
    qtils::SharedRef<dag::DagStore> store_;
    qtils::SharedRef<network::PeerNetwork> network_;
    qtils::SharedRef<ConsensusFeed> feed_;
    qtils::SharedRef<EvidenceLog> evidence_;
    qtils::SharedRef<DigestBoard> board_;

    std::optional<Channel<CoreMessage>::Sender> to_core_;
    std::optional<Channel<SynchronizerMessage>::Sender> to_synchronizer_;

    std::unique_ptr<Core> core_;
    std::unique_ptr<Proposer> proposer_;
    std::unique_ptr<Synchronizer> synchronizer_;
    bool started_ = false;
  };

}  // namespace weave::primary
