/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/primary.hpp"

namespace weave::primary {

  Primary::Primary(qtils::SharedRef<log::LoggingSystem> logsys,
                   Parameters params,
                   CommitteePtr committee,
                   crypto::ed25519::KeyPair keypair,
                   qtils::SharedRef<dag::DagStore> store,
                   qtils::SharedRef<network::PeerNetwork> network,
                   qtils::SharedRef<clock::SteadyClock> steady_clock,
                   qtils::SharedRef<clock::SystemClock> system_clock,
                   FatalHandler on_fatal)
      : logger_(logsys->getLogger("Primary", "primary")),
        params_(params),
        self_(crypto::ed25519::publicKey(keypair)),
        store_(std::move(store)),
        network_(std::move(network)),
        feed_(std::make_shared<ConsensusFeed>(logsys,
                                              params.consensus_feed_capacity)),
        evidence_(std::make_shared<EvidenceLog>(logsys, committee)),
        board_(std::make_shared<DigestBoard>(logsys,
                                             params.digest_board_capacity)) {
    auto [core_inbox, to_core] =
        Channel<CoreMessage>::create_channel(params.channel_capacity);
    auto [sync_inbox, to_sync] =
        Channel<SynchronizerMessage>::create_channel(params.channel_capacity);
    auto [proposer_inbox, to_proposer] =
        Channel<ProposerMessage>::create_channel(params.channel_capacity);

    to_core_.emplace(to_core);
    to_synchronizer_.emplace(to_sync);

    core_ = std::make_unique<Core>(logsys,
                                   params,
                                   committee,
                                   keypair,
                                   store_,
                                   network_,
                                   feed_,
                                   evidence_,
                                   steady_clock,
                                   std::move(core_inbox),
                                   to_sync,
                                   std::move(to_proposer),
                                   on_fatal);
    proposer_ = std::make_unique<Proposer>(logsys,
                                           params,
                                           committee,
                                           keypair,
                                           board_,
                                           store_,
                                           steady_clock,
                                           system_clock,
                                           std::move(proposer_inbox),
                                           to_core,
                                           on_fatal);
    synchronizer_ = std::make_unique<Synchronizer>(logsys,
                                                   params.sync,
                                                   committee,
                                                   store_,
                                                   network_,
                                                   steady_clock,
                                                   std::move(sync_inbox),
                                                   std::move(to_core),
                                                   on_fatal);
  }

  Primary::~Primary() {
    stop();
  }

  bool Primary::prepare() {
    if (not core_->recover()) {
      return false;
    }
    if (not proposer_->recover()) {
      return false;
    }
    auto snapshot = core_->snapshot();
    SL_INFO(logger_,
            "Primary prepared at round {} with {} certificates",
            snapshot.round,
            snapshot.dag_size);
    return true;
  }

  void Primary::start(std::shared_ptr<Watchdog> watchdog) {
    network_->setHandler(
        [this](network::Envelope envelope) { route(std::move(envelope)); });
    synchronizer_->start(watchdog, params_.tick_interval);
    core_->start(watchdog);
    proposer_->start(std::move(watchdog));
    started_ = true;
  }

  void Primary::stop() {
    if (not started_) {
      return;
    }
    started_ = false;
    network_->setHandler([](network::Envelope) {});
    // wakes a consumer waiting for the next certificate
    feed_->close();
    core_->stop();
    proposer_->stop();
    synchronizer_->stop();
    SL_INFO(logger_, "Primary stopped");
  }

  outcome::result<void> Primary::reportBatch(const BatchInfo &batch) {
    // persisted first: the board is only rebuilt from the store
    OUTCOME_TRY(store_->putPendingBatches({batch}));
    board_->add(batch);
    return outcome::success();
  }

  void Primary::route(network::Envelope envelope) {
    auto &message = envelope.message;
    auto for_core = std::holds_alternative<network::SendHeader>(message)
                 or std::holds_alternative<network::SendVote>(message)
                 or std::holds_alternative<network::SendCertificate>(message);
    if (for_core) {
      if (not to_core_->send(std::move(envelope))) {
        SL_TRACE(logger_, "Core is stopped, inbound message dropped");
      }
      return;
    }
    if (not to_synchronizer_->send(std::move(envelope))) {
      SL_TRACE(logger_, "Synchronizer is stopped, inbound message dropped");
    }
  }

}  // namespace weave::primary
