/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/proposer.hpp"

namespace weave::primary {

  Proposer::Proposer(qtils::SharedRef<log::LoggingSystem> logsys,
                     Parameters params,
                     CommitteePtr committee,
                     crypto::ed25519::KeyPair keypair,
                     qtils::SharedRef<DigestBoard> board,
                     qtils::SharedRef<dag::DagStore> store,
                     qtils::SharedRef<clock::SteadyClock> steady_clock,
                     qtils::SharedRef<clock::SystemClock> system_clock,
                     Channel<ProposerMessage>::Receiver inbox,
                     Channel<CoreMessage>::Sender core,
                     FatalHandler on_fatal)
      : logger_(logsys->getLogger("Proposer", "proposer")),
        params_(params),
        committee_(std::move(committee)),
        keypair_(keypair),
        self_(crypto::ed25519::publicKey(keypair)),
        board_(std::move(board)),
        store_(std::move(store)),
        steady_clock_(std::move(steady_clock)),
        system_clock_(std::move(system_clock)),
        inbox_(std::move(inbox)),
        core_(std::move(core)),
        on_fatal_(std::move(on_fatal)) {}

  bool Proposer::recover() {
    auto pending_res = store_->pendingBatches();
    if (pending_res.has_error()) {
      fatal("Loading pending batches", pending_res.error());
      return false;
    }
    board_->restore(pending_res.value());

    auto last_res = store_->lastOwnHeader();
    if (last_res.has_error()) {
      fatal("Loading last own header", last_res.error());
      return false;
    }
    if (auto &proposal = last_res.value()) {
      auto &header = proposal->header;
      header.updateDigest();
      last_proposed_ = header.round;
      own_batches_[header.round] = proposal->batches.data();
      resend_ = std::move(header);
    }
    SL_INFO(logger_,
            "Recovered {} pending batches, last proposed round {}",
            pending_res.value().size(),
            last_proposed_);
    return true;
  }

  void Proposer::start(std::shared_ptr<Watchdog> watchdog) {
    loop_.start("proposer", std::move(watchdog), [this] {
      if (auto ready = inbox_.receiveFor(params_.tick_interval)) {
        process(ready.value());
      } else if (inbox_.isFinished()) {
        loop_.requestStop();
        return;
      }
      tick();
    });
  }

  void Proposer::stop() {
    inbox_.close();
    loop_.stop();
  }

  void Proposer::process(const ParentsReady &ready) {
    if (failed_ or ready.round < round_) {
      return;
    }
    if (ready.round > round_) {
      round_ = ready.round;
      SL_DEBUG(logger_,
               "Round {} is open with {} parents",
               round_,
               ready.parents.size());
      restoreUncertified();
    }
    // late parents extend the set until the header is built
    parents_ = ready.parents;
  }

  void Proposer::tick() {
    if (failed_) {
      return;
    }
    if (resend_.has_value()) {
      if (core_.trySend(OwnHeader{.header = resend_.value()})
          == SendStatus::Full) {
        return;
      }
      SL_DEBUG(logger_,
               "Own header of round {} handed to core again",
               resend_->round);
      resend_.reset();
    }
    auto now = steady_clock_->now();
    if (due(now)) {
      propose(now);
    }
  }

  bool Proposer::due(TimePoint now) const {
    if (round_ <= last_proposed_ or parents_.empty()) {
      return false;
    }
    if (not last_proposal_.has_value()) {
      return true;
    }
    auto elapsed = now - last_proposal_.value();
    if (elapsed < params_.min_header_delay) {
      return false;
    }
    return board_->size() >= params_.header_num_of_batches_threshold
        or elapsed >= params_.max_header_delay;
  }

  void Proposer::propose(TimePoint now) {
    auto batches = board_->take(params_.max_header_num_of_batches,
                                params_.max_header_payload_size);

    Header header;
    header.author = self_;
    header.round = round_;
    header.epoch = committee_->epoch();
    header.created_at = system_clock_->nowMsec();
    for (auto &batch : batches) {
      header.payload.push_back(batch.ref());
    }
    for (auto &parent : parents_) {
      header.parents.push_back(parent);
    }
    header.updateDigest();

    auto signature = crypto::ed25519::sign(keypair_, header.digest());
    if (not signature.has_value()) {
      board_->restore(batches);
      fatal("Signing header", make_error_code(PrimaryError::SIGNING_FAILED));
      return;
    }
    header.signature = signature.value();

    // the header exists from here on, even across a crash
    if (auto res = store_->putOwnHeader(header, batches); res.has_error()) {
      board_->restore(batches);
      fatal("Persisting own header", res.error());
      return;
    }
    last_proposed_ = round_;
    last_proposal_ = now;

    SL_INFO(logger_,
            "Proposed header {:0x} at round {} with {} batches and {} parents",
            header.digest(),
            header.round,
            batches.size(),
            parents_.size());
    own_batches_.emplace(round_, std::move(batches));

    if (not core_.send(OwnHeader{.header = std::move(header)})) {
      SL_WARN(logger_,
              "Core is gone, header of round {} is not handed over",
              round_);
    }
  }

  void Proposer::restoreUncertified() {
    while (not own_batches_.empty()) {
      auto it = own_batches_.begin();
      auto round = it->first;
      if (round + 2 > round_) {
        break;
      }
      auto certified_res = store_->certificateDigestAt(self_, round);
      if (certified_res.has_error()) {
        fatal("Looking up own certificate", certified_res.error());
        return;
      }
      if (not certified_res.value().has_value() and not it->second.empty()) {
        auto &batches = it->second;
        if (auto res = store_->putPendingBatches(batches); res.has_error()) {
          fatal("Persisting restored batches", res.error());
          return;
        }
        board_->restore(batches);
        SL_WARN(logger_,
                "Own header of round {} was not certified, {} batches go "
                "back on the board",
                round,
                batches.size());
      }
      own_batches_.erase(it);
    }
  }

  void Proposer::fatal(std::string_view what, std::error_code error) {
    SL_CRITICAL(logger_, "{}: {}", what, error.message());
    failed_ = true;
    loop_.requestStop();
    if (on_fatal_) {
      on_fatal_(what, error);
    }
  }

}  // namespace weave::primary
