/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/consensus_feed.hpp"

namespace weave::primary {

  namespace {
    auto makeChannel(size_t capacity) {
      return Channel<SequencedCertificate>::create_channel(capacity);
    }
  }  // namespace

  ConsensusFeed::ConsensusFeed(qtils::SharedRef<log::LoggingSystem> logsys,
                               size_t capacity)
      : ConsensusFeed(std::move(logsys), makeChannel(capacity)) {}

  ConsensusFeed::ConsensusFeed(
      qtils::SharedRef<log::LoggingSystem> logsys,
      std::pair<Channel<SequencedCertificate>::Receiver,
                Channel<SequencedCertificate>::Sender> channel)
      : logger_(logsys->getLogger("ConsensusFeed", "consensus")),
        sender_(std::move(channel.second)),
        receiver_(std::move(channel.first)) {}

  bool ConsensusFeed::push(std::shared_ptr<const Certificate> certificate) {
    auto round = certificate->round();
    auto index = progress_.exclusiveAccess([&](Progress &progress) {
      auto index = progress.next_index++;
      progress.unacked.push_back({.index = index, .round = round});
      progress.unacked_rounds.insert(round);
      progress.delivered_round = std::max(progress.delivered_round, round);
      return index;
    });
    SL_TRACE(logger_, "Deliver #{} of round {}", index, round);
    auto was_empty = backlog_.empty();
    backlog_.push_back(SequencedCertificate{
        .index = index,
        .certificate = std::move(certificate),
    });
    if (not flush()) {
      return false;
    }
    if (was_empty and not backlog_.empty()) {
      SL_DEBUG(logger_,
               "Consensus consumer is behind, #{} waits in the backlog",
               index);
    }
    return true;
  }

  bool ConsensusFeed::flush() {
    while (not backlog_.empty()) {
      switch (sender_.trySend(backlog_.front())) {
        case SendStatus::Sent:
          backlog_.pop_front();
          break;
        case SendStatus::Full:
        case SendStatus::Timeout:
          return true;
        case SendStatus::Closed:
          SL_WARN(logger_,
                  "Consensus feed is closed, {} certificates are not "
                  "delivered",
                  backlog_.size());
          backlog_.clear();
          return false;
      }
    }
    return true;
  }

  void ConsensusFeed::resetAckedRound(Round round) {
    progress_.exclusiveAccess([&](Progress &progress) {
      progress.delivered_round = std::max(progress.delivered_round, round);
    });
  }

  Round ConsensusFeed::ackedRound() const {
    return progress_.sharedAccess([](const Progress &progress) -> Round {
      if (progress.unacked_rounds.empty()) {
        return progress.delivered_round;
      }
      auto oldest = *progress.unacked_rounds.begin();
      return oldest == 0 ? 0 : oldest - 1;
    });
  }

  size_t ConsensusFeed::unacknowledged() const {
    return progress_.sharedAccess(
        [](const Progress &progress) { return progress.unacked.size(); });
  }

  std::optional<SequencedCertificate> ConsensusFeed::next() {
    return receiver_.receive();
  }

  std::optional<SequencedCertificate> ConsensusFeed::nextFor(
      std::chrono::milliseconds timeout) {
    return receiver_.receiveFor(timeout);
  }

  void ConsensusFeed::acknowledge(FeedIndex index) {
    progress_.exclusiveAccess([&](Progress &progress) {
      while (not progress.unacked.empty()
             and progress.unacked.front().index <= index) {
        auto &front = progress.unacked.front();
        progress.unacked_rounds.erase(
            progress.unacked_rounds.find(front.round));
        progress.unacked.pop_front();
      }
    });
  }

  void ConsensusFeed::close() {
    receiver_.close();
  }

}  // namespace weave::primary
