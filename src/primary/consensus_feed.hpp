/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <deque>
#include <set>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/sequenced_certificate.hpp"
#include "utils/channel.hpp"
#include "utils/safe_object.hpp"

namespace weave::primary {

  /**
   * Delivers inserted certificates to the consensus stage in insertion
   * order, parents before children, and tracks the consumer's cumulative
   * acknowledgements. The acked round bounds garbage collection.
   *
   * push(), flush() and backlog() belong to the producing thread.
   */
  class ConsensusFeed {
   public:
    ConsensusFeed(qtils::SharedRef<log::LoggingSystem> logsys,
                  size_t capacity);

    /**
     * Sequences a certificate and hands it to the consumer. Never waits: when
     * the consumer is behind by `capacity` entries the certificate joins a
     * backlog that flush() moves on later, keeping the order. A backlogged
     * certificate already counts as unacknowledged.
     * @return false if the consumer closed the feed
     */
    bool push(std::shared_ptr<const Certificate> certificate);

    /**
     * Moves backlogged certificates to the consumer while it has room.
     * @return false if the consumer closed the feed
     */
    bool flush();

    /// Sequenced certificates not yet handed to the consumer
    [[nodiscard]] size_t backlog() const {
      return backlog_.size();
    }

    /// Round every certificate up to which was delivered and acknowledged
    void resetAckedRound(Round round);

    /**
     * Highest round below the oldest unacknowledged certificate, or the
     * highest delivered round when everything is acknowledged
     */
    [[nodiscard]] Round ackedRound() const;

    [[nodiscard]] size_t unacknowledged() const;

    // -- consumer side --

    std::optional<SequencedCertificate> next();

    std::optional<SequencedCertificate> nextFor(
        std::chrono::milliseconds timeout);

    /// Acknowledges every certificate with index up to `index`
    void acknowledge(FeedIndex index);

    void close();

   private:
    ConsensusFeed(qtils::SharedRef<log::LoggingSystem> logsys,
                  std::pair<Channel<SequencedCertificate>::Receiver,
                            Channel<SequencedCertificate>::Sender> channel);

    struct Pending {
      FeedIndex index;
      Round round;
    };

    struct Progress {
      FeedIndex next_index = 0;
      std::deque<Pending> unacked;
      std::multiset<Round> unacked_rounds;
      Round delivered_round = 0;
    };

    log::Logger logger_;
    Channel<SequencedCertificate>::Sender sender_;
    Channel<SequencedCertificate>::Receiver receiver_;
    utils::SafeObject<Progress> progress_;
    std::deque<SequencedCertificate> backlog_;
  };

}  // namespace weave::primary
