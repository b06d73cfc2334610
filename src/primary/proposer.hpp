/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "committee/committee.hpp"
#include "dag/dag_store.hpp"
#include "log/logger.hpp"
#include "primary/digest_board.hpp"
#include "primary/messages.hpp"
#include "primary/parameters.hpp"
#include "utils/channel.hpp"
#include "utils/loop_thread.hpp"

namespace weave::primary {

  /**
   * @class Proposer
   * Turns batches on the digest board into one signed header per round.
   * A header is built once Core reports the parents of a new round, the
   * minimal delay has passed, and either enough batches are waiting or the
   * maximal delay has passed.
   *
   * Batches of an own header that stays uncertified two rounds later go
   * back on the board.
   */
  class Proposer {
   public:
    Proposer(qtils::SharedRef<log::LoggingSystem> logsys,
             Parameters params,
             CommitteePtr committee,
             crypto::ed25519::KeyPair keypair,
             qtils::SharedRef<DigestBoard> board,
             qtils::SharedRef<dag::DagStore> store,
             qtils::SharedRef<clock::SteadyClock> steady_clock,
             qtils::SharedRef<clock::SystemClock> system_clock,
             Channel<ProposerMessage>::Receiver inbox,
             Channel<CoreMessage>::Sender core,
             FatalHandler on_fatal);

    /**
     * Puts persisted pending batches back on the board and hands the last
     * own header to Core again.
     * @return false on a storage fault
     */
    bool recover();

    void start(std::shared_ptr<Watchdog> watchdog);

    void stop();

    void process(const ParentsReady &ready);

    /// Proposes when due
    void tick();

    [[nodiscard]] Round lastProposed() const {
      return last_proposed_;
    }

    [[nodiscard]] Round round() const {
      return round_;
    }

   private:
    using TimePoint = clock::SteadyClock::TimePoint;

    bool due(TimePoint now) const;

    void propose(TimePoint now);

    /// Returns batches of own headers not certified two rounds later
    void restoreUncertified();

    void fatal(std::string_view what, std::error_code error);

    log::Logger logger_;
    const Parameters params_;
    CommitteePtr committee_;
    const crypto::ed25519::KeyPair keypair_;
    const AuthorityId self_;
    qtils::SharedRef<DigestBoard> board_;
    qtils::SharedRef<dag::DagStore> store_;
    qtils::SharedRef<clock::SteadyClock> steady_clock_;
    qtils::SharedRef<clock::SystemClock> system_clock_;
    Channel<ProposerMessage>::Receiver inbox_;
    Channel<CoreMessage>::Sender core_;
    FatalHandler on_fatal_;

    Round round_ = kGenesisRound;
    std::vector<Digest> parents_;
    Round last_proposed_ = kGenesisRound;
    std::optional<TimePoint> last_proposal_;
    /// Batches of own headers by round, until certified or restored
    std::map<Round, std::vector<BatchInfo>> own_batches_;
    /// Own header recovered from the store, not yet handed to Core
    std::optional<Header> resend_;
    bool failed_ = false;

    utils::LoopThread loop_;
  };

}  // namespace weave::primary
