/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>
#include <tuple>
#include <unordered_map>
#include <variant>

#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "committee/committee.hpp"
#include "dag/dag.hpp"
#include "dag/dag_store.hpp"
#include "log/logger.hpp"
#include "network/peer_network.hpp"
#include "primary/consensus_feed.hpp"
#include "primary/evidence_log.hpp"
#include "primary/messages.hpp"
#include "primary/parameters.hpp"
#include "primary/vote_aggregator.hpp"
#include "utils/channel.hpp"
#include "utils/loop_thread.hpp"
#include "utils/safe_object.hpp"

namespace weave::primary {

  /// How Core disposed of an inbound header, vote or certificate
  enum class Outcome : uint8_t {
    Accepted,
    /// already processed, no state change
    Duplicate,
    /// waits for missing parents
    Suspended,
    /// never acceptable
    RejectedPermanent,
    /// may be acceptable when delivered again later
    RejectedTransient,
  };

  enum class Reason : uint8_t {
    None,
    WrongEpoch,
    UnknownAuthority,
    BadSignature,
    Malformed,
    GenesisRound,
    Stale,
    TooFarAhead,
    Equivocation,
    VotedLaterRound,
    MissingParents,
    WrongParentRound,
    ParentsBelowQuorum,
    QuorumNotReached,
    ConflictingCertificate,
    AlreadyCertified,
    AlreadyVoted,
    AlreadySuspended,
    PendingFull,
    /// storage or signing fault of this node
    LocalFault,
  };

  std::string_view toString(Outcome outcome);
  std::string_view toString(Reason reason);

  struct HandleResult {
    Outcome outcome;
    Reason reason = Reason::None;

    bool operator==(const HandleResult &) const = default;
  };

  /// Read-only view of Core state, safe to take from any thread
  struct CoreSnapshot {
    Round round = kGenesisRound;
    Round gc_round = kGenesisRound;
    size_t dag_size = 0;
    size_t suspended = 0;
    /// Highest certified round per authority
    std::unordered_map<AuthorityId, Round> frontier;
  };

  /**
   * @class Core
   * The protocol state machine of a primary and the only writer of DAG
   * state. Validates headers and votes for them, aggregates votes into
   * certificates, validates certificates and inserts them into the DAG once
   * their parents are present, advances the round and collects garbage.
   *
   * Runs on a single thread fed by its inbox. Handlers never throw on
   * input: every inbound item gets a HandleResult.
   */
  class Core {
   public:
    Core(qtils::SharedRef<log::LoggingSystem> logsys,
         Parameters params,
         CommitteePtr committee,
         crypto::ed25519::KeyPair keypair,
         qtils::SharedRef<dag::DagStore> store,
         qtils::SharedRef<network::PeerNetwork> network,
         qtils::SharedRef<ConsensusFeed> feed,
         qtils::SharedRef<EvidenceLog> evidence,
         qtils::SharedRef<clock::SteadyClock> clock,
         Channel<CoreMessage>::Receiver inbox,
         Channel<SynchronizerMessage>::Sender synchronizer,
         Channel<ProposerMessage>::Sender proposer,
         FatalHandler on_fatal);

    /**
     * Rebuilds round, DAG and vote records from the store. Certificates above
     * the acknowledged round are queued for delivery again.
     * @return false on a storage fault
     */
    bool recover();

    void start(std::shared_ptr<Watchdog> watchdog);

    void stop();

    /// Handles one inbox message and everything it unblocks
    void process(CoreMessage message);

    /// Periodic duties: retries, suspension deadlines, GC, stall alert
    void tick();

    HandleResult handleHeader(const Header &header, const AuthorityId &from);

    HandleResult handleVote(const Vote &vote);

    HandleResult handleCertificate(const Certificate &certificate,
                                   const AuthorityId &from);

    [[nodiscard]] CoreSnapshot snapshot() const;

    // -- accessors for the owning thread --

    [[nodiscard]] Round round() const {
      return round_;
    }

    [[nodiscard]] Round gcRound() const {
      return gc_round_;
    }

    [[nodiscard]] const dag::Dag &dag() const {
      return dag_;
    }

    [[nodiscard]] size_t suspended() const {
      return suspended_.size();
    }

    [[nodiscard]] const AuthorityId &self() const {
      return self_;
    }

   private:
    using TimePoint = clock::SteadyClock::TimePoint;
    using SlotKey = std::pair<Round, AuthorityId>;

    struct Suspended {
      std::variant<Header, Certificate> vertex;
      AuthorityId from;
      Round round;
      AuthorityId author;
      std::set<Digest> missing;
      TimePoint deadline;
    };

    /// Suspended vertices ready to be handled again, in (round, author) order
    using ReadyKey = std::tuple<Round, AuthorityId, Digest>;

    void onEnvelope(network::Envelope envelope);

    void onOwnHeader(const Header &header);

    void onFetchedCertificates(FetchedCertificates fetched);

    void onFetchedHeaders(const FetchedHeaders &fetched);

    void logResult(std::string_view what,
                   const Header &header,
                   const HandleResult &result) const;

    void onUnavailable(const FetchUnavailable &unavailable);

    /// Checks that need no DAG state: epoch, membership, shape, signature
    Reason validateHeader(const Header &header) const;

    Reason validateSigners(const Certificate &certificate,
                           const Digest &digest) const;

    /// Parent round and stake, for parents all present in the DAG
    Reason validateParents(const Header &header) const;

    std::vector<Digest> missingParents(const Header &header) const;

    /// True for rounds already garbage collected
    bool evicted(Round round) const;

    /// Header this node knows for the slot, from the DAG or the store
    std::optional<Header> knownHeader(const SlotKey &slot);

    HandleResult flagEquivocation(Evidence evidence);

    std::optional<Vote> makeVote(const Header &header);

    /// Sends our vote for an already voted header once more
    void repeatVote(const Header &header, const AuthorityId &to);

    void onCertificateFormed(Certificate certificate);

    /// Persists, indexes and delivers a validated certificate
    bool insertCertificate(Certificate certificate);

    HandleResult suspend(std::variant<Header, Certificate> vertex,
                         const Digest &key,
                         const AuthorityId &from,
                         std::vector<Digest> missing,
                         Reason reason);

    /// Drops a suspended vertex and everything waiting for it
    void dropSuspended(const Digest &key, std::string_view why);

    void resolveWaiters(const Digest &digest);

    void drainReady();

    void requestFetch(FetchKind kind,
                      std::vector<Digest> digests,
                      const AuthorityId &origin,
                      const AuthorityId &from);

    void tryAdvanceRound();

    void updateParents();

    void collectGarbage();

    void flushOutbox();

    void redeliver();

    void publishSnapshot();

    /// Reports a storage fault; Core stops handling input afterwards
    void fatal(std::string_view what, std::error_code error);

    log::Logger logger_;
    const Parameters params_;
    CommitteePtr committee_;
    const crypto::ed25519::KeyPair keypair_;
    const AuthorityId self_;
    qtils::SharedRef<dag::DagStore> store_;
    qtils::SharedRef<network::PeerNetwork> network_;
    qtils::SharedRef<ConsensusFeed> feed_;
    qtils::SharedRef<EvidenceLog> evidence_;
    qtils::SharedRef<clock::SteadyClock> clock_;
    Channel<CoreMessage>::Receiver inbox_;
    Channel<SynchronizerMessage>::Sender synchronizer_;
    Channel<ProposerMessage>::Sender proposer_;
    FatalHandler on_fatal_;

    Round round_ = kGenesisRound;
    Round gc_round_ = kGenesisRound;
    Round persisted_acked_round_ = kGenesisRound;
    bool failed_ = false;
    bool draining_ = false;

    dag::Dag dag_;
    VoteAggregator aggregator_;
    std::set<Digest> genesis_;

    /// Header digest voted for, per (round, origin)
    std::map<SlotKey, Digest> voted_;
    /// Round of the last vote per origin
    std::unordered_map<AuthorityId, Round> last_voted_;
    /// Slots of origins caught equivocating
    std::set<SlotKey> excluded_;
    /// Headers fetched as equivocation candidates
    std::map<SlotKey, Header> fetched_headers_;

    std::map<Digest, Suspended> suspended_;
    std::unordered_map<Digest, std::set<Digest>> waiters_;
    std::set<ReadyKey> ready_;

    std::vector<FetchRequest> pending_fetches_;
    std::optional<ParentsReady> pending_parents_;
    std::vector<dag::CertificatePtr> redelivery_;

    TimePoint last_tick_;
    TimePoint last_advance_;
    TimePoint last_stall_alert_;

    utils::SafeObject<CoreSnapshot> snapshot_;
    utils::LoopThread loop_;
  };

}  // namespace weave::primary
