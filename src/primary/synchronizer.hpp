/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <random>
#include <unordered_map>

#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "committee/committee.hpp"
#include "dag/dag_store.hpp"
#include "log/logger.hpp"
#include "network/peer_network.hpp"
#include "primary/messages.hpp"
#include "primary/parameters.hpp"
#include "utils/channel.hpp"
#include "utils/loop_thread.hpp"

namespace weave::primary {

  /**
   * Fetches missing certificates and headers for Core and serves fetch
   * requests of peers.
   *
   * Requests for one digest are coalesced. Every attempt asks up to
   * `retry_nodes` peers: the preferred one, then peers hinted to have the
   * digest, then the rest of the committee in rotation. Attempts are spaced
   * by exponential backoff with jitter. After `max_attempts` attempts or
   * `deadline` the digest is reported to Core as unavailable.
   */
  class Synchronizer {
   public:
    Synchronizer(qtils::SharedRef<log::LoggingSystem> logsys,
                 SyncParameters params,
                 CommitteePtr committee,
                 qtils::SharedRef<dag::DagStore> store,
                 qtils::SharedRef<network::PeerNetwork> network,
                 qtils::SharedRef<clock::SteadyClock> clock,
                 Channel<SynchronizerMessage>::Receiver inbox,
                 Channel<CoreMessage>::Sender core,
                 FatalHandler on_fatal,
                 uint64_t seed = std::random_device{}());

    void start(std::shared_ptr<Watchdog> watchdog,
               std::chrono::milliseconds tick_interval);

    void stop();

    /// Handles one inbox message, nothing after a storage fault
    void process(SynchronizerMessage message);

    /// Sends due attempts, expires requests and reports exhausted digests
    void tick();

    [[nodiscard]] bool failed() const {
      return failed_;
    }

    /// Digests being fetched
    [[nodiscard]] size_t inflight() const {
      return inflight_.size();
    }

   private:
    using Key = std::pair<FetchKind, Digest>;
    using TimePoint = clock::SteadyClock::TimePoint;

    struct Inflight {
      /// Ask order, see class description
      std::vector<AuthorityId> peers;
      size_t cursor = 0;
      uint32_t attempts = 0;
      /// Requests sent and not answered
      size_t outstanding = 0;
      TimePoint started;
      TimePoint next_attempt;
    };

    struct Request {
      AuthorityId peer;
      FetchKind kind;
      std::vector<Digest> digests;
      TimePoint deadline;
    };

    void onFetchRequest(FetchRequest request);

    void onEnvelope(network::Envelope envelope);

    void serve(const AuthorityId &from,
               const network::FetchCertificatesRequest &request);

    void serve(const AuthorityId &from,
               const network::FetchHeadersRequest &request);

    void onResponse(const AuthorityId &from,
                    uint64_t request_id,
                    FetchKind kind,
                    const std::vector<Digest> &delivered);

    /// Peers for a new fetch: preferred, hints, then the others rotated
    std::vector<AuthorityId> askOrder(
        const std::optional<AuthorityId> &preferred,
        const std::vector<AuthorityId> &hints);

    std::chrono::milliseconds backoff(uint32_t attempts);

    void reportUnavailable(const Key &key);

    void send(const AuthorityId &peer,
              FetchKind kind,
              std::vector<Digest> digests,
              TimePoint now);

    /// Reports a storage fault; the synchronizer goes idle afterwards
    void fatal(std::string_view what, std::error_code error);

    log::Logger logger_;
    const SyncParameters params_;
    CommitteePtr committee_;
    qtils::SharedRef<dag::DagStore> store_;
    qtils::SharedRef<network::PeerNetwork> network_;
    qtils::SharedRef<clock::SteadyClock> clock_;
    Channel<SynchronizerMessage>::Receiver inbox_;
    Channel<CoreMessage>::Sender core_;
    FatalHandler on_fatal_;

    std::default_random_engine random_;
    size_t rotation_ = 0;
    uint64_t next_request_id_ = 1;
    std::map<Key, Inflight> inflight_;
    std::unordered_map<uint64_t, Request> requests_;
    bool failed_ = false;

    utils::LoopThread loop_;
  };

}  // namespace weave::primary
