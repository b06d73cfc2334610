/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <memory>
#include <thread>
#include <unordered_map>

#include <qtils/byte_vec.hpp>
#include <qtils/shared_ref.hpp>

#include "committee/committee.hpp"
#include "log/logger.hpp"
#include "network/peer_network.hpp"
#include "utils/channel.hpp"
#include "utils/safe_object.hpp"

namespace weave::network {

  /**
   * Links primaries running in one process. Every message is encoded on
   * send and decoded on delivery, like on a real wire. Each ordered pair of
   * authorities gets a bounded queue with its own delivery thread.
   * Headers, votes and certificates wait on a full queue until it has room
   * or the network stops. Fetch requests and responses give up after the
   * send timeout and count as dropped.
   */
  class InProcessNetwork
      : public std::enable_shared_from_this<InProcessNetwork> {
   public:
    /// Returns false to drop the message
    using Filter = std::function<bool(
        const AuthorityId &from, const AuthorityId &to, const Message &)>;

    InProcessNetwork(qtils::SharedRef<log::LoggingSystem> logsys,
                     CommitteePtr committee,
                     size_t link_capacity = 1024,
                     std::chrono::milliseconds send_timeout =
                         std::chrono::seconds{1});

    ~InProcessNetwork();

    /// Endpoint of the authority, created once
    std::shared_ptr<PeerNetwork> join(const AuthorityId &self);

    void setFilter(Filter filter);

    /// Closes every link and joins delivery threads
    void stop();

    /// Messages dropped because a link stayed full or the peer is absent.
    /// Only fetch traffic is dropped for a full link.
    [[nodiscard]] size_t dropped() const {
      return dropped_;
    }

   private:
    class Endpoint;

    struct Link {
      std::optional<Channel<qtils::ByteVec>::Sender> sender;
      std::thread thread;
    };

    using LinkKey = std::pair<AuthorityId, AuthorityId>;

    void deliver(const AuthorityId &from,
                 const AuthorityId &to,
                 const Message &message);

    static bool isConsensusTraffic(const Message &message);

    std::optional<Channel<qtils::ByteVec>::Sender> linkFor(
        const AuthorityId &from, const AuthorityId &to);

    void runLink(AuthorityId from,
                 AuthorityId to,
                 Channel<qtils::ByteVec>::Receiver receiver);

    std::shared_ptr<Endpoint> endpointOf(const AuthorityId &id) const;

    log::Logger logger_;
    CommitteePtr committee_;
    const size_t link_capacity_;
    const std::chrono::milliseconds send_timeout_;

    utils::SafeObject<std::unordered_map<AuthorityId, std::shared_ptr<Endpoint>>>
        endpoints_;
    std::mutex links_mutex_;
    std::map<LinkKey, Link> links_;
    utils::SafeObject<Filter> filter_;
    std::atomic_bool stopped_ = false;
    std::atomic_size_t dropped_ = 0;
  };

}  // namespace weave::network
