/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/in_process_network.hpp"

#include <fmt/format.h>
#include <soralog/util.hpp>

#include "network/codec.hpp"

namespace weave::network {

  class InProcessNetwork::Endpoint : public PeerNetwork {
   public:
    Endpoint(std::weak_ptr<InProcessNetwork> network, AuthorityId self)
        : network_(std::move(network)), self_(self) {}

    const AuthorityId &self() const override {
      return self_;
    }

    void send(const AuthorityId &to, const Message &message) override {
      if (auto network = network_.lock()) {
        network->deliver(self_, to, message);
      }
    }

    void broadcast(const Message &message) override {
      auto network = network_.lock();
      if (not network) {
        return;
      }
      for (auto &authority : network->committee_->authorities()) {
        if (authority.id != self_) {
          network->deliver(self_, authority.id, message);
        }
      }
    }

    void setHandler(Handler handler) override {
      handler_.exclusiveAccess(
          [&](Handler &current) { current = std::move(handler); });
    }

    /// @return false if no handler is installed
    bool handle(Envelope envelope) {
      auto handler = handler_.sharedAccess(
          [](const Handler &handler) { return handler; });
      if (not handler) {
        return false;
      }
      handler(std::move(envelope));
      return true;
    }

   private:
    std::weak_ptr<InProcessNetwork> network_;
    AuthorityId self_;
    utils::SafeObject<Handler> handler_;
  };

  InProcessNetwork::InProcessNetwork(
      qtils::SharedRef<log::LoggingSystem> logsys,
      CommitteePtr committee,
      size_t link_capacity,
      std::chrono::milliseconds send_timeout)
      : logger_(logsys->getLogger("InProcessNetwork", "network")),
        committee_(std::move(committee)),
        link_capacity_(link_capacity),
        send_timeout_(send_timeout) {}

  InProcessNetwork::~InProcessNetwork() {
    stop();
  }

  std::shared_ptr<PeerNetwork> InProcessNetwork::join(const AuthorityId &self) {
    return endpoints_.exclusiveAccess([&](auto &endpoints) {
      auto &endpoint = endpoints[self];
      if (not endpoint) {
        endpoint = std::make_shared<Endpoint>(weak_from_this(), self);
        SL_DEBUG(logger_, "{} joined", committee_->nameOf(self));
      }
      return endpoint;
    });
  }

  void InProcessNetwork::setFilter(Filter filter) {
    filter_.exclusiveAccess(
        [&](Filter &current) { current = std::move(filter); });
  }

  void InProcessNetwork::stop() {
    std::map<LinkKey, Link> links;
    {
      std::lock_guard lock(links_mutex_);
      if (stopped_.exchange(true)) {
        return;
      }
      links.swap(links_);
    }
    for (auto &[_, link] : links) {
      // the delivery thread drains the link and exits once senders are gone
      link.sender.reset();
    }
    for (auto &[_, link] : links) {
      if (link.thread.joinable()) {
        link.thread.join();
      }
    }
    SL_DEBUG(logger_, "Stopped, {} messages dropped", dropped_.load());
  }

  void InProcessNetwork::deliver(const AuthorityId &from,
                                 const AuthorityId &to,
                                 const Message &message) {
    if (stopped_) {
      return;
    }
    auto pass = filter_.sharedAccess([&](const Filter &filter) {
      return not filter or filter(from, to, message);
    });
    if (not pass) {
      SL_TRACE(logger_,
               "Filtered message #{} from {} to {}",
               message.index(),
               committee_->nameOf(from),
               committee_->nameOf(to));
      return;
    }
    auto link = linkFor(from, to);
    if (not link.has_value()) {
      return;
    }
    auto frame = encodeMessage(message);
    auto status = link->sendFor(frame, send_timeout_);
    // headers, votes and certificates wait for room, fetch traffic may drop
    if (status == SendStatus::Timeout and isConsensusTraffic(message)) {
      SL_WARN(logger_,
              "Link {} -> {} is full, message #{} waits",
              committee_->nameOf(from),
              committee_->nameOf(to),
              message.index());
      while (status == SendStatus::Timeout and not stopped_) {
        status = link->sendFor(frame, send_timeout_);
      }
    }
    if (status != SendStatus::Sent) {
      ++dropped_;
      SL_WARN(logger_,
              "Link {} -> {} is {}, message #{} dropped",
              committee_->nameOf(from),
              committee_->nameOf(to),
              status == SendStatus::Closed ? "closed" : "full",
              message.index());
    }
  }

  bool InProcessNetwork::isConsensusTraffic(const Message &message) {
    return std::holds_alternative<SendHeader>(message)
        or std::holds_alternative<SendVote>(message)
        or std::holds_alternative<SendCertificate>(message);
  }

  std::optional<Channel<qtils::ByteVec>::Sender> InProcessNetwork::linkFor(
      const AuthorityId &from, const AuthorityId &to) {
    std::lock_guard lock(links_mutex_);
    if (stopped_) {
      return std::nullopt;
    }
    auto it = links_.find(LinkKey{from, to});
    if (it != links_.end()) {
      return it->second.sender;
    }
    auto [receiver, sender] =
        Channel<qtils::ByteVec>::create_channel(link_capacity_);
    Link link{.sender = std::move(sender)};
    link.thread = std::thread(
        [this, from, to, receiver{std::move(receiver)}]() mutable {
          runLink(from, to, std::move(receiver));
        });
    return links_.emplace(LinkKey{from, to}, std::move(link))
        .first->second.sender;
  }

  void InProcessNetwork::runLink(AuthorityId from,
                                 AuthorityId to,
                                 Channel<qtils::ByteVec>::Receiver receiver) {
    soralog::util::setThreadName(fmt::format("link.{}", committee_->nameOf(to)));
    while (auto frame = receiver.receive()) {
      auto message = decodeMessage(frame.value());
      if (message.has_error()) {
        SL_WARN(logger_,
                "Undecodable frame from {}: {}",
                committee_->nameOf(from),
                message.error());
        continue;
      }
      auto endpoint = endpointOf(to);
      if (not endpoint
          or not endpoint->handle(Envelope{
              .from = from,
              .message = std::move(message.value()),
          })) {
        ++dropped_;
        SL_DEBUG(logger_,
                 "{} is not listening, message dropped",
                 committee_->nameOf(to));
      }
    }
  }

  std::shared_ptr<InProcessNetwork::Endpoint> InProcessNetwork::endpointOf(
      const AuthorityId &id) const {
    return endpoints_.sharedAccess(
        [&](const auto &endpoints) -> std::shared_ptr<Endpoint> {
          auto it = endpoints.find(id);
          if (it == endpoints.end()) {
            return nullptr;
          }
          return it->second;
        });
  }

}  // namespace weave::network
