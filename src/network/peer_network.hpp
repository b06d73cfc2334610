/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "network/messages.hpp"

namespace weave::network {

  /**
   * Authenticated links of one authority to the other committee members.
   * Sends are best effort and never block the caller for long.
   */
  class PeerNetwork {
   public:
    using Handler = std::function<void(Envelope)>;

    virtual ~PeerNetwork() = default;

    /// Authority this endpoint sends as
    [[nodiscard]] virtual const AuthorityId &self() const = 0;

    virtual void send(const AuthorityId &to, const Message &message) = 0;

    /// Sends to every committee member but self
    virtual void broadcast(const Message &message) = 0;

    /// Receives inbound messages, called from transport threads
    virtual void setHandler(Handler handler) = 0;
  };

}  // namespace weave::network
