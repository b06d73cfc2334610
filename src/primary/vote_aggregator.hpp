/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <utility>

#include "committee/committee.hpp"
#include "types/certificate.hpp"

namespace weave::primary {

  /**
   * Collects verified votes per (origin, round) until the stake behind one
   * header digest reaches quorum, then assembles its certificate once.
   * Not thread safe: owned by Core.
   */
  class VoteAggregator {
   public:
    enum class Status : uint8_t {
      /// counted, no quorum yet
      Pending,
      /// vote is known, or the slot is already certified
      Duplicate,
      /// the signer voted for another header of this slot before
      Equivocation,
      /// the slot belongs to an equivocating origin
      Excluded,
      /// the round is garbage collected
      Stale,
      /// this vote completed a certificate
      QuorumReached,
    };

    struct AppendResult {
      Status status;
      std::optional<Certificate> certificate{};
      /// First vote of the signer, for Status::Equivocation
      std::optional<Vote> previous{};
      /// The vote names a header digest other than the first seen digest
      bool conflicting_digest = false;
    };

    explicit VoteAggregator(CommitteePtr committee);

    /// Adds a vote whose signer, signature and epoch are already verified
    AppendResult append(const Vote &vote);

    /**
     * Supplies the header the local node voted for. Votes gathered for it
     * before it was known may complete a certificate right away.
     */
    std::optional<Certificate> addHeader(const Header &header);

    /// Stops certificate formation for an equivocating origin at the round
    void exclude(const AuthorityId &origin, Round round);

    /// Forgets votes of a slot certified by someone else
    void markCertified(const AuthorityId &origin, Round round);

    /// Drops every slot of rounds up to and including `gc_round`
    void collectGarbage(Round gc_round);

    /// Number of (origin, round) slots held
    [[nodiscard]] size_t size() const {
      return slots_.size();
    }

   private:
    struct Slot {
      std::map<AuthorityId, Vote> votes;
      std::map<Digest, Stake> stake;
      std::optional<Digest> first_digest;
      std::optional<Header> header;
      bool certified = false;
      bool excluded = false;
    };

    using SlotKey = std::pair<Round, AuthorityId>;

    std::optional<Certificate> tryAssemble(Slot &slot);

    CommitteePtr committee_;
    std::map<SlotKey, Slot> slots_;
    std::optional<Round> gc_round_;
  };

}  // namespace weave::primary
