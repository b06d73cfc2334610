/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/vote_aggregator.hpp"

namespace weave::primary {

  VoteAggregator::VoteAggregator(CommitteePtr committee)
      : committee_(std::move(committee)) {}

  VoteAggregator::AppendResult VoteAggregator::append(const Vote &vote) {
    if (gc_round_.has_value() and vote.round <= gc_round_.value()) {
      return {.status = Status::Stale};
    }
    auto &slot = slots_[SlotKey{vote.round, vote.origin}];
    if (slot.certified) {
      return {.status = Status::Duplicate};
    }

    auto [it, inserted] = slot.votes.emplace(vote.author, vote);
    if (not inserted) {
      if (it->second.header_digest == vote.header_digest) {
        return {.status = Status::Duplicate};
      }
      return {.status = Status::Equivocation, .previous = it->second};
    }

    AppendResult result{.status = Status::Pending};
    if (not slot.first_digest.has_value()) {
      slot.first_digest = vote.header_digest;
    } else if (slot.first_digest.value() != vote.header_digest) {
      result.conflicting_digest = true;
    }
    if (slot.header.has_value()
        and slot.header->digest() != vote.header_digest) {
      result.conflicting_digest = true;
    }

    slot.stake[vote.header_digest] += committee_->stake(vote.author);
    if (slot.excluded) {
      result.status = Status::Excluded;
      return result;
    }
    if (auto certificate = tryAssemble(slot)) {
      result.status = Status::QuorumReached;
      result.certificate = std::move(certificate);
    }
    return result;
  }

  std::optional<Certificate> VoteAggregator::addHeader(const Header &header) {
    if (gc_round_.has_value() and header.round <= gc_round_.value()) {
      return std::nullopt;
    }
    auto &slot = slots_[SlotKey{header.round, header.author}];
    if (slot.certified or slot.excluded) {
      return std::nullopt;
    }
    if (not slot.header.has_value()) {
      slot.header = header;
      slot.header->updateDigest();
    }
    return tryAssemble(slot);
  }

  void VoteAggregator::exclude(const AuthorityId &origin, Round round) {
    auto &slot = slots_[SlotKey{round, origin}];
    slot.excluded = true;
    slot.votes.clear();
    slot.stake.clear();
  }

  void VoteAggregator::markCertified(const AuthorityId &origin, Round round) {
    if (gc_round_.has_value() and round <= gc_round_.value()) {
      return;
    }
    auto &slot = slots_[SlotKey{round, origin}];
    slot = Slot{.certified = true};
  }

  void VoteAggregator::collectGarbage(Round gc_round) {
    gc_round_ = gc_round;
    AuthorityId last_id;
    last_id.fill(0xff);
    slots_.erase(slots_.begin(), slots_.upper_bound(SlotKey{gc_round, last_id}));
  }

  std::optional<Certificate> VoteAggregator::tryAssemble(Slot &slot) {
    if (not slot.header.has_value()) {
      return std::nullopt;
    }
    auto digest = slot.header->digest();
    auto stake_it = slot.stake.find(digest);
    if (stake_it == slot.stake.end()
        or stake_it->second < committee_->quorumThreshold()) {
      return std::nullopt;
    }

    Certificate certificate;
    certificate.header = std::move(slot.header.value());
    // votes are keyed by signer, so signers come out sorted and distinct
    for (auto &[signer, vote] : slot.votes) {
      if (vote.header_digest == digest) {
        certificate.signers.push_back(signer);
        certificate.signatures.push_back(vote.signature);
      }
    }
    slot = Slot{.certified = true};
    return certificate;
  }

}  // namespace weave::primary
