/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dag/dag.hpp"

namespace weave::dag {

  Dag::Dag(CommitteePtr committee) : committee_(std::move(committee)) {}

  bool Dag::insert(CertificatePtr certificate) {
    auto digest = certificate->digest();
    auto round = certificate->round();
    auto &slot = rounds_[round];
    auto [_, inserted] = slot.emplace(certificate->origin(), digest);
    if (not inserted) {
      return false;
    }
    auto &frontier = frontier_[certificate->origin()];
    frontier = std::max(frontier, round);
    vertices_.emplace(digest, std::move(certificate));
    return true;
  }

  bool Dag::contains(const Digest &digest) const {
    return vertices_.contains(digest);
  }

  CertificatePtr Dag::get(const Digest &digest) const {
    auto it = vertices_.find(digest);
    if (it == vertices_.end()) {
      return nullptr;
    }
    return it->second;
  }

  CertificatePtr Dag::at(const AuthorityId &author, Round round) const {
    auto round_it = rounds_.find(round);
    if (round_it == rounds_.end()) {
      return nullptr;
    }
    auto it = round_it->second.find(author);
    if (it == round_it->second.end()) {
      return nullptr;
    }
    return get(it->second);
  }

  std::vector<CertificatePtr> Dag::round(Round round) const {
    std::vector<CertificatePtr> certificates;
    auto it = rounds_.find(round);
    if (it != rounds_.end()) {
      for (auto &[_, digest] : it->second) {
        certificates.emplace_back(get(digest));
      }
    }
    return certificates;
  }

  std::vector<Digest> Dag::roundDigests(Round round) const {
    std::vector<Digest> digests;
    auto it = rounds_.find(round);
    if (it != rounds_.end()) {
      for (auto &[_, digest] : it->second) {
        digests.emplace_back(digest);
      }
    }
    return digests;
  }

  Stake Dag::roundStake(Round round) const {
    auto it = rounds_.find(round);
    if (it == rounds_.end()) {
      return 0;
    }
    Stake stake = 0;
    for (auto &[author, _] : it->second) {
      stake += committee_->stake(author);
    }
    return stake;
  }

  std::optional<Round> Dag::frontier(const AuthorityId &author) const {
    auto it = frontier_.find(author);
    if (it == frontier_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<Round> Dag::highestRound() const {
    if (rounds_.empty()) {
      return std::nullopt;
    }
    return rounds_.rbegin()->first;
  }

  size_t Dag::prune(Round gc_round) {
    size_t removed = 0;
    while (not rounds_.empty() and rounds_.begin()->first <= gc_round) {
      for (auto &[_, digest] : rounds_.begin()->second) {
        removed += vertices_.erase(digest);
      }
      rounds_.erase(rounds_.begin());
    }
    return removed;
  }

}  // namespace weave::dag
