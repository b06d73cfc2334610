/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/evidence_log.hpp"

namespace weave::primary {

  namespace {
    std::string_view kindName(Evidence::Kind kind) {
      switch (kind) {
        case Evidence::Kind::Headers:
          return "headers";
        case Evidence::Kind::Votes:
          return "votes";
        case Evidence::Kind::Certificates:
          return "certificates";
      }
      return "unknown";
    }
  }  // namespace

  Evidence Evidence::headers(Header first, Header second) {
    auto author = first.author;
    auto round = first.round;
    return Evidence{
        .kind = Kind::Headers,
        .author = author,
        .round = round,
        .proof = std::make_pair(std::move(first), std::move(second)),
    };
  }

  Evidence Evidence::votes(Vote first, Vote second) {
    auto author = first.author;
    auto round = first.round;
    return Evidence{
        .kind = Kind::Votes,
        .author = author,
        .round = round,
        .proof = std::make_pair(std::move(first), std::move(second)),
    };
  }

  Evidence Evidence::certificates(Certificate first, Certificate second) {
    auto author = first.origin();
    auto round = first.round();
    return Evidence{
        .kind = Kind::Certificates,
        .author = author,
        .round = round,
        .proof = std::make_pair(std::move(first), std::move(second)),
    };
  }

  EvidenceLog::EvidenceLog(qtils::SharedRef<log::LoggingSystem> logsys,
                           CommitteePtr committee,
                           size_t capacity)
      : logger_(logsys->getLogger("Evidence", "core")),
        committee_(std::move(committee)),
        capacity_(capacity == 0 ? 1 : capacity) {}

  bool EvidenceLog::record(Evidence evidence) {
    auto kind = evidence.kind;
    auto author = evidence.author;
    auto round = evidence.round;
    auto recorded = entries_.exclusiveAccess([&](Entries &entries) {
      Key key{kind, author, round};
      if (not entries.keys.insert(key).second) {
        return false;
      }
      if (entries.log.size() >= capacity_) {
        auto &oldest = entries.log.front();
        entries.keys.erase(Key{oldest.kind, oldest.author, oldest.round});
        entries.log.pop_front();
      }
      entries.log.emplace_back(std::move(evidence));
      return true;
    });
    if (recorded) {
      SL_WARN(logger_,
              "Equivocation of {} at round {}: conflicting {}",
              committee_->nameOf(author),
              round,
              kindName(kind));
    }
    return recorded;
  }

  std::vector<Evidence> EvidenceLog::forAuthor(
      const AuthorityId &author) const {
    return entries_.sharedAccess([&](const Entries &entries) {
      std::vector<Evidence> found;
      for (auto &evidence : entries.log) {
        if (evidence.author == author) {
          found.emplace_back(evidence);
        }
      }
      return found;
    });
  }

  bool EvidenceLog::has(const AuthorityId &author, Round round) const {
    return entries_.sharedAccess([&](const Entries &entries) {
      for (auto kind : {Evidence::Kind::Headers,
                        Evidence::Kind::Votes,
                        Evidence::Kind::Certificates}) {
        if (entries.keys.contains(Key{kind, author, round})) {
          return true;
        }
      }
      return false;
    });
  }

  size_t EvidenceLog::size() const {
    return entries_.sharedAccess(
        [](const Entries &entries) { return entries.log.size(); });
  }

}  // namespace weave::primary
