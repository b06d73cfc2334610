/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <set>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "committee/committee.hpp"
#include "log/logger.hpp"
#include "types/certificate.hpp"
#include "utils/safe_object.hpp"

namespace weave::primary {

  /// Two signed artifacts of one author for one round that cannot both be
  /// honest
  struct Evidence {
    enum class Kind : uint8_t {
      /// two headers of the author for the round
      Headers,
      /// two votes of the author for different headers of one origin
      Votes,
      /// two certificates of the author for the round
      Certificates,
    };

    using Proof = std::variant<std::pair<Header, Header>,
                               std::pair<Vote, Vote>,
                               std::pair<Certificate, Certificate>>;

    Kind kind;
    /// Equivocating authority
    AuthorityId author;
    Round round;
    Proof proof;

    static Evidence headers(Header first, Header second);
    static Evidence votes(Vote first, Vote second);
    static Evidence certificates(Certificate first, Certificate second);
  };

  /**
   * Bounded log of equivocation evidence, at most one entry per
   * (kind, author, round); the oldest entries leave first.
   */
  class EvidenceLog {
   public:
    EvidenceLog(qtils::SharedRef<log::LoggingSystem> logsys,
                CommitteePtr committee,
                size_t capacity = 4096);

    /// @return false if evidence of this kind for (author, round) is known
    bool record(Evidence evidence);

    [[nodiscard]] std::vector<Evidence> forAuthor(
        const AuthorityId &author) const;

    [[nodiscard]] bool has(const AuthorityId &author, Round round) const;

    [[nodiscard]] size_t size() const;

   private:
    using Key = std::tuple<Evidence::Kind, AuthorityId, Round>;

    struct Entries {
      std::deque<Evidence> log;
      std::set<Key> keys;
    };

    log::Logger logger_;
    CommitteePtr committee_;
    const size_t capacity_;
    utils::SafeObject<Entries> entries_;
  };

}  // namespace weave::primary
