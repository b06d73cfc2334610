/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/types.hpp"

namespace YAML {
  class Node;
}

namespace weave {

  struct Authority {
    AuthorityId id;
    Stake stake = 0;
    /// Human readable label, used in logs only
    std::string name;
  };

  enum class CommitteeError : uint8_t {
    EMPTY = 1,
    DUPLICATE_AUTHORITY,
    ZERO_STAKE,
    STAKE_OVERFLOW,
    TOO_LARGE,
  };
  Q_ENUM_ERROR_CODE(CommitteeError) {
    using E = decltype(e);
    switch (e) {
      case E::EMPTY:
        return "Committee has no authorities";
      case E::DUPLICATE_AUTHORITY:
        return "Authority listed twice in committee";
      case E::ZERO_STAKE:
        return "Authority has zero stake";
      case E::STAKE_OVERFLOW:
        return "Total committee stake overflows";
      case E::TOO_LARGE:
        return "Committee is larger than supported";
    }
    abort();
  }

  /**
   * Authorities of one epoch with their stake. Immutable once built; every
   * component receives the same shared instance.
   */
  class Committee {
   public:
    static outcome::result<Committee> make(Epoch epoch,
                                           std::vector<Authority> authorities);

    Epoch epoch() const {
      return epoch_;
    }

    size_t size() const {
      return authorities_.size();
    }

    Stake totalStake() const {
      return total_stake_;
    }

    /// Smallest stake strictly above two thirds of the total
    Stake quorumThreshold() const {
      return 2 * total_stake_ / 3 + 1;
    }

    /// Smallest stake guaranteed to include an honest authority
    Stake validityThreshold() const {
      return (total_stake_ + 2) / 3;
    }

    /// Stake of the authority, 0 for non-members
    Stake stake(const AuthorityId &id) const;

    bool contains(const AuthorityId &id) const {
      return find(id) != nullptr;
    }

    const Authority *find(const AuthorityId &id) const;

    /// Position in authorities(), which are sorted by id
    std::optional<size_t> indexOf(const AuthorityId &id) const;

    const std::vector<Authority> &authorities() const {
      return authorities_;
    }

    /// Display name of the authority, or a short hex id for non-members
    std::string nameOf(const AuthorityId &id) const;

    /// Sum of stake of the given distinct authorities
    template <typename Range>
    Stake stakeOf(const Range &ids) const {
      Stake sum = 0;
      for (const AuthorityId &id : ids) {
        sum += stake(id);
      }
      return sum;
    }

   private:
    Committee(Epoch epoch, std::vector<Authority> authorities, Stake total);

    Epoch epoch_;
    std::vector<Authority> authorities_;
    Stake total_stake_;
  };

  using CommitteePtr = std::shared_ptr<const Committee>;

  /**
   * Reads a committee file:
   * ```yaml
   * epoch: 0
   * authorities:
   *   - name: alice
   *     public-key: 0x...
   *     stake: 1
   * ```
   * Throws std::runtime_error describing the first problem found.
   */
  Committee loadCommittee(const std::filesystem::path &path);

  YAML::Node committeeToYaml(const Committee &committee);

}  // namespace weave
