/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "committee/committee.hpp"

#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <qtils/unhex.hpp>
#include <yaml-cpp/yaml.h>

#include "types/constants.hpp"

namespace weave {

  Committee::Committee(Epoch epoch,
                       std::vector<Authority> authorities,
                       Stake total)
      : epoch_(epoch),
        authorities_(std::move(authorities)),
        total_stake_(total) {}

  outcome::result<Committee> Committee::make(
      Epoch epoch, std::vector<Authority> authorities) {
    if (authorities.empty()) {
      return CommitteeError::EMPTY;
    }
    if (authorities.size() > kMaxCommitteeSize) {
      return CommitteeError::TOO_LARGE;
    }
    std::ranges::sort(authorities, std::less{}, &Authority::id);
    Stake total = 0;
    for (size_t i = 0; i < authorities.size(); ++i) {
      auto &authority = authorities[i];
      if (i > 0 and authorities[i - 1].id == authority.id) {
        return CommitteeError::DUPLICATE_AUTHORITY;
      }
      if (authority.stake == 0) {
        return CommitteeError::ZERO_STAKE;
      }
      // thresholds multiply the total by 2
      if (authority.stake > std::numeric_limits<Stake>::max() / 4 - total) {
        return CommitteeError::STAKE_OVERFLOW;
      }
      total += authority.stake;
    }
    return Committee{epoch, std::move(authorities), total};
  }

  const Authority *Committee::find(const AuthorityId &id) const {
    auto it =
        std::ranges::lower_bound(authorities_, id, std::less{}, &Authority::id);
    if (it == authorities_.end() or it->id != id) {
      return nullptr;
    }
    return &*it;
  }

  std::optional<size_t> Committee::indexOf(const AuthorityId &id) const {
    if (auto authority = find(id)) {
      return static_cast<size_t>(authority - authorities_.data());
    }
    return std::nullopt;
  }

  Stake Committee::stake(const AuthorityId &id) const {
    auto authority = find(id);
    return authority ? authority->stake : 0;
  }

  std::string Committee::nameOf(const AuthorityId &id) const {
    auto authority = find(id);
    if (authority and not authority->name.empty()) {
      return authority->name;
    }
    return fmt::format("{:0x}", id);
  }

  Committee loadCommittee(const std::filesystem::path &path) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const std::exception &e) {
      throw std::runtime_error(fmt::format(
          "Failed to load committee '{}': {}", path.string(), e.what()));
    }

    if (not root.IsMap()) {
      throw std::runtime_error(
          fmt::format("Committee '{}' must be a YAML map", path.string()));
    }

    Epoch epoch = 0;
    if (auto epoch_node = root["epoch"]; epoch_node.IsDefined()) {
      epoch = epoch_node.as<Epoch>();
    }

    auto list = root["authorities"];
    if (not list.IsSequence()) {
      throw std::runtime_error(fmt::format(
          "Committee '{}' must have an 'authorities' sequence", path.string()));
    }

    std::vector<Authority> authorities;
    for (const auto &entry : list) {
      if (not entry.IsMap()) {
        throw std::runtime_error(fmt::format(
            "Committee '{}' has an authority which is not a map",
            path.string()));
      }
      Authority authority;
      if (auto name = entry["name"]; name.IsScalar()) {
        authority.name = name.as<std::string>();
      }
      auto key = entry["public-key"];
      if (not key.IsScalar()) {
        throw std::runtime_error(
            fmt::format("Authority '{}' in committee '{}' has no public-key",
                        authority.name,
                        path.string()));
      }
      if (not qtils::unhex0x(authority.id, key.as<std::string>(), true)
                  .has_value()) {
        throw std::runtime_error(
            fmt::format("Authority '{}' in committee '{}' has invalid "
                        "public-key '{}'",
                        authority.name,
                        path.string(),
                        key.as<std::string>()));
      }
      auto stake = entry["stake"];
      authority.stake = stake.IsDefined() ? stake.as<Stake>() : 1;
      authorities.emplace_back(std::move(authority));
    }

    auto committee = Committee::make(epoch, std::move(authorities));
    if (committee.has_error()) {
      throw std::runtime_error(fmt::format("Committee '{}' is invalid: {}",
                                           path.string(),
                                           committee.error().message()));
    }
    return std::move(committee.value());
  }

  YAML::Node committeeToYaml(const Committee &committee) {
    YAML::Node root;
    root["epoch"] = committee.epoch();
    YAML::Node list{YAML::NodeType::Sequence};
    for (auto &authority : committee.authorities()) {
      YAML::Node entry;
      entry["name"] = authority.name;
      entry["public-key"] = fmt::format("{:0xx}", authority.id);
      entry["stake"] = authority.stake;
      list.push_back(entry);
    }
    root["authorities"] = list;
    return root;
  }

}  // namespace weave
