/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <print>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "committee/committee.hpp"
#include "crypto/ed25519.hpp"
#include "types/constants.hpp"

/**
 * Writes a local testnet: `committee.yaml` with `count` equally staked
 * authorities, a seed file per authority and a `config.yaml` running all of
 * them in one process.
 */
inline int cmdGenerateCommittee(auto &&getArg) {
  auto directory_arg = getArg(2);
  auto count_arg = getArg(3);
  if (not directory_arg or not count_arg) {
    fmt::println(std::cerr, "Usage: weave_node generate-committee <dir> <count>");
    return EXIT_FAILURE;
  }
  size_t count = 0;
  auto [ptr, ec] = std::from_chars(
      count_arg->data(), count_arg->data() + count_arg->size(), count);
  if (ec != std::errc{} or ptr != count_arg->data() + count_arg->size()
      or count == 0 or count > weave::kMaxCommitteeSize) {
    fmt::println(std::cerr,
                 "Authority count must be a number in [1, {}]",
                 weave::kMaxCommitteeSize);
    return EXIT_FAILURE;
  }

  std::filesystem::path directory{*directory_arg};
  std::filesystem::create_directories(directory);

  std::vector<weave::Authority> authorities;
  std::vector<std::string> key_files;
  for (size_t i = 0; i < count; ++i) {
    auto name = std::format("node_{}", i);
    auto seed = weave::crypto::ed25519::randomSeed();
    auto keypair = weave::crypto::ed25519::keypairFromSeed(seed);
    authorities.emplace_back(weave::Authority{
        .id = weave::crypto::ed25519::publicKey(keypair),
        .stake = 1,
        .name = name,
    });

    auto key_file = std::format("{}.key", name);
    std::ofstream key{directory / key_file};
    std::print(key, "{}", fmt::format("{:0xx}", seed));
    key.close();
    key_files.emplace_back(key_file);
  }

  auto committee_res = weave::Committee::make(0, std::move(authorities));
  if (committee_res.has_error()) {
    fmt::println(
        std::cerr, "Can't build committee: {}", committee_res.error());
    return EXIT_FAILURE;
  }

  std::ofstream committee_yaml{directory / "committee.yaml"};
  committee_yaml << weave::committeeToYaml(committee_res.value()) << "\n";
  committee_yaml.close();

  YAML::Node config;
  config["general"]["name"] = "testnet";
  config["general"]["base-path"] =
      std::filesystem::absolute(directory).lexically_normal().string();
  config["general"]["committee"] = "committee.yaml";
  for (auto &key_file : key_files) {
    config["general"]["validator-keys"].push_back(key_file);
  }
  config["database"]["path"] = "db";
  config["primary"]["max-header-delay"] = "200ms";
  config["primary"]["gc-depth"] = 50;
  std::ofstream config_yaml{directory / "config.yaml"};
  config_yaml << config << "\n";
  config_yaml.close();

  std::println("Committee of {} authorities written to {}",
               count,
               directory.string());
  return EXIT_SUCCESS;
}
