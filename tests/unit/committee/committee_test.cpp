/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "committee/committee.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "testutil/committee_fixture.hpp"
#include "testutil/storage/base_fs_test.hpp"

using weave::Authority;
using weave::Committee;
using weave::CommitteeError;

namespace {
  weave::AuthorityId testId(uint8_t tag) {
    weave::AuthorityId id;
    id.fill(tag);
    return id;
  }

  Committee makeCommittee(std::vector<weave::Stake> stakes) {
    std::vector<Authority> authorities;
    for (size_t i = 0; i < stakes.size(); ++i) {
      authorities.push_back(Authority{
          .id = testId(static_cast<uint8_t>(i + 1)),
          .stake = stakes[i],
          .name = fmt::format("a{}", i),
      });
    }
    return Committee::make(3, std::move(authorities)).value();
  }
}  // namespace

/**
 * @given four authorities of stake 1
 * @then quorum is 3 and validity is 2
 */
TEST(CommitteeTest, Thresholds) {
  auto committee = makeCommittee({1, 1, 1, 1});
  EXPECT_EQ(committee.epoch(), 3);
  EXPECT_EQ(committee.totalStake(), 4);
  EXPECT_EQ(committee.quorumThreshold(), 3);
  EXPECT_EQ(committee.validityThreshold(), 2);

  auto single = makeCommittee({1});
  EXPECT_EQ(single.quorumThreshold(), 1);
  EXPECT_EQ(single.validityThreshold(), 1);

  // 3f+1 = 7, quorum 2f+1 = 5, validity f+1 = 3
  auto seven = makeCommittee({1, 1, 1, 1, 1, 1, 1});
  EXPECT_EQ(seven.quorumThreshold(), 5);
  EXPECT_EQ(seven.validityThreshold(), 3);
}

TEST(CommitteeTest, WeightedStake) {
  auto committee = makeCommittee({5, 1, 1, 3});
  EXPECT_EQ(committee.totalStake(), 10);
  EXPECT_EQ(committee.quorumThreshold(), 7);
  EXPECT_EQ(committee.stake(testId(1)), 5);
  EXPECT_EQ(committee.stake(testId(9)), 0);

  std::vector<weave::AuthorityId> ids{testId(1), testId(4)};
  EXPECT_EQ(committee.stakeOf(ids), 8);
}

TEST(CommitteeTest, SortedById) {
  std::vector<Authority> authorities{
      {.id = testId(3), .stake = 1, .name = "c"},
      {.id = testId(1), .stake = 1, .name = "a"},
      {.id = testId(2), .stake = 1, .name = "b"},
  };
  ASSERT_OUTCOME_SUCCESS(committee,
                         Committee::make(0, std::move(authorities)));
  EXPECT_EQ(committee.authorities().front().name, "a");
  EXPECT_EQ(committee.indexOf(testId(3)), 2);
  EXPECT_FALSE(committee.indexOf(testId(7)).has_value());
  EXPECT_TRUE(committee.contains(testId(2)));
  EXPECT_EQ(committee.nameOf(testId(2)), "b");
  EXPECT_NE(committee.nameOf(testId(7)), "");
}

TEST(CommitteeTest, MakeRejects) {
  ASSERT_OUTCOME_ERROR(Committee::make(0, {}), CommitteeError::EMPTY);

  ASSERT_OUTCOME_ERROR(
      Committee::make(0,
                      {{.id = testId(1), .stake = 1, .name = "a"},
                       {.id = testId(1), .stake = 2, .name = "b"}}),
      CommitteeError::DUPLICATE_AUTHORITY);

  ASSERT_OUTCOME_ERROR(
      Committee::make(0, {{.id = testId(1), .stake = 0, .name = "a"}}),
      CommitteeError::ZERO_STAKE);

  ASSERT_OUTCOME_ERROR(
      Committee::make(0,
                      {{.id = testId(1),
                        .stake = std::numeric_limits<weave::Stake>::max(),
                        .name = "a"}}),
      CommitteeError::STAKE_OVERFLOW);

  std::vector<Authority> many;
  for (size_t i = 0; i <= weave::kMaxCommitteeSize; ++i) {
    Authority authority{.stake = 1};
    authority.id[0] = static_cast<uint8_t>(i >> 8);
    authority.id[1] = static_cast<uint8_t>(i);
    many.push_back(authority);
  }
  ASSERT_OUTCOME_ERROR(Committee::make(0, std::move(many)),
                       CommitteeError::TOO_LARGE);
}

struct CommitteeFileTest : public test::BaseFS_Test {
  CommitteeFileTest() : test::BaseFS_Test("/tmp/weave-test-committee") {}

  fs::path write(const std::string &content) {
    auto path = base_path / "committee.yaml";
    std::ofstream file(path);
    file << content;
    return path;
  }
};

/**
 * @given a committee written by committeeToYaml
 * @when it is loaded back
 * @then the same authorities, stakes and epoch are read
 */
TEST_F(CommitteeFileTest, WriteAndLoad) {
  testutil::TestCommittee test_committee(4, 7);
  auto &committee = *test_committee.committee();
  YAML::Emitter out;
  out << weave::committeeToYaml(committee);
  auto path = write(out.c_str());

  auto loaded = weave::loadCommittee(path);
  EXPECT_EQ(loaded.epoch(), 7);
  ASSERT_EQ(loaded.size(), committee.size());
  for (size_t i = 0; i < committee.size(); ++i) {
    EXPECT_EQ(loaded.authorities()[i].id, committee.authorities()[i].id);
    EXPECT_EQ(loaded.authorities()[i].name, committee.authorities()[i].name);
    EXPECT_EQ(loaded.authorities()[i].stake, 1);
  }
}

TEST_F(CommitteeFileTest, StakeDefaultsToOne) {
  auto path = write(fmt::format(R"(
authorities:
  - name: alice
    public-key: {:0xx}
)",
                                testId(1)));
  auto loaded = weave::loadCommittee(path);
  EXPECT_EQ(loaded.epoch(), 0);
  EXPECT_EQ(loaded.totalStake(), 1);
  EXPECT_EQ(loaded.nameOf(testId(1)), "alice");
}

TEST_F(CommitteeFileTest, LoadRejects) {
  EXPECT_THROW(weave::loadCommittee(base_path / "absent.yaml"),
               std::runtime_error);
  EXPECT_THROW(weave::loadCommittee(write("- just\n- a list\n")),
               std::runtime_error);
  EXPECT_THROW(weave::loadCommittee(write("epoch: 1\n")), std::runtime_error);
  EXPECT_THROW(weave::loadCommittee(write(R"(
authorities:
  - name: bob
    public-key: 0x1234
)")),
               std::runtime_error);
  EXPECT_THROW(weave::loadCommittee(write(R"(
authorities:
  - name: carol
)")),
               std::runtime_error);
  EXPECT_THROW(weave::loadCommittee(write("authorities: []\n")),
               std::runtime_error);
}
