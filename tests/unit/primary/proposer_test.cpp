/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/proposer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "dag/impl/dag_store_impl.hpp"
#include "mock/clock/manual_clock.hpp"
#include "mock/dag/dag_store_mock.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/storage_error.hpp"
#include "testutil/committee_fixture.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using testing::_;
using testing::NiceMock;
using testing::Return;
using testutil::testBatch;
using weave::Header;
using weave::primary::CoreMessage;
using weave::primary::DigestBoard;
using weave::primary::OwnHeader;
using weave::primary::Parameters;
using weave::primary::ParentsReady;
using weave::primary::Proposer;
using weave::primary::ProposerMessage;

class ProposerTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    params_.header_num_of_batches_threshold = 3;
    params_.min_header_delay = 100ms;
    params_.max_header_delay = 1s;
    store_ = std::make_shared<weave::dag::DagStoreImpl>(
        testutil::prepareLoggers(),
        std::make_shared<weave::storage::InMemorySpacedStorage>());
    proposer_ = makeProposer(store_);
  }

  std::unique_ptr<Proposer> makeProposer(
      std::shared_ptr<weave::dag::DagStore> store) {
    auto [inbox_rx, inbox_tx] =
        weave::Channel<ProposerMessage>::create_channel(10);
    auto [core_rx, core_tx] = weave::Channel<CoreMessage>::create_channel(10);
    core_.emplace(std::move(core_rx));
    return std::make_unique<Proposer>(
        testutil::prepareLoggers(),
        params_,
        committee_.committee(),
        committee_[0].keypair,
        board_,
        std::move(store),
        steady_clock_,
        system_clock_,
        std::move(inbox_rx),
        std::move(core_tx),
        [this](std::string_view, std::error_code error) {
          fatal_errors_.push_back(error);
        });
  }

  /// Own headers handed to Core so far
  std::vector<Header> handedOver() {
    std::vector<Header> headers;
    while (auto message = core_->tryReceive()) {
      if (auto own = std::get_if<OwnHeader>(&message.value())) {
        headers.push_back(own->header);
      }
    }
    return headers;
  }

  /// Reports batches the way Primary does: persisted, then on the board
  void report(const std::vector<weave::BatchInfo> &batches) {
    ASSERT_OUTCOME_SUCCESS_TRY(store_->putPendingBatches(batches));
    for (auto &batch : batches) {
      board_->add(batch);
    }
  }

  ParentsReady parentsOf(weave::Round round) const {
    return {.round = round, .parents = committee_.genesisDigests()};
  }

  testutil::TestCommittee committee_{4};
  Parameters params_;
  std::shared_ptr<DigestBoard> board_ =
      std::make_shared<DigestBoard>(testutil::prepareLoggers(), 100);
  std::shared_ptr<weave::clock::ManualSteadyClock> steady_clock_ =
      std::make_shared<weave::clock::ManualSteadyClock>(10'000);
  std::shared_ptr<weave::clock::ManualClock> system_clock_ =
      std::make_shared<weave::clock::ManualClock>(1'700'000'000'000);
  std::shared_ptr<weave::dag::DagStore> store_;
  std::optional<weave::Channel<CoreMessage>::Receiver> core_;
  std::vector<std::error_code> fatal_errors_;
  std::unique_ptr<Proposer> proposer_;
};

TEST_F(ProposerTest, WaitsForParents) {
  report({testBatch(1), testBatch(2), testBatch(3)});
  proposer_->tick();
  EXPECT_TRUE(handedOver().empty());
  EXPECT_EQ(proposer_->lastProposed(), 0);
}

/**
 * @given parents of round 1 and two batches on the board
 * @when the proposer ticks
 * @then it builds, signs and persists one header carrying the batches and
 * hands it to Core; the batches are no longer pending
 */
TEST_F(ProposerTest, FirstHeaderIsImmediate) {
  report({testBatch(1), testBatch(2)});
  proposer_->process(parentsOf(1));
  proposer_->tick();

  auto headers = handedOver();
  ASSERT_EQ(headers.size(), 1);
  auto &header = headers[0];
  EXPECT_EQ(header.author, committee_[0].id);
  EXPECT_EQ(header.round, 1);
  EXPECT_EQ(header.epoch, 0);
  EXPECT_EQ(header.created_at, 1'700'000'000'000);
  ASSERT_EQ(header.payload.size(), 2);
  EXPECT_EQ(header.payload[0], testBatch(1).ref());
  EXPECT_EQ(header.parents.size(), 4);
  EXPECT_TRUE(weave::crypto::ed25519::verify(
      header.signature, header.digest(), committee_[0].id));

  ASSERT_OUTCOME_SUCCESS(own, store_->lastOwnHeader());
  ASSERT_TRUE(own.has_value());
  EXPECT_EQ(own->header, header);
  ASSERT_EQ(own->batches.size(), 2);
  EXPECT_EQ(own->batches[1], testBatch(2));
  ASSERT_OUTCOME_SUCCESS(pending, store_->pendingBatches());
  EXPECT_TRUE(pending.empty());
  EXPECT_EQ(board_->size(), 0);

  // one header per round
  proposer_->tick();
  EXPECT_TRUE(handedOver().empty());
  EXPECT_EQ(proposer_->lastProposed(), 1);
}

/**
 * @given a header proposed at round 1
 * @when round 2 opens
 * @then nothing is proposed before the minimal delay, then only once enough
 * batches wait
 */
TEST_F(ProposerTest, BatchThresholdAfterMinDelay) {
  proposer_->process(parentsOf(1));
  proposer_->tick();
  ASSERT_EQ(handedOver().size(), 1);

  proposer_->process(parentsOf(2));
  report({testBatch(1), testBatch(2), testBatch(3)});
  steady_clock_->advance(50ms);
  proposer_->tick();
  EXPECT_TRUE(handedOver().empty());

  steady_clock_->advance(50ms);
  proposer_->tick();
  auto headers = handedOver();
  ASSERT_EQ(headers.size(), 1);
  EXPECT_EQ(headers[0].round, 2);
  EXPECT_EQ(headers[0].payload.size(), 3);
}

TEST_F(ProposerTest, MaxDelayProposesBelowThreshold) {
  proposer_->process(parentsOf(1));
  proposer_->tick();
  ASSERT_EQ(handedOver().size(), 1);

  proposer_->process(parentsOf(2));
  report({testBatch(1)});
  steady_clock_->advance(999ms);
  proposer_->tick();
  EXPECT_TRUE(handedOver().empty());

  steady_clock_->advance(1ms);
  proposer_->tick();
  auto headers = handedOver();
  ASSERT_EQ(headers.size(), 1);
  EXPECT_EQ(headers[0].payload.size(), 1);
}

TEST_F(ProposerTest, PayloadLimits) {
  params_.max_header_num_of_batches = 2;
  proposer_ = makeProposer(store_);
  report({testBatch(1), testBatch(2), testBatch(3)});
  proposer_->process(parentsOf(1));
  proposer_->tick();

  auto headers = handedOver();
  ASSERT_EQ(headers.size(), 1);
  EXPECT_EQ(headers[0].payload.size(), 2);
  EXPECT_EQ(board_->size(), 1);
}

TEST_F(ProposerTest, OldParentsIgnored) {
  proposer_->process(parentsOf(3));
  proposer_->process(parentsOf(2));
  EXPECT_EQ(proposer_->round(), 3);
  proposer_->tick();
  auto headers = handedOver();
  ASSERT_EQ(headers.size(), 1);
  EXPECT_EQ(headers[0].round, 3);
}

/**
 * @given an own header of round 1 that never got certified
 * @when round 3 opens
 * @then its batches go back on the board and into the pending batches
 */
TEST_F(ProposerTest, UncertifiedBatchesReturn) {
  report({testBatch(1), testBatch(2)});
  proposer_->process(parentsOf(1));
  proposer_->tick();
  ASSERT_EQ(handedOver().size(), 1);
  EXPECT_EQ(board_->size(), 0);

  proposer_->process(parentsOf(2));
  EXPECT_EQ(board_->size(), 0);

  proposer_->process(parentsOf(3));
  EXPECT_EQ(board_->size(), 2);
  ASSERT_OUTCOME_SUCCESS(pending, store_->pendingBatches());
  EXPECT_EQ(pending.size(), 2);
}

TEST_F(ProposerTest, CertifiedBatchesStay) {
  report({testBatch(1)});
  proposer_->process(parentsOf(1));
  proposer_->tick();
  auto headers = handedOver();
  ASSERT_EQ(headers.size(), 1);
  ASSERT_OUTCOME_SUCCESS_TRY(
      store_->putCertificate(committee_.certificate(headers[0])));

  proposer_->process(parentsOf(3));
  EXPECT_EQ(board_->size(), 0);
}

/**
 * @given pending batches and an own header of round 4 in the store
 * @when a new proposer recovers from it
 * @then the batches are back on the board, the header goes to Core again,
 * and no second header is built for round 4
 */
TEST_F(ProposerTest, Recover) {
  ASSERT_OUTCOME_SUCCESS_TRY(
      store_->putPendingBatches({testBatch(7), testBatch(8)}));
  auto own = committee_.header(0, 4, committee_.genesisDigests());
  ASSERT_OUTCOME_SUCCESS_TRY(store_->putOwnHeader(own, {}));

  proposer_ = makeProposer(store_);
  ASSERT_TRUE(proposer_->recover());
  EXPECT_EQ(board_->size(), 2);
  EXPECT_EQ(proposer_->lastProposed(), 4);

  proposer_->process(parentsOf(4));
  proposer_->tick();
  auto headers = handedOver();
  ASSERT_EQ(headers.size(), 1);
  EXPECT_EQ(headers[0], own);

  proposer_->tick();
  EXPECT_TRUE(handedOver().empty());
}

/**
 * @given a store that fails to persist the own header
 * @then no header reaches Core, the batches stay on the board and the
 * fatal handler is told
 */
TEST_F(ProposerTest, PersistFaultIsFatal) {
  auto store = std::make_shared<NiceMock<weave::dag::DagStoreMock>>();
  EXPECT_CALL(*store, putOwnHeader(_, _))
      .WillOnce(Return(weave::storage::StorageError::IO_ERROR));
  proposer_ = makeProposer(store);

  board_->add(testBatch(1));
  proposer_->process(parentsOf(1));
  proposer_->tick();

  EXPECT_TRUE(handedOver().empty());
  EXPECT_EQ(board_->size(), 1);
  ASSERT_EQ(fatal_errors_.size(), 1);
  EXPECT_EQ(proposer_->lastProposed(), 0);

  proposer_->tick();
  EXPECT_TRUE(handedOver().empty());
}

/**
 * @given an own header of round 1 carrying batches of 40 and 70 bytes, and a
 * restart before it is certified
 * @when the recovered proposer sees round 3 open
 * @then the batches return to the board and the pending batches with their
 * sizes
 */
TEST_F(ProposerTest, RestoredBatchesKeepSizes) {
  report({testBatch(1, 40), testBatch(2, 70)});
  proposer_->process(parentsOf(1));
  proposer_->tick();
  ASSERT_EQ(handedOver().size(), 1);

  board_ = std::make_shared<DigestBoard>(testutil::prepareLoggers(), 100);
  proposer_ = makeProposer(store_);
  ASSERT_TRUE(proposer_->recover());
  EXPECT_EQ(proposer_->lastProposed(), 1);
  EXPECT_EQ(board_->size(), 0);

  proposer_->process(parentsOf(3));
  ASSERT_OUTCOME_SUCCESS(pending, store_->pendingBatches());
  ASSERT_EQ(pending.size(), 2);
  EXPECT_EQ(pending[0], testBatch(1, 40));
  EXPECT_EQ(pending[1], testBatch(2, 70));

  EXPECT_EQ(board_->size(), 2);
  EXPECT_EQ(board_->bytes(), 110);
  EXPECT_TRUE(fatal_errors_.empty());
}
