/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/synchronizer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "dag/impl/dag_store_impl.hpp"
#include "mock/clock/manual_clock.hpp"
#include "mock/dag/dag_store_mock.hpp"
#include "mock/network/peer_network_mock.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/storage_error.hpp"
#include "testutil/committee_fixture.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using testing::_;
using testing::NiceMock;
using testing::Return;
using weave::AuthorityId;
using weave::Certificate;
using weave::Digest;
using weave::network::PeerNetworkMock;
using weave::network::SentMessages;
using weave::primary::CoreMessage;
using weave::primary::FetchedCertificates;
using weave::primary::FetchedHeaders;
using weave::primary::FetchKind;
using weave::primary::FetchRequest;
using weave::primary::FetchUnavailable;
using weave::primary::SyncParameters;
using weave::primary::Synchronizer;
using weave::primary::SynchronizerMessage;
namespace network = weave::network;

class SynchronizerTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    params_.retry_base_delay = 200ms;
    params_.retry_max_delay = 1s;
    params_.max_attempts = 3;
    params_.deadline = 30s;
    params_.request_timeout = 2s;
    params_.retry_nodes = 1;
    store_ = std::make_shared<weave::dag::DagStoreImpl>(
        testutil::prepareLoggers(),
        std::make_shared<weave::storage::InMemorySpacedStorage>());
    sent_.attach(*network_, committee_[0].id);
    certificate_ = committee_.certificate(
        committee_.header(1, 1, committee_.genesisDigests()));
    make();
  }

  void make() {
    auto [inbox_rx, inbox_tx] =
        weave::Channel<SynchronizerMessage>::create_channel(10);
    auto [core_rx, core_tx] = weave::Channel<CoreMessage>::create_channel(10);
    core_.emplace(std::move(core_rx));
    synchronizer_ = std::make_unique<Synchronizer>(
        testutil::prepareLoggers(),
        params_,
        committee_.committee(),
        store_,
        network_,
        clock_,
        std::move(inbox_rx),
        std::move(core_tx),
        [this](std::string_view, std::error_code error) {
          fatal_errors_.push_back(error);
        },
        42);
  }

  FetchRequest fetch(std::vector<Digest> digests,
                     std::optional<size_t> preferred = std::nullopt,
                     std::vector<size_t> hints = {}) const {
    FetchRequest request{
        .kind = FetchKind::Certificates,
        .digests = std::move(digests),
        .preferred = std::nullopt,
        .hints = {},
    };
    if (preferred.has_value()) {
      request.preferred = committee_[preferred.value()].id;
    }
    for (auto hint : hints) {
      request.hints.push_back(committee_[hint].id);
    }
    return request;
  }

  /// Certificate requests sent since the last call
  std::vector<std::pair<AuthorityId, network::FetchCertificatesRequest>>
  requests() {
    auto found = sent_.unicasts<network::FetchCertificatesRequest>();
    sent_.clear();
    return found;
  }

  std::vector<CoreMessage> toCore() {
    std::vector<CoreMessage> messages;
    while (auto message = core_->tryReceive()) {
      messages.push_back(std::move(message.value()));
    }
    return messages;
  }

  /// Lets the pending request time out and the backoff pass
  void expireAttempt() {
    clock_->advance(params_.request_timeout);
    synchronizer_->tick();
  }

  testutil::TestCommittee committee_{4};
  SyncParameters params_;
  std::shared_ptr<NiceMock<PeerNetworkMock>> network_ =
      std::make_shared<NiceMock<PeerNetworkMock>>();
  SentMessages sent_;
  std::shared_ptr<weave::clock::ManualSteadyClock> clock_ =
      std::make_shared<weave::clock::ManualSteadyClock>(5'000);
  std::shared_ptr<weave::dag::DagStore> store_;
  std::optional<weave::Channel<CoreMessage>::Receiver> core_;
  std::vector<std::error_code> fatal_errors_;
  std::unique_ptr<Synchronizer> synchronizer_;
  Certificate certificate_;
};

/**
 * @given two fetch requests for the same digest
 * @then one fetch is in flight and a single request goes to the preferred
 * peer
 */
TEST_F(SynchronizerTest, CoalescesRequests) {
  synchronizer_->process(fetch({certificate_.digest()}, 2));
  synchronizer_->process(fetch({certificate_.digest()}, 2));
  EXPECT_EQ(synchronizer_->inflight(), 1);

  synchronizer_->tick();
  auto sent = requests();
  ASSERT_EQ(sent.size(), 1);
  EXPECT_EQ(sent[0].first, committee_[2].id);
  ASSERT_EQ(sent[0].second.digests.size(), 1);
  EXPECT_EQ(sent[0].second.digests[0], certificate_.digest());

  // nothing more while the request is outstanding
  clock_->advance(1s);
  synchronizer_->tick();
  EXPECT_TRUE(requests().empty());
}

/**
 * @given a fetch preferring authority 2 with a hint for authority 3
 * @when attempts time out one after another
 * @then the preferred peer is asked first, then the hinted one, then the
 * remaining peer; this node never asks itself
 */
TEST_F(SynchronizerTest, AskOrder) {
  synchronizer_->process(fetch({certificate_.digest()}, 2, {3}));

  synchronizer_->tick();
  auto first = requests();
  ASSERT_EQ(first.size(), 1);
  EXPECT_EQ(first[0].first, committee_[2].id);

  expireAttempt();
  auto second = requests();
  ASSERT_EQ(second.size(), 1);
  EXPECT_EQ(second[0].first, committee_[3].id);

  expireAttempt();
  auto third = requests();
  ASSERT_EQ(third.size(), 1);
  EXPECT_EQ(third[0].first, committee_[1].id);
}

TEST_F(SynchronizerTest, RetryNodesPerAttempt) {
  params_.retry_nodes = 5;
  make();
  synchronizer_->process(fetch({certificate_.digest()}));
  synchronizer_->tick();

  auto sent = requests();
  ASSERT_EQ(sent.size(), 3);
  for (auto &[peer, request] : sent) {
    EXPECT_NE(peer, committee_[0].id);
  }
}

/**
 * @given a request in flight
 * @when the peer answers with the certificate and one nobody asked for
 * @then Core gets only the requested certificate and the fetch is done
 */
TEST_F(SynchronizerTest, ResponseGoesToCore) {
  synchronizer_->process(fetch({certificate_.digest()}, 1));
  synchronizer_->tick();
  auto sent = requests();
  ASSERT_EQ(sent.size(), 1);

  network::FetchCertificatesResponse response;
  response.request_id = sent[0].second.request_id;
  response.certificates.push_back(certificate_);
  response.certificates.push_back(committee_.certificate(
      committee_.header(2, 1, committee_.genesisDigests())));
  synchronizer_->process(
      network::Envelope{.from = committee_[1].id, .message = response});

  EXPECT_EQ(synchronizer_->inflight(), 0);
  auto messages = toCore();
  ASSERT_EQ(messages.size(), 1);
  auto fetched = std::get_if<FetchedCertificates>(&messages[0]);
  ASSERT_NE(fetched, nullptr);
  EXPECT_EQ(fetched->from, committee_[1].id);
  ASSERT_EQ(fetched->certificates.size(), 1);
  EXPECT_EQ(fetched->certificates[0].digest(), certificate_.digest());
}

TEST_F(SynchronizerTest, HeaderResponseGoesToCore) {
  auto header = committee_.header(3, 1, committee_.genesisDigests());
  synchronizer_->process(FetchRequest{
      .kind = FetchKind::Headers,
      .digests = {header.digest()},
      .preferred = committee_[3].id,
      .hints = {},
  });
  synchronizer_->tick();
  auto sent = sent_.unicasts<network::FetchHeadersRequest>();
  ASSERT_EQ(sent.size(), 1);

  network::FetchHeadersResponse response;
  response.request_id = sent[0].second.request_id;
  response.headers.push_back(header);
  synchronizer_->process(
      network::Envelope{.from = committee_[3].id, .message = response});

  auto messages = toCore();
  ASSERT_EQ(messages.size(), 1);
  auto fetched = std::get_if<FetchedHeaders>(&messages[0]);
  ASSERT_NE(fetched, nullptr);
  ASSERT_EQ(fetched->headers.size(), 1);
  EXPECT_EQ(fetched->headers[0], header);
}

/**
 * @given a peer answering that it lacks the digest
 * @then the next peer is asked once the backoff passes, without waiting for
 * the request timeout
 */
TEST_F(SynchronizerTest, MissingAnswerRetriesNextPeer) {
  synchronizer_->process(fetch({certificate_.digest()}, 1));
  synchronizer_->tick();
  auto sent = requests();
  ASSERT_EQ(sent.size(), 1);

  network::FetchCertificatesResponse response;
  response.request_id = sent[0].second.request_id;
  response.missing.push_back(certificate_.digest());
  synchronizer_->process(
      network::Envelope{.from = committee_[1].id, .message = response});
  EXPECT_EQ(synchronizer_->inflight(), 1);
  EXPECT_TRUE(toCore().empty());

  // base delay plus the largest jitter
  clock_->advance(300ms);
  synchronizer_->tick();
  auto retried = requests();
  ASSERT_EQ(retried.size(), 1);
  EXPECT_NE(retried[0].first, committee_[1].id);
}

/**
 * @given a digest no peer delivers
 * @when max_attempts attempts have timed out
 * @then Core is told the digest is unavailable
 */
TEST_F(SynchronizerTest, UnavailableAfterMaxAttempts) {
  synchronizer_->process(fetch({certificate_.digest()}, 1));
  synchronizer_->tick();
  expireAttempt();
  expireAttempt();
  EXPECT_TRUE(toCore().empty());

  expireAttempt();
  EXPECT_EQ(synchronizer_->inflight(), 0);
  auto messages = toCore();
  ASSERT_EQ(messages.size(), 1);
  auto unavailable = std::get_if<FetchUnavailable>(&messages[0]);
  ASSERT_NE(unavailable, nullptr);
  EXPECT_EQ(unavailable->kind, FetchKind::Certificates);
  EXPECT_EQ(unavailable->digest, certificate_.digest());
}

TEST_F(SynchronizerTest, UnavailableAfterDeadline) {
  params_.max_attempts = 100;
  params_.deadline = 1s;
  make();
  synchronizer_->process(fetch({certificate_.digest()}, 1));
  synchronizer_->tick();
  expireAttempt();

  auto messages = toCore();
  ASSERT_EQ(messages.size(), 1);
  EXPECT_NE(std::get_if<FetchUnavailable>(&messages[0]), nullptr);
}

/**
 * @given a stored certificate
 * @when a peer asks for it and for an unknown digest
 * @then the peer gets the certificate and the unknown digest listed missing
 */
TEST_F(SynchronizerTest, ServesCertificates) {
  ASSERT_OUTCOME_SUCCESS_TRY(store_->putCertificate(certificate_));
  Digest unknown;
  unknown.fill(0x11);

  network::FetchCertificatesRequest request;
  request.request_id = 9;
  request.digests.push_back(certificate_.digest());
  request.digests.push_back(unknown);
  synchronizer_->process(
      network::Envelope{.from = committee_[3].id, .message = request});

  auto responses = sent_.unicasts<network::FetchCertificatesResponse>();
  ASSERT_EQ(responses.size(), 1);
  EXPECT_EQ(responses[0].first, committee_[3].id);
  auto &response = responses[0].second;
  EXPECT_EQ(response.request_id, 9);
  ASSERT_EQ(response.certificates.size(), 1);
  EXPECT_EQ(response.certificates[0].digest(), certificate_.digest());
  ASSERT_EQ(response.missing.size(), 1);
  EXPECT_EQ(response.missing[0], unknown);
}

TEST_F(SynchronizerTest, ServesHeaders) {
  ASSERT_OUTCOME_SUCCESS_TRY(store_->putVotedHeader(certificate_.header));

  network::FetchHeadersRequest request;
  request.request_id = 3;
  request.digests.push_back(certificate_.header.digest());
  synchronizer_->process(
      network::Envelope{.from = committee_[2].id, .message = request});

  auto responses = sent_.unicasts<network::FetchHeadersResponse>();
  ASSERT_EQ(responses.size(), 1);
  ASSERT_EQ(responses[0].second.headers.size(), 1);
  EXPECT_EQ(responses[0].second.headers[0], certificate_.header);
  EXPECT_TRUE(responses[0].second.missing.empty());
}

TEST_F(SynchronizerTest, ServingIsCapped) {
  params_.max_fetch_batch = 2;
  make();
  network::FetchCertificatesRequest request;
  request.request_id = 1;
  for (uint8_t tag = 1; tag <= 5; ++tag) {
    Digest digest;
    digest.fill(tag);
    request.digests.push_back(digest);
  }
  synchronizer_->process(
      network::Envelope{.from = committee_[2].id, .message = request});

  auto responses = sent_.unicasts<network::FetchCertificatesResponse>();
  ASSERT_EQ(responses.size(), 1);
  EXPECT_EQ(responses[0].second.missing.size(), 2);
}

/**
 * @given a store that fails to read certificates
 * @when a peer asks for one
 * @then no response goes out, the fatal handler is told once, and the
 * synchronizer neither serves nor fetches afterwards
 */
TEST_F(SynchronizerTest, StorageFaultStopsServing) {
  auto store = std::make_shared<NiceMock<weave::dag::DagStoreMock>>();
  EXPECT_CALL(*store, getCertificate(_))
      .WillOnce(Return(weave::storage::StorageError::IO_ERROR));
  store_ = store;
  make();

  network::FetchCertificatesRequest request;
  request.request_id = 4;
  request.digests.push_back(certificate_.digest());
  synchronizer_->process(
      network::Envelope{.from = committee_[3].id, .message = request});

  EXPECT_TRUE(sent_.unicasts<network::FetchCertificatesResponse>().empty());
  ASSERT_EQ(fatal_errors_.size(), 1);
  EXPECT_EQ(fatal_errors_[0],
            make_error_code(weave::storage::StorageError::IO_ERROR));
  EXPECT_TRUE(synchronizer_->failed());

  synchronizer_->process(
      network::Envelope{.from = committee_[2].id, .message = request});
  synchronizer_->process(fetch({certificate_.digest()}, 2));
  synchronizer_->tick();
  EXPECT_EQ(synchronizer_->inflight(), 0);
  EXPECT_TRUE(requests().empty());
  EXPECT_EQ(fatal_errors_.size(), 1);
}
