/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "dag/genesis.hpp"
#include "serde/serialization.hpp"
#include "testutil/committee_fixture.hpp"

using testutil::TestCommittee;
using weave::Certificate;
using weave::Header;

/**
 * @given a signed header
 * @when its signature is replaced
 * @then the digest stays, since the signature is not part of it
 */
TEST(TypesTest, HeaderDigestExcludesSignature) {
  TestCommittee committee(4);
  auto header = committee.header(0, 1, committee.genesisDigests());
  auto digest = header.digest();

  Header resigned = header;
  resigned.digest_opt.reset();
  resigned.signature.fill(0x42);
  EXPECT_EQ(resigned.digest(), digest);
}

TEST(TypesTest, HeaderDigestCoversFields) {
  TestCommittee committee(4);
  auto parents = committee.genesisDigests();
  auto base = committee.header(0, 1, parents);

  EXPECT_NE(committee.header(1, 1, parents).digest(), base.digest());
  EXPECT_NE(committee.header(0, 2, parents).digest(), base.digest());
  EXPECT_NE(committee.header(0, 1, parents, {testutil::testBatch(1)}).digest(),
            base.digest());
  EXPECT_NE(committee.header(0, 1, parents, {}, 99).digest(), base.digest());
  parents.pop_back();
  EXPECT_NE(committee.header(0, 1, parents).digest(), base.digest());
}

/**
 * @given a header and a vote for it
 * @then the vote signs exactly the digest its certificate carries
 */
TEST(TypesTest, VoteSignsCertificateDigest) {
  TestCommittee committee(4);
  auto header = committee.header(2, 1, committee.genesisDigests());
  auto vote = committee.vote(1, header);
  auto certificate = committee.certificate(header);

  EXPECT_EQ(vote.certificateDigest(), certificate.digest());
  EXPECT_TRUE(weave::crypto::ed25519::verify(
      vote.signature, certificate.digest(), committee[1].id));
  EXPECT_EQ(certificate.origin(), committee[2].id);
  EXPECT_EQ(certificate.round(), 1);
  EXPECT_FALSE(certificate.isGenesis());
}

TEST(TypesTest, CertificateDigestBindsPosition) {
  TestCommittee committee(4);
  auto header = committee.header(0, 1, committee.genesisDigests());
  auto digest = header.digest();
  auto base = weave::certificateDigest(digest, 1, 0, committee[0].id);

  EXPECT_NE(weave::certificateDigest(digest, 2, 0, committee[0].id), base);
  EXPECT_NE(weave::certificateDigest(digest, 1, 1, committee[0].id), base);
  EXPECT_NE(weave::certificateDigest(digest, 1, 0, committee[1].id), base);
}

/**
 * @given one committee
 * @then every call derives the same unsigned genesis certificates, one per
 * authority in committee order
 */
TEST(TypesTest, GenesisIsDeterministic) {
  TestCommittee committee(4);
  auto first = weave::dag::genesisCertificates(*committee.committee());
  auto second = weave::dag::genesisCertificates(*committee.committee());
  ASSERT_EQ(first.size(), 4);
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].digest(), second[i].digest());
    EXPECT_EQ(first[i].origin(), committee[i].id);
    EXPECT_TRUE(first[i].isGenesis());
    EXPECT_TRUE(first[i].signers.empty());
    EXPECT_TRUE(first[i].header.parents.empty());
  }
  EXPECT_NE(first[0].digest(), first[1].digest());

  TestCommittee other_epoch(4, 1);
  EXPECT_NE(weave::dag::genesisCertificates(*other_epoch.committee())[0]
                .digest(),
            first[0].digest());
}

TEST(TypesTest, CertificateSszKeepsDigest) {
  TestCommittee committee(4);
  auto certificate = committee.certificate(committee.header(
      3, 1, committee.genesisDigests(), {testutil::testBatch(7, 2048, 3)}));

  ASSERT_OUTCOME_SUCCESS(encoded, weave::encode(certificate));
  ASSERT_OUTCOME_SUCCESS(decoded, weave::decode<Certificate>(encoded));
  EXPECT_FALSE(decoded.header.digest_opt.has_value());
  EXPECT_EQ(decoded, certificate);
  EXPECT_EQ(decoded.digest(), certificate.digest());
  EXPECT_EQ(decoded.header.payload[0].worker_id, 3);
}
