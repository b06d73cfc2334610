/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/codec.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "serde/snappy.hpp"
#include "testutil/committee_fixture.hpp"

using weave::network::CodecError;
using weave::network::decodeMessage;
using weave::network::encodeMessage;
using weave::network::Message;
namespace network = weave::network;

/**
 * @given a certificate message
 * @when it is framed and parsed again
 * @then the frame starts with the tag of the alternative and the parsed
 * certificate has the same digest
 */
TEST(CodecTest, CertificateFrame) {
  testutil::TestCommittee committee(4);
  auto certificate =
      committee.certificate(committee.header(1, 1, committee.genesisDigests()));

  auto frame =
      encodeMessage(network::SendCertificate{.certificate = certificate});
  ASSERT_FALSE(frame.empty());
  EXPECT_EQ(frame[0], 2);

  ASSERT_OUTCOME_SUCCESS(message, decodeMessage(frame));
  auto sent = std::get_if<network::SendCertificate>(&message);
  ASSERT_NE(sent, nullptr);
  EXPECT_EQ(sent->certificate.digest(), certificate.digest());
  EXPECT_EQ(sent->certificate.signers.size(), 3);
}

TEST(CodecTest, FetchResponseFrame) {
  testutil::TestCommittee committee(4);
  network::FetchHeadersResponse response;
  response.request_id = 17;
  response.headers.push_back(
      committee.header(0, 1, committee.genesisDigests()));
  response.missing.push_back(committee.genesisDigests()[2]);

  ASSERT_OUTCOME_SUCCESS(message, decodeMessage(encodeMessage(response)));
  auto parsed = std::get_if<network::FetchHeadersResponse>(&message);
  ASSERT_NE(parsed, nullptr);
  EXPECT_EQ(parsed->request_id, 17);
  ASSERT_EQ(parsed->headers.size(), 1);
  EXPECT_EQ(parsed->headers[0], response.headers[0]);
  ASSERT_EQ(parsed->missing.size(), 1);
}

TEST(CodecTest, EmptyFrame) {
  ASSERT_OUTCOME_ERROR(decodeMessage(qtils::ByteVec{}),
                       CodecError::EMPTY_FRAME);
}

TEST(CodecTest, UnknownTag) {
  qtils::ByteVec frame{static_cast<uint8_t>(std::variant_size_v<Message>)};
  auto body = weave::snappyCompress(qtils::ByteVec{1, 2, 3});
  frame.insert(frame.end(), body.begin(), body.end());
  ASSERT_OUTCOME_ERROR(decodeMessage(frame), CodecError::UNKNOWN_TAG);
}

/**
 * @given a frame with a valid tag and a body that is not snappy data
 * @then decoding fails instead of producing a message
 */
TEST(CodecTest, CorruptedBody) {
  testutil::TestCommittee committee(4);
  auto frame = encodeMessage(network::SendVote{
      .vote = committee.vote(
          0, committee.header(1, 1, committee.genesisDigests()))});
  frame.resize(3);
  frame[1] = 0xff;
  frame[2] = 0xff;
  EXPECT_TRUE(decodeMessage(frame).has_error());
}
