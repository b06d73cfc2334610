/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/certificate.hpp"
#include "types/constants.hpp"

namespace weave::network {

  using FetchDigests = ssz::list<Digest, kMaxFetchDigests>;

  struct SendHeader : ssz::ssz_variable_size_container {
    Header header;

    SSZ_CONT(header);
  };

  struct SendVote : ssz::ssz_container {
    Vote vote;

    SSZ_CONT(vote);
  };

  struct SendCertificate : ssz::ssz_variable_size_container {
    Certificate certificate;

    SSZ_CONT(certificate);
  };

  struct FetchCertificatesRequest : ssz::ssz_variable_size_container {
    /// Echoed in the response
    uint64_t request_id = 0;
    FetchDigests digests;

    SSZ_CONT(request_id, digests);
  };

  /// Found certificates; every requested digest not listed is not found
  struct FetchCertificatesResponse : ssz::ssz_variable_size_container {
    uint64_t request_id = 0;
    ssz::list<Certificate, kMaxFetchDigests> certificates;
    FetchDigests missing;

    SSZ_CONT(request_id, certificates, missing);
  };

  struct FetchHeadersRequest : ssz::ssz_variable_size_container {
    uint64_t request_id = 0;
    FetchDigests digests;

    SSZ_CONT(request_id, digests);
  };

  struct FetchHeadersResponse : ssz::ssz_variable_size_container {
    uint64_t request_id = 0;
    ssz::list<Header, kMaxFetchDigests> headers;
    FetchDigests missing;

    SSZ_CONT(request_id, headers, missing);
  };

  /// Wire messages. The index of the alternative is the wire tag.
  using Message = std::variant<SendHeader,
                               SendVote,
                               SendCertificate,
                               FetchCertificatesRequest,
                               FetchCertificatesResponse,
                               FetchHeadersRequest,
                               FetchHeadersResponse>;

  /// A message with the authority the transport authenticated as its sender
  struct Envelope {
    AuthorityId from;
    Message message;
  };

}  // namespace weave::network
