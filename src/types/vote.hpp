/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "serde/serialization.hpp"
#include "types/types.hpp"

namespace weave {

  /// What votes and certificates sign: a header bound to its position
  struct CertificateDigestPreimage : ssz::ssz_container {
    Digest header_digest;
    Round round = 0;
    Epoch epoch = 0;
    AuthorityId origin;

    SSZ_CONT(header_digest, round, epoch, origin);
  };

  inline Digest certificateDigest(const Digest &header_digest,
                                  Round round,
                                  Epoch epoch,
                                  const AuthorityId &origin) {
    return sszHash(CertificateDigestPreimage{
        .header_digest = header_digest,
        .round = round,
        .epoch = epoch,
        .origin = origin,
    });
  }

  /// A signed acceptance of header (origin, round) by `author`
  struct Vote : ssz::ssz_container {
    Digest header_digest;
    Round round = 0;
    Epoch epoch = 0;
    /// Author of the header voted for
    AuthorityId origin;
    /// Voter
    AuthorityId author;
    Signature signature;

    SSZ_CONT(header_digest, round, epoch, origin, author, signature);
    bool operator==(const Vote &) const = default;

    /// Message the voter signed
    Digest certificateDigest() const {
      return weave::certificateDigest(header_digest, round, epoch, origin);
    }
  };

}  // namespace weave
