/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/lists.hpp>

#include "types/header.hpp"
#include "types/vote.hpp"

namespace weave {

  using Signers = ssz::list<AuthorityId, kMaxCommitteeSize>;
  using Signatures = ssz::list<Signature, kMaxCommitteeSize>;

  /**
   * @class Certificate
   * A header together with signatures of a quorum of authorities over its
   * certificate digest. signers[i] produced signatures[i]; signers are
   * sorted and distinct. Genesis certificates carry no signatures.
   */
  class Certificate : public ssz::ssz_variable_size_container {
   public:
    Header header;
    Signers signers;
    Signatures signatures;

    SSZ_CONT(header, signers, signatures);
    bool operator==(const Certificate &) const = default;

    Digest digest() const {
      return certificateDigest(
          header.digest(), header.round, header.epoch, header.author);
    }

    Round round() const {
      return header.round;
    }

    const AuthorityId &origin() const {
      return header.author;
    }

    bool isGenesis() const {
      return header.round == kGenesisRound;
    }
  };

}  // namespace weave
