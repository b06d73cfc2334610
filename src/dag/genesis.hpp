/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "committee/committee.hpp"
#include "types/certificate.hpp"

namespace weave::dag {

  /**
   * Round 0 certificates: one unsigned, empty-header certificate per
   * authority, in committee order. Every node derives the same set from the
   * committee, so genesis is never fetched or verified.
   */
  inline std::vector<Certificate> genesisCertificates(
      const Committee &committee) {
    std::vector<Certificate> certificates;
    certificates.reserve(committee.size());
    for (auto &authority : committee.authorities()) {
      Certificate certificate;
      certificate.header.author = authority.id;
      certificate.header.round = kGenesisRound;
      certificate.header.epoch = committee.epoch();
      certificate.header.updateDigest();
      certificates.emplace_back(std::move(certificate));
    }
    return certificates;
  }

}  // namespace weave::dag
