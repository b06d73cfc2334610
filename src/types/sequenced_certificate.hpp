/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "types/certificate.hpp"

namespace weave {

  /// Position of a certificate in the consensus feed
  using FeedIndex = uint64_t;

  /// A feed entry: certificates are delivered parents first
  struct SequencedCertificate {
    FeedIndex index = 0;
    std::shared_ptr<const Certificate> certificate;
  };

}  // namespace weave
