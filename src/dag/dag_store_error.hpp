/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace weave::dag {

  enum class DagStoreError : uint8_t {
    MALFORMED_INDEX_KEY = 1,
    DANGLING_INDEX_ENTRY,
    MALFORMED_MARKER,
  };

}

OUTCOME_HPP_DECLARE_ERROR(weave::dag, DagStoreError);
