/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef WEAVE_BUILD_VERSION
#define WEAVE_BUILD_VERSION "unknown"
#endif

namespace weave {
  const std::string &buildVersion() {
    static const std::string version{WEAVE_BUILD_VERSION};
    return version;
  }
}  // namespace weave
