/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace weave {
  /// Version string the binary was built with
  const std::string &buildVersion();
}  // namespace weave
