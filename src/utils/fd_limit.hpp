/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <optional>

#include "log/logger.hpp"

namespace weave {

  /// Current soft limit of open file descriptors
  std::optional<size_t> getFdLimit(const log::Logger &logger);

  /**
   * Raises the soft limit of open file descriptors towards `wanted`, never
   * above the hard limit and never lowering it.
   * @return soft limit in effect afterwards
   */
  std::optional<size_t> raiseFdLimit(size_t wanted, const log::Logger &logger);

}  // namespace weave
