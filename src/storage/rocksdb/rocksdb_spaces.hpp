/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include "storage/spaces.hpp"

namespace weave::storage {

  /// Column family name of the space
  std::string_view spaceName(Space space);

  std::optional<Space> spaceFromString(std::string_view string);

}  // namespace weave::storage
