/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/face/map_cursor.hpp"

namespace weave::storage::face {

  /**
   * @brief A mixin for an iterable map.
   * @tparam K map key type
   * @tparam V map value type
   */
  template <typename K, typename V>
  struct Iterable {
    using Cursor = MapCursor<K, V>;

    virtual ~Iterable() = default;

    /// Returns a new cursor, initially not positioned
    virtual std::unique_ptr<Cursor> cursor() = 0;
  };

}  // namespace weave::storage::face
