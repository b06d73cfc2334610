/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/view.hpp"

namespace weave::storage::face {

  /**
   * @brief Ordered cursor over a map. Keys are compared bytewise.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /// @return true if the map is not empty
    virtual outcome::result<bool> seekFirst() = 0;

    /**
     * Positions the cursor at the first key not less than `key`.
     * @return true if such key exists
     */
    virtual outcome::result<bool> seek(const View<K> &key) = 0;

    /// @return true if the map is not empty
    virtual outcome::result<bool> seekLast() = 0;

    /// @return true if the cursor points to an element of the map
    virtual bool isValid() const = 0;

    virtual outcome::result<void> next() = 0;

    virtual outcome::result<void> prev() = 0;

    /// @return key if isValid()
    virtual std::optional<K> key() const = 0;

    /// @return value if isValid()
    virtual std::optional<OwnedOrView<V>> value() const = 0;
  };

}  // namespace weave::storage::face
