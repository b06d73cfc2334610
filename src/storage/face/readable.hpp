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
   * @brief A mixin for read-only map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    [[nodiscard]] virtual outcome::result<bool> contains(
        const View<K> &key) const = 0;

    /**
     * @brief Get value by key
     * @return value, or StorageError::NOT_FOUND if the key is absent
     */
    [[nodiscard]] virtual outcome::result<OwnedOrView<V>> get(
        const View<K> &key) const = 0;

    /**
     * @brief Get value by key
     * @return value if present, std::nullopt otherwise
     */
    [[nodiscard]] virtual outcome::result<std::optional<OwnedOrView<V>>> tryGet(
        const View<K> &key) const = 0;
  };
}  // namespace weave::storage::face
