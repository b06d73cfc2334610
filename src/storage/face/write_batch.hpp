/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/face/writeable.hpp"

namespace weave::storage::face {

  /**
   * @brief Collects writes to one map and applies them on commit.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct WriteBatch : public Writeable<K, V> {
    /// Applies every collected write atomically
    virtual outcome::result<void> commit() = 0;

    /// Drops collected writes so the batch can be reused
    virtual void clear() = 0;
  };

  /**
   * @brief Collects writes to several spaces of one storage. Commit applies
   * all of them atomically.
   * @tparam Space space identifier type
   * @tparam K key type
   * @tparam V value type
   */
  template <typename Space, typename K, typename V>
  struct SpacedBatch {
    virtual ~SpacedBatch() = default;

    virtual outcome::result<void> put(Space space,
                                      const View<K> &key,
                                      OwnedOrView<V> &&value) = 0;

    virtual outcome::result<void> remove(Space space, const View<K> &key) = 0;

    virtual outcome::result<void> commit() = 0;

    virtual void clear() = 0;
  };

}  // namespace weave::storage::face
