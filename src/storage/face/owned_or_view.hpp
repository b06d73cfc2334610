/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace weave::storage::face {

  /**
   * Selects what a read returns for T: either an owning container or a view
   * into storage memory. Specialized next to the concrete key/value types.
   */
  template <typename T>
  struct OwnedOrViewTrait;

  template <typename T>
  using OwnedOrView = typename OwnedOrViewTrait<T>::type;

}  // namespace weave::storage::face
