/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dag/dag_store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(weave::dag, DagStoreError, e) {
  using E = DagStoreError;
  switch (e) {
    case E::MALFORMED_INDEX_KEY:
      return "Round index key is malformed. Possibly storage is corrupted";
    case E::DANGLING_INDEX_ENTRY:
      return "Round index points to a missing entry";
    case E::MALFORMED_MARKER:
      return "Stored round marker is malformed";
  }
  return "Unknown error";
}
