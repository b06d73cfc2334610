/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/fd_limit.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <sys/resource.h>

namespace weave {
  namespace {
    std::optional<rlimit> readLimit(const log::Logger &logger) {
      rlimit limit{};
      if (getrlimit(RLIMIT_NOFILE, &limit) != 0) {
        SL_WARN(logger,
                "getrlimit(RLIMIT_NOFILE) failed: errno={} {}",
                errno,
                strerror(errno));
        return std::nullopt;
      }
      return limit;
    }
  }  // namespace

  std::optional<size_t> getFdLimit(const log::Logger &logger) {
    auto limit = readLimit(logger);
    if (not limit.has_value()) {
      return std::nullopt;
    }
    return limit->rlim_cur;
  }

  std::optional<size_t> raiseFdLimit(size_t wanted,
                                     const log::Logger &logger) {
    auto limit = readLimit(logger);
    if (not limit.has_value()) {
      return std::nullopt;
    }
    auto current = limit->rlim_cur;
    if (wanted <= current) {
      return current;
    }
    auto target = static_cast<rlim_t>(wanted);
    if (limit->rlim_max != RLIM_INFINITY) {
      target = std::min(target, limit->rlim_max);
    }
    if (target == current) {
      SL_WARN(logger,
              "Open files limit {} is below the wanted {} and can't be raised",
              current,
              wanted);
      return current;
    }
    limit->rlim_cur = target;
    if (setrlimit(RLIMIT_NOFILE, &limit.value()) != 0) {
      SL_WARN(logger,
              "setrlimit(RLIMIT_NOFILE, {}) failed: errno={} {}",
              target,
              errno,
              strerror(errno));
      return current;
    }
    SL_VERBOSE(logger, "Open files limit raised from {} to {}", current, target);
    return target;
  }
}  // namespace weave
