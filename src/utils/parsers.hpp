/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace weave::util {

  /// Case-insensitive equality of ASCII strings
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  namespace detail {
    struct Unit {
      std::string_view suffix;
      uint64_t multiplier;
    };

    /**
     * Parses "<number>[blanks]<unit>" with surrounding blanks allowed and
     * scales the number by the unit's multiplier.
     * @return nullopt for a missing number, an unknown unit or an overflow
     */
    inline std::optional<uint64_t> parseQuantity(std::string_view input,
                                                 std::span<const Unit> units) {
      constexpr std::string_view kBlanks = " \t\n\r";
      auto first = input.find_first_not_of(kBlanks);
      if (first == std::string_view::npos) {
        return std::nullopt;
      }
      input = input.substr(first, input.find_last_not_of(kBlanks) - first + 1);

      uint64_t number = 0;
      auto [end, ec] =
          std::from_chars(input.data(), input.data() + input.size(), number);
      if (ec != std::errc() or end == input.data()) {
        return std::nullopt;
      }
      auto suffix = input.substr(end - input.data());
      suffix.remove_prefix(std::min(suffix.find_first_not_of(kBlanks),
                                    suffix.size()));

      for (auto &unit : units) {
        if (iequals(unit.suffix, suffix)) {
          if (number > UINT64_MAX / unit.multiplier) {
            return std::nullopt;
          }
          return number * unit.multiplier;
        }
      }
      return std::nullopt;
    }
  }  // namespace detail

  /**
   * Parses a byte size such as "64", "10MB" or "4 KiB".
   * SI suffixes (KB, MB, GB, TB) are powers of 1000. IEC suffixes (KiB...)
   * and the single letters K, M, G, T are powers of 1024.
   */
  inline std::optional<uint64_t> parseByteQuantity(std::string_view input) {
    static constexpr detail::Unit kUnits[] = {
        {"", 1},
        {"b", 1},
        {"k", 1ull << 10},
        {"kib", 1ull << 10},
        {"kb", 1000ull},
        {"m", 1ull << 20},
        {"mib", 1ull << 20},
        {"mb", 1000'000ull},
        {"g", 1ull << 30},
        {"gib", 1ull << 30},
        {"gb", 1000'000'000ull},
        {"t", 1ull << 40},
        {"tib", 1ull << 40},
        {"tb", 1000'000'000'000ull},
    };
    return detail::parseQuantity(input, kUnits);
  }

  /// Parses "250ms", "2s", "1 min" and the like; a bare number is millis
  inline std::optional<std::chrono::milliseconds> parseDurationMs(
      std::string_view input) {
    static constexpr detail::Unit kUnits[] = {
        {"", 1},
        {"ms", 1},
        {"msec", 1},
        {"s", 1000},
        {"sec", 1000},
        {"secs", 1000},
        {"second", 1000},
        {"seconds", 1000},
        {"m", 60'000},
        {"min", 60'000},
        {"mins", 60'000},
        {"minute", 60'000},
        {"minutes", 60'000},
        {"h", 3'600'000},
        {"hour", 3'600'000},
        {"hours", 3'600'000},
    };
    auto millis = detail::parseQuantity(input, kUnits);
    if (not millis.has_value()) {
      return std::nullopt;
    }
    return std::chrono::milliseconds(*millis);
  }

}  // namespace weave::util
