// Copyright (C) 2025 Ian Torres
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.

#pragma once

#ifndef RECLAIM_UTILS_HPP
#define RECLAIM_UTILS_HPP

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <reclaim/exceptions.hpp>
#include <reclaim/types.hpp>

namespace reclaim
{
  /**
   * To string
   *
   * @param mode
   * @return
   */
  inline std::string to_string(const run_modes mode)
  {
    switch (mode)
    {
      case run_modes::mark:
        return "mark";
      case run_modes::sweep:
        return "sweep";
      default:
        return "both";
    }
  }

  /**
   * To string
   *
   * @param type
   * @return
   */
  inline std::string to_string(const storage_types type)
  {
    using enum storage_types;
    switch (type)
    {
      case s3:
        return "s3";
      case azure:
        return "azure";
      default:
        return "local";
    }
  }

  /**
   * Parse run mode
   *
   * @param value
   * @return run_modes
   */
  inline run_modes parse_run_mode(const std::string_view value)
  {
    if (value == "mark")
      return run_modes::mark;
    if (value == "sweep")
      return run_modes::sweep;
    if (value == "both")
      return run_modes::both;
    throw validation_error(fmt::format("unknown mode '{}', expected mark, sweep or both", value));
  }

  /**
   * Parse storage type
   *
   * @param value
   * @return storage_types
   */
  inline storage_types parse_storage_type(const std::string_view value)
  {
    if (value == "s3")
      return storage_types::s3;
    if (value == "azure")
      return storage_types::azure;
    if (value == "local")
      return storage_types::local;
    throw validation_error(fmt::format("unknown storage type '{}'", value));
  }

  /**
   * Head of a key list for audit records
   *
   * @param keys
   * @param limit
   * @return std::string
   */
  inline std::string join_head(const std::vector<std::string> &keys, const std::size_t limit)
  {
    const auto _count = std::min(limit, keys.size());
    return fmt::format("{}", fmt::join(keys.begin(), keys.begin() + static_cast<std::ptrdiff_t>(_count), ", "));
  }
} // namespace reclaim

#endif // RECLAIM_UTILS_HPP
