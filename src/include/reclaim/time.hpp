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

#ifndef RECLAIM_TIME_HPP
#define RECLAIM_TIME_HPP

#include <chrono>
#include <cstdint>
#include <fmt/format.h>
#include <stdexcept>

namespace reclaim
{
  /**
   * Timestamp
   */
  using timestamp = std::chrono::system_clock::time_point;

  /**
   * Largest magnitude in seconds a timestamp holds
   */
  constexpr std::int64_t max_timestamp_seconds =
    std::chrono::duration_cast<std::chrono::seconds>(timestamp::duration::max()).count();

  /**
   * In timestamp range
   *
   * @param seconds since epoch
   * @return bool
   */
  constexpr bool in_timestamp_range(const std::int64_t seconds)
  {
    return seconds >= -max_timestamp_seconds && seconds <= max_timestamp_seconds;
  }

  /**
   * From seconds
   *
   * Throws std::out_of_range when the value does not fit a timestamp.
   *
   * @param seconds since epoch
   * @return timestamp
   */
  inline timestamp from_seconds(const std::int64_t seconds)
  {
    if (!in_timestamp_range(seconds))
      throw std::out_of_range(fmt::format("timestamp {} is out of range", seconds));
    return timestamp{std::chrono::duration_cast<timestamp::duration>(std::chrono::seconds(seconds))};
  }

  /**
   * To seconds
   *
   * @param point
   * @return int64_t seconds since epoch
   */
  inline std::int64_t to_seconds(const timestamp point)
  {
    return std::chrono::duration_cast<std::chrono::seconds>(point.time_since_epoch()).count();
  }

  /**
   * Days ago
   *
   * @param now
   * @param days
   * @return timestamp
   */
  inline timestamp days_before(const timestamp now, const std::int64_t days)
  {
    return now - std::chrono::days(days);
  }
} // namespace reclaim

#endif // RECLAIM_TIME_HPP
