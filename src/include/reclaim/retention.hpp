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

#ifndef RECLAIM_RETENTION_HPP
#define RECLAIM_RETENTION_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <reclaim/time.hpp>

namespace reclaim
{
  /**
   * Retention rule
   */
  struct retention_rule
  {
    /**
     * Branch ID
     */
    std::string branch_id_;

    /**
     * Retention days
     */
    std::int64_t retention_days_ = 0;
  };

  /**
   * Garbage collection rules
   *
   * Snapshot fetched once per run. Branch ids are unique once validated.
   */
  struct gc_rules
  {
    /**
     * Branch rules
     */
    std::vector<retention_rule> branches_;

    /**
     * Default retention days
     */
    std::int64_t default_retention_days_ = 0;
  };

  /**
   * Validate rules
   *
   * Throws validation_error on a duplicated branch id or a negative retention.
   *
   * @param rules
   */
  void validate_rules(const gc_rules &rules);

  /**
   * Effective retention days
   *
   * @param rules
   * @param branch_id
   * @return int64_t branch override or the default
   */
  std::int64_t effective_retention_days(const gc_rules &rules, std::string_view branch_id);

  /**
   * Is expired
   *
   * @param reference
   * @param retention_days
   * @param now
   * @return bool true when now - reference >= retention_days, exact elapsed time
   */
  bool is_expired(timestamp reference, std::int64_t retention_days, timestamp now);
} // namespace reclaim

#endif // RECLAIM_RETENTION_HPP
