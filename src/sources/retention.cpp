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

#include <reclaim/retention.hpp>

#include <cstdint>
#include <fmt/format.h>
#include <reclaim/exceptions.hpp>
#include <unordered_set>

namespace reclaim
{
  void validate_rules(const gc_rules &rules)
  {
    if (rules.default_retention_days_ < 0)
      throw validation_error(fmt::format("negative default retention days: {}", rules.default_retention_days_));

    std::unordered_set<std::string_view> _seen;
    for (const auto &_rule : rules.branches_)
    {
      if (_rule.branch_id_.empty())
        throw validation_error("retention rule with an empty branch id");
      if (_rule.retention_days_ < 0)
        throw validation_error(
          fmt::format("negative retention days for branch {}: {}", _rule.branch_id_, _rule.retention_days_));
      if (!_seen.insert(_rule.branch_id_).second)
        throw validation_error(fmt::format("duplicate retention rule for branch {}", _rule.branch_id_));
    }
  }

  std::int64_t effective_retention_days(const gc_rules &rules, const std::string_view branch_id)
  {
    for (const auto &_rule : rules.branches_)
    {
      if (_rule.branch_id_ == branch_id)
        return _rule.retention_days_;
    }
    return rules.default_retention_days_;
  }

  bool is_expired(const timestamp reference, const std::int64_t retention_days, const timestamp now)
  {
    if (now < reference)
      return false;
    if (retention_days <= 0)
      return true;

    // Elapsed ticks in unsigned arithmetic, any two time points fit.
    const auto _elapsed = static_cast<std::uint64_t>(now.time_since_epoch().count()) -
                          static_cast<std::uint64_t>(reference.time_since_epoch().count());
    constexpr auto _ticks_per_day =
      static_cast<std::uint64_t>(std::chrono::duration_cast<timestamp::duration>(std::chrono::days(1)).count());
    return _elapsed / _ticks_per_day >= static_cast<std::uint64_t>(retention_days);
  }
} // namespace reclaim
