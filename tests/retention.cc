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

#include <gtest/gtest.h>

#include <reclaim/exceptions.hpp>
#include <reclaim/retention.hpp>

#include <limits>
#include <stdexcept>

using namespace reclaim;

TEST(Retention, EffectiveRetentionUsesOverrideOrDefault)
{
  const gc_rules _rules{.branches_ = {{"main", 7}, {"dev", 0}}, .default_retention_days_ = 21};

  ASSERT_EQ(effective_retention_days(_rules, "main"), 7);
  ASSERT_EQ(effective_retention_days(_rules, "dev"), 0);
  ASSERT_EQ(effective_retention_days(_rules, "feature"), 21);
  ASSERT_EQ(effective_retention_days(_rules, ""), 21);
}

TEST(Retention, ExpiredAtExactBoundary)
{
  const auto _reference = from_seconds(1'000'000);

  ASSERT_TRUE(is_expired(_reference, 1, _reference + std::chrono::days(1)));
  ASSERT_FALSE(is_expired(_reference, 1, _reference + std::chrono::days(1) - std::chrono::seconds(1)));
  ASSERT_TRUE(is_expired(_reference, 1, _reference + std::chrono::days(2)));
}

TEST(Retention, ZeroDaysExpiresImmediately)
{
  const auto _reference = from_seconds(1'000'000);

  ASSERT_TRUE(is_expired(_reference, 0, _reference));
}

TEST(Retention, ElapsedTimeIsNotCalendarTruncated)
{
  // 23:00 to 22:59 two calendar days later is still short of two days.
  const auto _reference = from_seconds(23 * 3600);
  const auto _now = _reference + std::chrono::hours(47) + std::chrono::minutes(59);

  ASSERT_FALSE(is_expired(_reference, 2, _now));
  ASSERT_TRUE(is_expired(_reference, 1, _now));
}

TEST(Retention, LongRetentionDoesNotWrapAround)
{
  const auto _now = from_seconds(1'700'000'000);
  const auto _reference = _now - std::chrono::hours(1);

  const std::initializer_list<std::int64_t> _retentions{36'500, 106'752, 200'000, 999'999, 36'500'000, std::numeric_limits<std::int64_t>::max()};

  for (const auto _days : _retentions)
    ASSERT_FALSE(is_expired(_reference, _days, _now)) << _days;
}

TEST(Retention, ExtremeTimePointsCompareWithoutOverflow)
{
  const auto _earliest = timestamp::min();
  const auto _latest = timestamp::max();

  ASSERT_TRUE(is_expired(_earliest, 1, _latest));
  ASSERT_FALSE(is_expired(_latest, 0, _earliest));
  ASSERT_FALSE(is_expired(_earliest, std::numeric_limits<std::int64_t>::max(), _latest));
}

TEST(Retention, KeepForeverRulesAreAccepted)
{
  const gc_rules _rules{.branches_ = {{"main", 999'999}}, .default_retention_days_ = 36'500'000};

  ASSERT_NO_THROW(validate_rules(_rules));
}

TEST(Retention, OutOfRangeSecondsAreRejected)
{
  ASSERT_TRUE(in_timestamp_range(1'700'000'000));
  ASSERT_FALSE(in_timestamp_range(std::numeric_limits<std::int64_t>::max()));
  ASSERT_FALSE(in_timestamp_range(std::numeric_limits<std::int64_t>::min()));
  ASSERT_THROW(static_cast<void>(from_seconds(std::numeric_limits<std::int64_t>::max())), std::out_of_range);
}

TEST(Retention, ValidRulesAreAccepted)
{
  const gc_rules _rules{.branches_ = {{"main", 7}, {"dev", 0}}, .default_retention_days_ = 0};

  ASSERT_NO_THROW(validate_rules(_rules));
}

TEST(Retention, DuplicateBranchIsRejected)
{
  const gc_rules _rules{.branches_ = {{"main", 7}, {"main", 3}}, .default_retention_days_ = 1};

  ASSERT_THROW(validate_rules(_rules), validation_error);
}

TEST(Retention, NegativeRetentionIsRejected)
{
  const gc_rules _branch{.branches_ = {{"main", -1}}, .default_retention_days_ = 1};
  const gc_rules _default{.branches_ = {}, .default_retention_days_ = -1};

  ASSERT_THROW(validate_rules(_branch), validation_error);
  ASSERT_THROW(validate_rules(_default), validation_error);
}

TEST(Retention, EmptyBranchIdIsRejected)
{
  const gc_rules _rules{.branches_ = {{"", 1}}, .default_retention_days_ = 1};

  ASSERT_THROW(validate_rules(_rules), validation_error);
}
