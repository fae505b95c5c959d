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

#include <reclaim/retry_policy.hpp>

#include <algorithm>

namespace reclaim
{
  retry_policy::retry_policy(const std::chrono::milliseconds wait_min, const std::chrono::milliseconds wait_max) :
      wait_min_(wait_min), wait_max_(std::max(wait_min, wait_max))
  {
  }

  retry_decision retry_policy::should_retry(
    const run_context &context,
    const std::optional<unsigned> status,
    const std::optional<transport_failure> &failure)
  {
    if (auto _error = context.error())
      return {false, std::move(_error)};

    if (failure)
    {
      if (failure->redirect_limit_)
        return {false, failure->message_};
      return {true, std::nullopt};
    }

    if (status && is_retryable_status(*status))
      return {true, std::nullopt};

    return {false, std::nullopt};
  }

  bool retry_policy::is_retryable_status(const unsigned status)
  {
    return status == 429 || (status >= 500 && status <= 599);
  }

  std::chrono::milliseconds retry_policy::backoff(const int attempt) const
  {
    auto _wait = wait_min_;
    for (int _i = 0; _i < attempt && _wait < wait_max_; ++_i)
      _wait *= 2;
    return std::min(_wait, wait_max_);
  }
} // namespace reclaim
