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

#ifndef RECLAIM_RETRY_POLICY_HPP
#define RECLAIM_RETRY_POLICY_HPP

#include <chrono>
#include <optional>
#include <string>

#include <reclaim/run_context.hpp>

namespace reclaim
{
  /**
   * Transport failure observed by one attempt
   */
  struct transport_failure
  {
    /**
     * Message
     */
    std::string message_;

    /**
     * Redirect limit was reached
     */
    bool redirect_limit_ = false;
  };

  /**
   * Retry decision
   */
  struct retry_decision
  {
    /**
     * Retry
     */
    bool retry_ = false;

    /**
     * Error to surface, empty when the caller inspects the status normally
     */
    std::optional<std::string> error_;
  };

  /**
   * Retry policy
   *
   * Stateless, the attempt counter belongs to the call.
   */
  class retry_policy
  {
  public:
    /**
     * Constructor
     *
     * @param wait_min
     * @param wait_max
     */
    retry_policy(std::chrono::milliseconds wait_min, std::chrono::milliseconds wait_max);

    /**
     * Should retry
     *
     * @param context
     * @param status HTTP status when a response arrived
     * @param failure transport failure when none did
     * @return retry_decision
     */
    [[nodiscard]] static retry_decision should_retry(
      const run_context &context,
      std::optional<unsigned> status,
      const std::optional<transport_failure> &failure);

    /**
     * Retryable status, 429 or 5xx
     *
     * @param status
     * @return bool
     */
    [[nodiscard]] static bool is_retryable_status(unsigned status);

    /**
     * Backoff before the next attempt
     *
     * @param attempt zero based number of the attempt that just failed
     * @return std::chrono::milliseconds wait_min * 2^attempt, capped at wait_max
     */
    [[nodiscard]] std::chrono::milliseconds backoff(int attempt) const;

  private:
    /**
     * Minimum wait
     */
    std::chrono::milliseconds wait_min_;

    /**
     * Maximum wait
     */
    std::chrono::milliseconds wait_max_;
  };
} // namespace reclaim

#endif // RECLAIM_RETRY_POLICY_HPP
