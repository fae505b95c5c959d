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

#ifndef RECLAIM_RUN_CONTEXT_HPP
#define RECLAIM_RUN_CONTEXT_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace reclaim
{
  /**
   * Run context
   *
   * Cancellation and deadline shared by every call of one run.
   */
  class run_context
  {
  public:
    /**
     * Constructor
     */
    run_context() = default;

    /**
     * Constructor with deadline
     *
     * @param deadline
     */
    explicit run_context(std::chrono::steady_clock::time_point deadline);

    run_context(const run_context &) = delete;
    run_context &operator=(const run_context &) = delete;

    /**
     * Cancel, wakes every pending sleep
     */
    void cancel();

    /**
     * Done, cancelled or past its deadline
     *
     * @return bool
     */
    [[nodiscard]] bool done() const;

    /**
     * Error, "context canceled" or "context deadline exceeded" once done
     *
     * @return std::optional<std::string>
     */
    [[nodiscard]] std::optional<std::string> error() const;

    /**
     * Sleep for
     *
     * @param duration
     * @return bool false when interrupted by cancellation or the deadline
     */
    bool sleep_for(std::chrono::milliseconds duration);

  private:
    /**
     * Mutex
     */
    mutable std::mutex mutex_;

    /**
     * Condition
     */
    std::condition_variable condition_;

    /**
     * Cancelled
     */
    bool cancelled_ = false;

    /**
     * Deadline
     */
    std::optional<std::chrono::steady_clock::time_point> deadline_;
  };
} // namespace reclaim

#endif // RECLAIM_RUN_CONTEXT_HPP
