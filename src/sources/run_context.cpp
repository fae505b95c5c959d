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

#include <reclaim/run_context.hpp>

namespace reclaim
{
  run_context::run_context(const std::chrono::steady_clock::time_point deadline) : deadline_(deadline)
  {
  }

  void run_context::cancel()
  {
    {
      std::scoped_lock _guard(mutex_);
      cancelled_ = true;
    }
    condition_.notify_all();
  }

  bool run_context::done() const
  {
    return error().has_value();
  }

  std::optional<std::string> run_context::error() const
  {
    std::scoped_lock _guard(mutex_);
    if (cancelled_)
      return "context canceled";
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_)
      return "context deadline exceeded";
    return std::nullopt;
  }

  bool run_context::sleep_for(const std::chrono::milliseconds duration)
  {
    auto _until = std::chrono::steady_clock::now() + duration;

    std::unique_lock _lock(mutex_);
    const bool _bounded = deadline_ && *deadline_ < _until;
    if (_bounded)
      _until = *deadline_;

    if (condition_.wait_until(_lock, _until, [this] { return cancelled_; }))
      return false;
    return !_bounded;
  }
} // namespace reclaim
