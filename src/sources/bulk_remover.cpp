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

#include <reclaim/bulk_remover.hpp>

#include <reclaim/utils.hpp>

namespace reclaim
{
  void log_remove_keys(const storage_types type, const std::vector<std::string> &names)
  {
    fmt::print(
      "[{}] [{:%Y-%m-%d %H:%M:%S}] REMOVE KEYS count={} keys={}\n",
      to_string(type),
      std::chrono::system_clock::now(),
      names.size(),
      join_head(names, audit_keys_limit));
  }
} // namespace reclaim
