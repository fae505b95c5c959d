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

#ifndef RECLAIM_TYPES_HPP
#define RECLAIM_TYPES_HPP

#include <cstdint>
#include <string>

namespace reclaim
{
  /**
   * Object address
   */
  using object_address = std::string;

  /**
   * Run modes
   */
  enum class run_modes : std::uint8_t
  {
    mark,
    sweep,
    both,
  };

  /**
   * Storage types
   */
  enum class storage_types : std::uint8_t
  {
    s3,
    azure,
    local,
  };
} // namespace reclaim

#endif // RECLAIM_TYPES_HPP
