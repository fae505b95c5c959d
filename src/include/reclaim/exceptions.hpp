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

#ifndef RECLAIM_EXCEPTIONS_HPP
#define RECLAIM_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace reclaim
{
  /**
   * Malformed rules or run parameters
   */
  struct validation_error final : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /**
   * Commit or tree unreadable during an ancestry walk
   */
  struct ancestry_read_error final : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /**
   * Sweep requested for an unknown mark
   */
  struct mark_not_found final : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /**
   * Manifest, report or metadata file could not be read or written
   */
  struct serialize_error final : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /**
   * Storage client call failed as a whole
   */
  struct backend_error final : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /**
   * Transport error
   */
  struct transport_error final : std::runtime_error
  {
    /**
     * Constructor
     *
     * @param message
     * @param redirect_limit
     */
    explicit transport_error(const std::string &message, const bool redirect_limit = false) :
        std::runtime_error(message), redirect_limit_(redirect_limit)
    {
    }

    /**
     * Redirect limit was reached
     */
    bool redirect_limit_ = false;
  };
} // namespace reclaim

#endif // RECLAIM_EXCEPTIONS_HPP
