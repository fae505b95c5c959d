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

#ifndef RECLAIM_BULK_REMOVER_HPP
#define RECLAIM_BULK_REMOVER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <reclaim/types.hpp>

namespace reclaim
{
  /**
   * Keys shown in the audit record of every bulk delete
   */
  constexpr std::size_t audit_keys_limit = 100;

  /**
   * Delete result, in terms of the logical keys that were requested
   */
  struct delete_result
  {
    /**
     * Confirmed deleted by the backend
     */
    std::vector<std::string> deleted_;

    /**
     * Reported missing by the backend
     */
    std::vector<std::string> absent_;

    /**
     * Error of a call that failed as a whole
     */
    std::string error_;
  };

  /**
   * Bulk remover
   *
   * One implementation per backend family. delete_objects never throws, the
   * backend response is authoritative and unconfirmed keys are not deleted.
   */
  class bulk_remover
  {
  public:
    /**
     * Destructor
     */
    virtual ~bulk_remover() = default;

    /**
     * Max objects per backend call
     *
     * @return std::size_t
     */
    [[nodiscard]] virtual std::size_t get_max_bulk_size() const = 0;

    /**
     * Construct backend native key names
     *
     * @param keys
     * @param storage_namespace
     * @return std::vector<std::string>
     */
    [[nodiscard]] virtual std::vector<std::string>
    construct_remove_key_names(const std::vector<std::string> &keys, const std::string &storage_namespace) const = 0;

    /**
     * Delete objects, one backend call
     *
     * @param keys
     * @param storage_namespace
     * @return delete_result
     */
    virtual delete_result delete_objects(const std::vector<std::string> &keys, const std::string &storage_namespace) = 0;

    /**
     * Storage type
     *
     * @return storage_types
     */
    [[nodiscard]] virtual storage_types type() const = 0;
  };

  /**
   * Log the audit record of a bulk delete
   *
   * @param type
   * @param names
   */
  void log_remove_keys(storage_types type, const std::vector<std::string> &names);
} // namespace reclaim

#endif // RECLAIM_BULK_REMOVER_HPP
