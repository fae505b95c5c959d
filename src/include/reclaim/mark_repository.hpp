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

#ifndef RECLAIM_MARK_REPOSITORY_HPP
#define RECLAIM_MARK_REPOSITORY_HPP

#include <filesystem>
#include <string>

#include <reclaim/mark_manifest.hpp>

namespace reclaim
{
  /**
   * Mark repository
   *
   * Manifests live at <directory>/<mark id>.manifest, reports next to them.
   */
  class mark_repository
  {
  public:
    /**
     * Constructor
     *
     * @param directory
     */
    explicit mark_repository(std::filesystem::path directory);

    /**
     * Save manifest, replacing a previous one with the same mark id
     *
     * @param manifest
     */
    void save(const mark_manifest &manifest) const;

    /**
     * Load manifest, throws mark_not_found
     *
     * @param mark_id
     * @return mark_manifest
     */
    [[nodiscard]] mark_manifest load(const std::string &mark_id) const;

    /**
     * Exists
     *
     * @param mark_id
     * @return bool
     */
    [[nodiscard]] bool exists(const std::string &mark_id) const;

    /**
     * Save sweep report
     *
     * @param report
     * @return std::filesystem::path
     */
    std::filesystem::path save_report(const sweep_report &report) const;

    /**
     * Manifest path
     *
     * @param mark_id
     * @return std::filesystem::path
     */
    [[nodiscard]] std::filesystem::path manifest_path(const std::string &mark_id) const;

    /**
     * Validate mark id, throws validation_error
     *
     * @param mark_id
     */
    static void validate_mark_id(const std::string &mark_id);

  private:
    /**
     * Directory
     */
    std::filesystem::path directory_;
  };
} // namespace reclaim

#endif // RECLAIM_MARK_REPOSITORY_HPP
