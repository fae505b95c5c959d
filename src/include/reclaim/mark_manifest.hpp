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

#ifndef RECLAIM_MARK_MANIFEST_HPP
#define RECLAIM_MARK_MANIFEST_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include <reclaim/time.hpp>
#include <reclaim/types.hpp>

namespace reclaim
{
  /**
   * Mark manifest
   *
   * Never mutated once persisted, a fresh mark produces a new manifest.
   */
  struct mark_manifest
  {
    /**
     * Mark ID
     */
    std::string mark_id_;

    /**
     * Created at
     */
    timestamp created_at_{};

    /**
     * Candidate addresses, sorted
     */
    std::vector<object_address> addresses_;
  };

  /**
   * Sweep report
   */
  struct sweep_report
  {
    /**
     * Mark ID
     */
    std::string mark_id_;

    /**
     * Removed
     */
    std::vector<object_address> removed_;

    /**
     * Already absent on the backend
     */
    std::vector<object_address> absent_;

    /**
     * Failed, including batches never issued because of cancellation
     */
    std::vector<object_address> failed_;
  };

  /**
   * Dump manifest
   *
   * @param manifest
   * @param out
   */
  void dump_manifest(const mark_manifest &manifest, std::ostream &out);

  /**
   * Restore manifest
   *
   * @param in
   * @return mark_manifest
   */
  mark_manifest restore_manifest(std::istream &in);

  /**
   * Dump report as text
   *
   * @param report
   * @param out
   */
  void dump_report(const sweep_report &report, std::ostream &out);
} // namespace reclaim

#endif // RECLAIM_MARK_MANIFEST_HPP
