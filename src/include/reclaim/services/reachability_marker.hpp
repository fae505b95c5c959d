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

#ifndef RECLAIM_SERVICES_REACHABILITY_MARKER_HPP
#define RECLAIM_SERVICES_REACHABILITY_MARKER_HPP

#include <boost/uuid/uuid.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include <reclaim/commit_graph.hpp>
#include <reclaim/mark_manifest.hpp>
#include <reclaim/retention.hpp>

namespace reclaim
{
  /**
   * Walk result
   *
   * Every address a branch ever held, with the time of its most recent
   * deletion event on that branch. No value means the branch still holds it.
   */
  struct walk_result
  {
    /**
     * Branch or former branch name
     */
    std::string name_;

    /**
     * Retention days that apply to the walk
     */
    std::int64_t retention_days_ = 0;

    /**
     * Held addresses
     */
    std::unordered_map<object_address, std::optional<timestamp>> held_;
  };

  /**
   * Reachability marker
   */
  class reachability_marker
  {
  public:
    /**
     * Constructor
     *
     * @param store
     * @param rules validated rules
     * @param run_id
     * @param threads
     */
    reachability_marker(const commit_store &store, gc_rules rules, boost::uuids::uuid run_id, int threads = 1);

    /**
     * Mark
     *
     * Walks every branch and dangling root and returns the candidates. Throws
     * ancestry_read_error when any commit or tree cannot be read, no partial
     * manifest is produced.
     *
     * @param mark_id
     * @param now
     * @return mark_manifest
     */
    [[nodiscard]] mark_manifest mark(const std::string &mark_id, timestamp now) const;

    /**
     * Walk the ancestry of one tip
     *
     * @param tip
     * @param implicit_deletion deletion event applied to the tip tree, for dangling roots
     * @return walk_result
     */
    [[nodiscard]] walk_result walk(const std::string &tip, std::optional<timestamp> implicit_deletion) const;

  private:
    /**
     * Store
     */
    const commit_store &store_;

    /**
     * Rules
     */
    gc_rules rules_;

    /**
     * Run ID
     */
    boost::uuids::uuid run_id_;

    /**
     * Threads
     */
    int threads_;
  };
} // namespace reclaim

#endif // RECLAIM_SERVICES_REACHABILITY_MARKER_HPP
