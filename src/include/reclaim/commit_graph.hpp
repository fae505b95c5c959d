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

#ifndef RECLAIM_COMMIT_GRAPH_HPP
#define RECLAIM_COMMIT_GRAPH_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <reclaim/time.hpp>
#include <reclaim/types.hpp>

namespace reclaim
{
  /**
   * Tree, logical path to object address
   */
  using tree = std::map<std::string, object_address>;

  /**
   * Commit
   */
  struct commit
  {
    /**
     * ID
     */
    std::string id_;

    /**
     * Parents
     */
    std::vector<std::string> parents_;

    /**
     * Created at
     */
    timestamp created_at_{};

    /**
     * Tree ID
     */
    std::string tree_id_;
  };

  /**
   * Branch
   */
  struct branch
  {
    /**
     * Name
     */
    std::string name_;

    /**
     * Tip commit ID
     */
    std::string tip_;
  };

  /**
   * Dangling root, former tip of a deleted branch
   */
  struct dangling_root
  {
    /**
     * Commit ID
     */
    std::string commit_id_;

    /**
     * Deleted at, when the deletion time was recorded
     */
    std::optional<timestamp> deleted_at_;

    /**
     * Former branch name, informative only
     */
    std::string branch_name_;
  };

  /**
   * Commit store
   *
   * Read side of the versioning storage. Implementations must allow concurrent
   * reads, the marker walks several branches at once.
   */
  class commit_store
  {
  public:
    /**
     * Destructor
     */
    virtual ~commit_store() = default;

    /**
     * Branches that currently exist
     *
     * @return std::vector<branch>
     */
    [[nodiscard]] virtual std::vector<branch> branches() const = 0;

    /**
     * Dangling roots left by deleted branches
     *
     * @return std::vector<dangling_root>
     */
    [[nodiscard]] virtual std::vector<dangling_root> dangling_roots() const = 0;

    /**
     * Get commit, throws ancestry_read_error when it cannot be read
     *
     * @param id
     * @return const commit &
     */
    [[nodiscard]] virtual const commit &get_commit(const std::string &id) const = 0;

    /**
     * Get tree, throws ancestry_read_error when it cannot be read
     *
     * @param id
     * @return const tree &
     */
    [[nodiscard]] virtual const tree &get_tree(const std::string &id) const = 0;
  };
} // namespace reclaim

#endif // RECLAIM_COMMIT_GRAPH_HPP
