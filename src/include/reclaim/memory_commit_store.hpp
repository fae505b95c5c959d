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

#ifndef RECLAIM_MEMORY_COMMIT_STORE_HPP
#define RECLAIM_MEMORY_COMMIT_STORE_HPP

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/tag.hpp>
#include <boost/multi_index_container.hpp>
#include <reclaim/commit_graph.hpp>

namespace reclaim
{
  /**
   * Tag: access by id
   */
  struct tag_by_id
  {
  };

  /**
   * Tree record
   */
  struct tree_record
  {
    /**
     * ID
     */
    std::string id_;

    /**
     * Entries
     */
    tree entries_;
  };

  /**
   * Commit arena keyed by id
   */
  using commit_index = boost::multi_index::multi_index_container<
    commit,
    boost::multi_index::indexed_by<boost::multi_index::hashed_unique<
      boost::multi_index::tag<tag_by_id>,
      boost::multi_index::member<commit, std::string, &commit::id_>>>>;

  /**
   * Tree arena keyed by id
   */
  using tree_index = boost::multi_index::multi_index_container<
    tree_record,
    boost::multi_index::indexed_by<boost::multi_index::hashed_unique<
      boost::multi_index::tag<tag_by_id>,
      boost::multi_index::member<tree_record, std::string, &tree_record::id_>>>>;

  /**
   * Memory commit store
   *
   * Populated once, then read concurrently. Mutators are not synchronized.
   */
  class memory_commit_store final : public commit_store
  {
  public:
    /**
     * Add commit
     *
     * @param value
     * @return bool false when the id already exists
     */
    bool add_commit(commit value);

    /**
     * Add tree
     *
     * @param id
     * @param entries
     * @return bool false when the id already exists
     */
    bool add_tree(std::string id, tree entries);

    /**
     * Create or move a branch
     *
     * @param name
     * @param tip
     */
    void set_branch(const std::string &name, const std::string &tip);

    /**
     * Delete branch, its tip becomes a dangling root
     *
     * @param name
     * @param deleted_at empty when the deletion time is unknown
     * @return bool false when the branch does not exist
     */
    bool delete_branch(const std::string &name, std::optional<timestamp> deleted_at);

    /**
     * Add dangling root
     *
     * @param root
     */
    void add_dangling_root(dangling_root root);

    [[nodiscard]] std::vector<branch> branches() const override;

    [[nodiscard]] std::vector<dangling_root> dangling_roots() const override;

    [[nodiscard]] const commit &get_commit(const std::string &id) const override;

    [[nodiscard]] const tree &get_tree(const std::string &id) const override;

    /**
     * Commit count
     *
     * @return std::size_t
     */
    [[nodiscard]] std::size_t commit_count() const
    {
      return commits_.size();
    }

  private:
    /**
     * Commits
     */
    commit_index commits_;

    /**
     * Trees
     */
    tree_index trees_;

    /**
     * Branches, name to tip
     */
    std::map<std::string, std::string> branches_;

    /**
     * Dangling roots
     */
    std::vector<dangling_root> dangling_;
  };
} // namespace reclaim

#endif // RECLAIM_MEMORY_COMMIT_STORE_HPP
