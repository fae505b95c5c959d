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

#include <reclaim/memory_commit_store.hpp>

#include <fmt/format.h>
#include <reclaim/exceptions.hpp>

namespace reclaim
{
  bool memory_commit_store::add_commit(commit value)
  {
    return commits_.insert(std::move(value)).second;
  }

  bool memory_commit_store::add_tree(std::string id, tree entries)
  {
    return trees_.insert(tree_record{std::move(id), std::move(entries)}).second;
  }

  void memory_commit_store::set_branch(const std::string &name, const std::string &tip)
  {
    branches_[name] = tip;
  }

  bool memory_commit_store::delete_branch(const std::string &name, const std::optional<timestamp> deleted_at)
  {
    const auto _it = branches_.find(name);
    if (_it == branches_.end())
      return false;

    dangling_.push_back(dangling_root{_it->second, deleted_at, name});
    branches_.erase(_it);
    return true;
  }

  void memory_commit_store::add_dangling_root(dangling_root root)
  {
    dangling_.push_back(std::move(root));
  }

  std::vector<branch> memory_commit_store::branches() const
  {
    std::vector<branch> _branches;
    _branches.reserve(branches_.size());
    for (const auto &[_name, _tip] : branches_)
      _branches.push_back(branch{_name, _tip});
    return _branches;
  }

  std::vector<dangling_root> memory_commit_store::dangling_roots() const
  {
    return dangling_;
  }

  const commit &memory_commit_store::get_commit(const std::string &id) const
  {
    const auto &_index = commits_.get<tag_by_id>();
    const auto _it = _index.find(id);
    if (_it == _index.end())
      throw ancestry_read_error(fmt::format("commit {} not found", id));
    return *_it;
  }

  const tree &memory_commit_store::get_tree(const std::string &id) const
  {
    const auto &_index = trees_.get<tag_by_id>();
    const auto _it = _index.find(id);
    if (_it == _index.end())
      throw ancestry_read_error(fmt::format("tree {} not found", id));
    return _it->entries_;
  }
} // namespace reclaim
