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

#include <reclaim/services/reachability_marker.hpp>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <exception>
#include <unordered_set>
#include <reclaim/utils.hpp>

namespace reclaim
{
  namespace
  {
    using address_set = std::unordered_set<object_address>;

    void record_deletion(walk_result &result, const object_address &address, const timestamp at)
    {
      auto &_event = result.held_[address];
      if (!_event || *_event < at)
        _event = at;
    }
  } // namespace

  reachability_marker::reachability_marker(
    const commit_store &store,
    gc_rules rules,
    const boost::uuids::uuid run_id,
    const int threads) :
      store_(store), rules_(std::move(rules)), run_id_(run_id), threads_(std::max(1, threads))
  {
  }

  walk_result reachability_marker::walk(const std::string &tip, const std::optional<timestamp> implicit_deletion) const
  {
    walk_result _result;
    std::unordered_map<std::string, address_set> _trees;
    const auto _addresses_of = [this, &_trees](const std::string &tree_id) -> const address_set &
    {
      if (const auto _it = _trees.find(tree_id); _it != _trees.end())
        return _it->second;

      address_set _addresses;
      for (const auto &[_path, _address] : store_.get_tree(tree_id))
        _addresses.insert(_address);
      return _trees.emplace(tree_id, std::move(_addresses)).first->second;
    };

    std::unordered_set<std::string> _visited;
    std::vector<std::string> _pending{tip};
    while (!_pending.empty())
    {
      const auto _id = std::move(_pending.back());
      _pending.pop_back();
      if (!_visited.insert(_id).second)
        continue;

      const auto &_commit = store_.get_commit(_id);
      const auto &_addresses = _addresses_of(_commit.tree_id_);
      for (const auto &_address : _addresses)
        _result.held_.try_emplace(_address);

      for (const auto &_parent_id : _commit.parents_)
      {
        const auto &_parent = store_.get_commit(_parent_id);
        for (const auto &_address : _addresses_of(_parent.tree_id_))
        {
          if (!_addresses.contains(_address))
            record_deletion(_result, _address, _commit.created_at_);
        }
        _pending.push_back(_parent_id);
      }
    }

    if (implicit_deletion)
    {
      for (const auto &_address : _addresses_of(store_.get_commit(tip).tree_id_))
        record_deletion(_result, _address, *implicit_deletion);
    }

    return _result;
  }

  mark_manifest reachability_marker::mark(const std::string &mark_id, const timestamp now) const
  {
    const auto _branches = store_.branches();
    const auto _dangling = store_.dangling_roots();

    fmt::print(
      "[{}] [{:%Y-%m-%d %H:%M:%S}] MARK STARTED mark_id={} branches={} dangling={}\n",
      to_string(run_id_),
      std::chrono::system_clock::now(),
      mark_id,
      _branches.size(),
      _dangling.size());

    address_set _retained;
    for (const auto &_branch : _branches)
    {
      for (const auto &[_path, _address] : store_.get_tree(store_.get_commit(_branch.tip_).tree_id_))
        _retained.insert(_address);
    }

    const auto _total = _branches.size() + _dangling.size();
    std::vector<walk_result> _walks(_total);
    std::vector<std::exception_ptr> _errors(_total);

    {
      boost::asio::thread_pool _pool(static_cast<std::size_t>(threads_));
      for (std::size_t _i = 0; _i < _branches.size(); ++_i)
      {
        boost::asio::post(
          _pool,
          [this, &_branches, &_walks, &_errors, _i]
          {
            try
            {
              _walks[_i] = walk(_branches[_i].tip_, std::nullopt);
              _walks[_i].name_ = _branches[_i].name_;
              _walks[_i].retention_days_ = effective_retention_days(rules_, _branches[_i].name_);
            }
            catch (const std::exception &)
            {
              _errors[_i] = std::current_exception();
            }
          });
      }

      for (std::size_t _i = 0; _i < _dangling.size(); ++_i)
      {
        const auto _slot = _branches.size() + _i;
        boost::asio::post(
          _pool,
          [this, &_dangling, &_walks, &_errors, _i, _slot]
          {
            try
            {
              const auto &_root = _dangling[_i];
              const auto _reference = _root.deleted_at_.value_or(store_.get_commit(_root.commit_id_).created_at_);
              _walks[_slot] = walk(_root.commit_id_, _reference);
              _walks[_slot].name_ = _root.branch_name_.empty() ? _root.commit_id_ : _root.branch_name_;
              _walks[_slot].retention_days_ = rules_.default_retention_days_;
            }
            catch (const std::exception &)
            {
              _errors[_slot] = std::current_exception();
            }
          });
      }
      _pool.join();
    }

    for (const auto &_error : _errors)
    {
      if (_error)
      {
        try
        {
          std::rethrow_exception(_error);
        }
        catch (const std::exception &e)
        {
          fmt::print(
            "[{}] [{:%Y-%m-%d %H:%M:%S}] MARK FAILED mark_id={} error={}\n",
            to_string(run_id_),
            std::chrono::system_clock::now(),
            mark_id,
            e.what());
          throw;
        }
      }
    }

    // An address stays a candidate only while every branch that held it is past its retention.
    std::unordered_map<object_address, bool> _verdicts;
    for (const auto &_walk : _walks)
    {
#ifndef NDEBUG
      fmt::print(
        "[{}] [{:%Y-%m-%d %H:%M:%S}] MARK WALKED branch={} retention_days={} held={}\n",
        to_string(run_id_),
        std::chrono::system_clock::now(),
        _walk.name_,
        _walk.retention_days_,
        _walk.held_.size());
#endif
      for (const auto &[_address, _deleted_at] : _walk.held_)
      {
        if (_retained.contains(_address))
          continue;

        const auto _expired = _deleted_at && is_expired(*_deleted_at, _walk.retention_days_, now);
        if (const auto [_it, _inserted] = _verdicts.try_emplace(_address, _expired); !_inserted)
          _it->second = _it->second && _expired;
      }
    }

    mark_manifest _manifest{.mark_id_ = mark_id, .created_at_ = now, .addresses_ = {}};
    for (const auto &[_address, _candidate] : _verdicts)
    {
      if (_candidate)
        _manifest.addresses_.push_back(_address);
    }
    std::ranges::sort(_manifest.addresses_);

    fmt::print(
      "[{}] [{:%Y-%m-%d %H:%M:%S}] MARK COMPLETED mark_id={} retained={} candidates={}\n",
      to_string(run_id_),
      std::chrono::system_clock::now(),
      mark_id,
      _retained.size(),
      _manifest.addresses_.size());

    return _manifest;
  }
} // namespace reclaim
