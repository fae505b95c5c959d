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

#ifndef RECLAIM_TEST_FIXTURES_HPP
#define RECLAIM_TEST_FIXTURES_HPP

#include <gtest/gtest.h>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <fstream>
#include <reclaim/memory_commit_store.hpp>
#include <reclaim/time.hpp>

using namespace reclaim;

/**
 * Seconds in a day
 */
constexpr std::int64_t day_in_seconds = 86400;

/**
 * Temporary directory removed on destruction
 */
class temporary_directory
{
public:
  temporary_directory() :
      path_(std::filesystem::temp_directory_path() / ("reclaim-" + to_string(boost::uuids::random_generator()())))
  {
    std::filesystem::create_directories(path_);
  }

  temporary_directory(const temporary_directory &) = delete;
  temporary_directory &operator=(const temporary_directory &) = delete;

  ~temporary_directory()
  {
    std::error_code _ec;
    std::filesystem::remove_all(path_, _ec);
  }

  [[nodiscard]] const std::filesystem::path &path() const
  {
    return path_;
  }

  /**
   * Write a file below the directory, creating its parents
   */
  void write(const std::string &relative, const std::string &content = "data") const
  {
    const auto _path = path_ / relative;
    std::filesystem::create_directories(_path.parent_path());
    std::ofstream _out(_path, std::ios::binary);
    _out << content;
  }

private:
  std::filesystem::path path_;
};

/**
 * Adds a commit together with its tree
 */
inline void add_commit_with_tree(
  memory_commit_store &store,
  const std::string &id,
  const timestamp created_at,
  const tree &entries,
  std::vector<std::string> parents = {})
{
  ASSERT_TRUE(store.add_tree("tree-" + id, entries));
  ASSERT_TRUE(store.add_commit(commit{
    .id_ = id,
    .parents_ = std::move(parents),
    .created_at_ = created_at,
    .tree_id_ = "tree-" + id,
  }));
}

#endif // RECLAIM_TEST_FIXTURES_HPP
