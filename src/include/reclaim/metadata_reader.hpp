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

#ifndef RECLAIM_METADATA_READER_HPP
#define RECLAIM_METADATA_READER_HPP

#include <istream>
#include <memory>
#include <string>

#include <reclaim/memory_commit_store.hpp>
#include <reclaim/retention.hpp>
#include <reclaim/retry_client.hpp>
#include <reclaim/run_context.hpp>

namespace reclaim
{
  /**
   * Repository metadata
   */
  struct repository_metadata
  {
    /**
     * Rules
     */
    gc_rules rules_;

    /**
     * Store
     */
    std::shared_ptr<memory_commit_store> store_ = std::make_shared<memory_commit_store>();
  };

  /**
   * Read metadata export
   *
   * One record per line, fields separated by whitespace:
   *
   *   default_retention <days>
   *   rule <branch> <days>
   *   branch <name> <commit>
   *   dangling <commit> [<deleted-at-seconds> [<former-branch>]]
   *   commit <id> <created-at-seconds> <tree> [<parent>...]
   *   tree <id>
   *   entry <tree> <path> <address>
   *
   * Blank lines and lines starting with '#' are skipped. Rules are not
   * validated here.
   *
   * @param in
   * @return repository_metadata
   */
  repository_metadata read_metadata(std::istream &in);

  /**
   * Read metadata export from file
   *
   * @param filename
   * @return repository_metadata
   */
  repository_metadata read_metadata_file(const std::string &filename);

  /**
   * Read metadata export served by the control plane
   *
   * Throws transport_error when the export cannot be fetched.
   *
   * @param client
   * @param context
   * @param url
   * @return repository_metadata
   */
  repository_metadata read_metadata_url(retry_client &client, run_context &context, const std::string &url);
} // namespace reclaim

#endif // RECLAIM_METADATA_READER_HPP
