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

#ifndef RECLAIM_PROGRAM_PARAMETERS_HPP
#define RECLAIM_PROGRAM_PARAMETERS_HPP

#include <cstdint>
#include <string>

namespace reclaim
{
  struct program_parameters
  {
    /**
     * Mode, mark, sweep or both
     */
    std::string mode_ = "both";

    /**
     * Mark ID
     */
    std::string mark_id_;

    /**
     * Metadata export, a file or an http:// url
     */
    std::string metadata_ = "repository.meta";

    /**
     * Marks directory
     */
    std::string marks_dir_ = "marks";

    /**
     * Storage type
     */
    std::string storage_type_ = "local";

    /**
     * Storage namespace
     */
    std::string storage_namespace_;

    /**
     * Endpoint
     */
    std::string endpoint_;

    /**
     * AWS region
     */
    std::string region_ = "us-east-1";

    /**
     * SAS token
     */
    std::string sas_token_;

    /**
     * Threads
     */
    int threads_ = 1;

    /**
     * Evaluation time in seconds since epoch, 0 means now
     */
    std::int64_t now_ = 0;

    /**
     * Retry max
     */
    int retry_max_ = 4;

    /**
     * Retry wait min
     */
    int retry_wait_min_ms_ = 200;

    /**
     * Retry wait max
     */
    int retry_wait_max_ms_ = 5000;

    /**
     * Deadline in seconds, 0 means none
     */
    int deadline_s_ = 0;
  };
} // namespace reclaim

#endif // RECLAIM_PROGRAM_PARAMETERS_HPP
