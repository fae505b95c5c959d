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

#ifndef RECLAIM_BULK_REMOVER_FACTORY_HPP
#define RECLAIM_BULK_REMOVER_FACTORY_HPP

#include <chrono>
#include <memory>
#include <string>

#include <reclaim/bulk_remover.hpp>
#include <reclaim/run_context.hpp>

namespace reclaim
{
  /**
   * Bulk remover options
   */
  struct bulk_remover_options
  {
    /**
     * Storage namespace
     */
    std::string storage_namespace_;

    /**
     * Endpoint override, an S3-compatible service or an Azure emulator
     */
    std::string endpoint_;

    /**
     * AWS region
     */
    std::string region_ = "us-east-1";

    /**
     * Azure shared access signature
     */
    std::string sas_token_;

    /**
     * Retries after the first attempt
     */
    int retry_max_ = 4;

    /**
     * Minimum wait
     */
    std::chrono::milliseconds wait_min_{200};

    /**
     * Maximum wait
     */
    std::chrono::milliseconds wait_max_{5000};

    /**
     * Context, required by s3, consulted before each retry
     */
    const run_context *context_ = nullptr;
  };

  /**
   * Make bulk remover, throws validation_error
   *
   * An s3 remover needs a live aws_api.
   *
   * @param type
   * @param options
   * @return std::unique_ptr<bulk_remover>
   */
  std::unique_ptr<bulk_remover> make_bulk_remover(storage_types type, const bulk_remover_options &options);
} // namespace reclaim

#endif // RECLAIM_BULK_REMOVER_FACTORY_HPP
