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

#ifndef RECLAIM_SERVICES_SWEEP_EXECUTOR_HPP
#define RECLAIM_SERVICES_SWEEP_EXECUTOR_HPP

#include <boost/uuid/uuid.hpp>
#include <string>
#include <vector>

#include <reclaim/bulk_remover.hpp>
#include <reclaim/mark_repository.hpp>
#include <reclaim/run_context.hpp>

namespace reclaim
{
  /**
   * Sweep executor
   *
   * Deletes the addresses of a persisted manifest, never recomputes
   * reachability. Batches run concurrently and are bounded by the remover's
   * bulk size. Once the context is done no further batch is issued, batches
   * already in flight complete.
   */
  class sweep_executor
  {
  public:
    /**
     * Constructor
     *
     * @param repository
     * @param remover
     * @param storage_namespace
     * @param run_id
     * @param context
     * @param threads
     */
    sweep_executor(
      const mark_repository &repository,
      bulk_remover &remover,
      std::string storage_namespace,
      boost::uuids::uuid run_id,
      run_context &context,
      int threads = 1);

    /**
     * Sweep, throws mark_not_found
     *
     * @param mark_id
     * @return sweep_report
     */
    sweep_report sweep(const std::string &mark_id);

    /**
     * Split addresses into batches
     *
     * @param addresses
     * @param size
     * @return std::vector<std::vector<object_address>>
     */
    static std::vector<std::vector<object_address>> make_batches(const std::vector<object_address> &addresses, std::size_t size);

  private:
    /**
     * Repository
     */
    const mark_repository &repository_;

    /**
     * Remover
     */
    bulk_remover &remover_;

    /**
     * Storage namespace
     */
    std::string storage_namespace_;

    /**
     * Run ID
     */
    boost::uuids::uuid run_id_;

    /**
     * Context
     */
    run_context &context_;

    /**
     * Threads
     */
    int threads_;
  };
} // namespace reclaim

#endif // RECLAIM_SERVICES_SWEEP_EXECUTOR_HPP
