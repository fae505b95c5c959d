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

#ifndef RECLAIM_APP_HPP
#define RECLAIM_APP_HPP

#include <boost/asio/io_context.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <memory>

#include <reclaim/program_parameters.hpp>
#include <reclaim/run_context.hpp>

namespace reclaim
{
  /**
   * App
   */
  class app : public std::enable_shared_from_this<app>
  {
  public:
    /**
     * IO Context, signals only
     */
    boost::asio::io_context ioc_;

    /**
     * Program options
     */
    program_parameters program_options_;

    /**
     * Run ID
     */
    boost::uuids::uuid id_ = boost::uuids::random_generator()();

    /**
     * Run context
     */
    std::unique_ptr<run_context> context_;

    /**
     * Construct
     *
     * @param program_options
     */
    explicit app(const program_parameters &program_options);

    /**
     * Run
     *
     * Marks, sweeps or both. Fatal errors propagate as exceptions, partial
     * sweep failures are reported and do not fail the run.
     *
     * @return int
     */
    int run();

    /**
     * Stop, cancels the run context
     *
     * @return void
     */
    void stop();
  };
} // namespace reclaim

#endif // RECLAIM_APP_HPP
