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

#ifndef RECLAIM_REMOVERS_S3_BULK_REMOVER_HPP
#define RECLAIM_REMOVERS_S3_BULK_REMOVER_HPP

#include <reclaim/bulk_remover.hpp>
#include <reclaim/clients/s3_client.hpp>

namespace reclaim
{
  /**
   * S3 max bulk size
   */
  constexpr std::size_t s3_max_bulk_size = 1000;

  /**
   * S3 bulk remover
   */
  class s3_bulk_remover final : public bulk_remover
  {
  public:
    /**
     * Constructor
     *
     * @param client
     * @param storage_namespace s3://bucket/prefix/
     */
    s3_bulk_remover(std::shared_ptr<s3_client> client, const std::string &storage_namespace);

    [[nodiscard]] std::size_t get_max_bulk_size() const override;

    [[nodiscard]] std::vector<std::string>
    construct_remove_key_names(const std::vector<std::string> &keys, const std::string &storage_namespace) const override;

    delete_result delete_objects(const std::vector<std::string> &keys, const std::string &storage_namespace) override;

    [[nodiscard]] storage_types type() const override
    {
      return storage_types::s3;
    }

  private:
    /**
     * Client
     */
    std::shared_ptr<s3_client> client_;

    /**
     * Bucket
     */
    std::string bucket_;
  };
} // namespace reclaim

#endif // RECLAIM_REMOVERS_S3_BULK_REMOVER_HPP
