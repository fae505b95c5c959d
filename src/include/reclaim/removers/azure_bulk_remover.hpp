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

#ifndef RECLAIM_REMOVERS_AZURE_BULK_REMOVER_HPP
#define RECLAIM_REMOVERS_AZURE_BULK_REMOVER_HPP

#include <reclaim/bulk_remover.hpp>
#include <reclaim/clients/azure_client.hpp>

namespace reclaim
{
  /**
   * Azure max bulk size
   */
  constexpr std::size_t azure_max_bulk_size = 256;

  /**
   * Azure blob bulk remover
   */
  class azure_bulk_remover final : public bulk_remover
  {
  public:
    /**
     * Constructor
     *
     * @param client
     */
    explicit azure_bulk_remover(std::shared_ptr<azure_client> client);

    [[nodiscard]] std::size_t get_max_bulk_size() const override;

    [[nodiscard]] std::vector<std::string>
    construct_remove_key_names(const std::vector<std::string> &keys, const std::string &storage_namespace) const override;

    delete_result delete_objects(const std::vector<std::string> &keys, const std::string &storage_namespace) override;

    [[nodiscard]] storage_types type() const override
    {
      return storage_types::azure;
    }

  private:
    /**
     * Client
     */
    std::shared_ptr<azure_client> client_;
  };
} // namespace reclaim

#endif // RECLAIM_REMOVERS_AZURE_BULK_REMOVER_HPP
