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

#ifndef RECLAIM_REMOVERS_LOCAL_BULK_REMOVER_HPP
#define RECLAIM_REMOVERS_LOCAL_BULK_REMOVER_HPP

#include <reclaim/bulk_remover.hpp>

namespace reclaim
{
  /**
   * Local max bulk size
   */
  constexpr std::size_t local_max_bulk_size = 1000;

  /**
   * Local filesystem bulk remover, namespaces of the form local://path
   */
  class local_bulk_remover final : public bulk_remover
  {
  public:
    [[nodiscard]] std::size_t get_max_bulk_size() const override;

    [[nodiscard]] std::vector<std::string>
    construct_remove_key_names(const std::vector<std::string> &keys, const std::string &storage_namespace) const override;

    delete_result delete_objects(const std::vector<std::string> &keys, const std::string &storage_namespace) override;

    [[nodiscard]] storage_types type() const override
    {
      return storage_types::local;
    }
  };
} // namespace reclaim

#endif // RECLAIM_REMOVERS_LOCAL_BULK_REMOVER_HPP
