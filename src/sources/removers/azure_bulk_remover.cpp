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

#include <reclaim/removers/azure_bulk_remover.hpp>

#include <reclaim/storage_namespace.hpp>
#include <reclaim/utils.hpp>

namespace reclaim
{
  azure_bulk_remover::azure_bulk_remover(std::shared_ptr<azure_client> client) : client_(std::move(client))
  {
  }

  std::size_t azure_bulk_remover::get_max_bulk_size() const
  {
    return azure_max_bulk_size;
  }

  std::vector<std::string>
  azure_bulk_remover::construct_remove_key_names(const std::vector<std::string> &keys, const std::string &storage_namespace) const
  {
    if (keys.empty())
      return {};

    const auto _prefix = with_trailing_slash(storage_namespace);
    std::vector<std::string> _names;
    _names.reserve(keys.size());
    for (const auto &_key : keys)
      _names.push_back(_prefix + _key);
    return _names;
  }

  delete_result azure_bulk_remover::delete_objects(const std::vector<std::string> &keys, const std::string &storage_namespace)
  {
    delete_result _result;
    if (keys.empty())
      return _result;

    std::vector<unsigned> _statuses;
    try
    {
      const auto _names = construct_remove_key_names(keys, storage_namespace);
      log_remove_keys(type(), _names);
      _statuses = client_->delete_blobs(_names);
    }
    catch (const std::exception &e)
    {
      _result.error_ = e.what();
    }

    // Statuses follow the order of the request, a short answer leaves the tail unconfirmed.
    for (std::size_t _i = 0; _i < keys.size() && _i < _statuses.size(); ++_i)
    {
      if (_statuses[_i] == 200 || _statuses[_i] == 202)
        _result.deleted_.push_back(keys[_i]);
      else if (_statuses[_i] == 404)
        _result.absent_.push_back(keys[_i]);
    }
    return _result;
  }
} // namespace reclaim
