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

#include <reclaim/removers/s3_bulk_remover.hpp>

#include <reclaim/storage_namespace.hpp>
#include <unordered_map>

namespace reclaim
{
  s3_bulk_remover::s3_bulk_remover(std::shared_ptr<s3_client> client, const std::string &storage_namespace) :
      client_(std::move(client)), bucket_(parse_storage_namespace(storage_namespace).host_)
  {
  }

  std::size_t s3_bulk_remover::get_max_bulk_size() const
  {
    return s3_max_bulk_size;
  }

  std::vector<std::string>
  s3_bulk_remover::construct_remove_key_names(const std::vector<std::string> &keys, const std::string &storage_namespace) const
  {
    if (keys.empty())
      return {};

    auto _prefix = with_trailing_slash(parse_storage_namespace(storage_namespace).path_);
    if (_prefix.starts_with('/'))
      _prefix.erase(0, 1);

    std::vector<std::string> _names;
    _names.reserve(keys.size());
    for (const auto &_key : keys)
      _names.push_back(_prefix + _key);
    return _names;
  }

  delete_result s3_bulk_remover::delete_objects(const std::vector<std::string> &keys, const std::string &storage_namespace)
  {
    delete_result _result;
    if (keys.empty())
      return _result;

    try
    {
      const auto _names = construct_remove_key_names(keys, storage_namespace);
      log_remove_keys(type(), _names);

      std::unordered_map<std::string, std::size_t> _positions;
      for (std::size_t _i = 0; _i < _names.size(); ++_i)
        _positions.emplace(_names[_i], _i);

      for (const auto &_confirmed : client_->delete_objects(bucket_, _names))
      {
        if (const auto _it = _positions.find(_confirmed); _it != _positions.end())
          _result.deleted_.push_back(keys[_it->second]);
      }
    }
    catch (const std::exception &e)
    {
      _result.error_ = e.what();
    }
    return _result;
  }
} // namespace reclaim
