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

#include <reclaim/removers/local_bulk_remover.hpp>

#include <filesystem>
#include <reclaim/exceptions.hpp>
#include <reclaim/storage_namespace.hpp>
#include <reclaim/utils.hpp>

namespace reclaim
{
  std::size_t local_bulk_remover::get_max_bulk_size() const
  {
    return local_max_bulk_size;
  }

  std::vector<std::string>
  local_bulk_remover::construct_remove_key_names(const std::vector<std::string> &keys, const std::string &storage_namespace) const
  {
    if (keys.empty())
      return {};

    const auto _namespace = parse_storage_namespace(storage_namespace);
    const auto _root = with_trailing_slash(_namespace.host_ + _namespace.path_);

    std::vector<std::string> _names;
    _names.reserve(keys.size());
    for (const auto &_key : keys)
      _names.push_back(_root + (_key.starts_with('/') ? _key.substr(1) : _key));
    return _names;
  }

  delete_result local_bulk_remover::delete_objects(const std::vector<std::string> &keys, const std::string &storage_namespace)
  {
    delete_result _result;
    if (keys.empty())
      return _result;

    std::vector<std::string> _names;
    try
    {
      _names = construct_remove_key_names(keys, storage_namespace);
    }
    catch (const validation_error &e)
    {
      _result.error_ = e.what();
      return _result;
    }
    log_remove_keys(type(), _names);

    for (std::size_t _i = 0; _i < _names.size(); ++_i)
    {
      std::error_code _ec;
      if (std::filesystem::remove(_names[_i], _ec))
      {
        _result.deleted_.push_back(keys[_i]);
      }
      else if (!_ec)
      {
        _result.absent_.push_back(keys[_i]);
      }
      else if (_result.error_.empty())
      {
        _result.error_ = fmt::format("remove {}: {}", _names[_i], _ec.message());
      }
    }
    return _result;
  }
} // namespace reclaim
