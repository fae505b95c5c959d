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

#include <reclaim/storage_namespace.hpp>

#include <fmt/format.h>
#include <reclaim/exceptions.hpp>

namespace reclaim
{
  storage_namespace parse_storage_namespace(const std::string_view uri)
  {
    const auto _separator = uri.find("://");
    if (_separator == std::string_view::npos || _separator == 0)
      throw validation_error(fmt::format("invalid storage namespace '{}'", uri));

    storage_namespace _result;
    _result.scheme_ = std::string(uri.substr(0, _separator));

    const auto _rest = uri.substr(_separator + 3);
    const auto _slash = _rest.find('/');
    _result.host_ = std::string(_rest.substr(0, _slash));
    if (_slash != std::string_view::npos)
      _result.path_ = std::string(_rest.substr(_slash));
    return _result;
  }
} // namespace reclaim
