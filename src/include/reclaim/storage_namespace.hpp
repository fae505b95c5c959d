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

#ifndef RECLAIM_STORAGE_NAMESPACE_HPP
#define RECLAIM_STORAGE_NAMESPACE_HPP

#include <string>
#include <string_view>

namespace reclaim
{
  /**
   * Storage namespace, scheme://bucket-or-account/prefix/
   */
  struct storage_namespace
  {
    /**
     * Scheme
     */
    std::string scheme_;

    /**
     * Bucket or account host
     */
    std::string host_;

    /**
     * Path, including its leading separator when present
     */
    std::string path_;
  };

  /**
   * Parse storage namespace, throws validation_error
   *
   * @param uri
   * @return storage_namespace
   */
  storage_namespace parse_storage_namespace(std::string_view uri);

  /**
   * With trailing slash
   *
   * @param value
   * @return std::string
   */
  inline std::string with_trailing_slash(std::string value)
  {
    if (!value.ends_with('/'))
      value.push_back('/');
    return value;
  }
} // namespace reclaim

#endif // RECLAIM_STORAGE_NAMESPACE_HPP
