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

#include <reclaim/metadata_reader.hpp>

#include <charconv>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <reclaim/exceptions.hpp>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace reclaim
{
  namespace
  {
    std::vector<std::string> split_fields(const std::string &line)
    {
      std::vector<std::string> _fields;
      std::istringstream _stream(line);
      std::string _field;
      while (_stream >> _field)
        _fields.push_back(std::move(_field));
      return _fields;
    }

    std::int64_t parse_integer(const std::string &value, const std::size_t line_number)
    {
      std::int64_t _result = 0;
      const auto *_end = value.data() + value.size();
      if (const auto [_ptr, _ec] = std::from_chars(value.data(), _end, _result); _ec != std::errc() || _ptr != _end)
        throw serialize_error(fmt::format("line {}: '{}' is not an integer", line_number, value));
      return _result;
    }

    timestamp parse_timestamp(const std::string &value, const std::size_t line_number)
    {
      const auto _seconds = parse_integer(value, line_number);
      if (!in_timestamp_range(_seconds))
        throw serialize_error(fmt::format("line {}: timestamp {} is out of range", line_number, value));
      return from_seconds(_seconds);
    }

    void expect_fields(
      const std::vector<std::string> &fields,
      const std::size_t min,
      const std::size_t max,
      const std::size_t line_number)
    {
      if (fields.size() < min || fields.size() > max)
        throw serialize_error(fmt::format("line {}: malformed '{}' record", line_number, fields.front()));
    }
  } // namespace

  repository_metadata read_metadata(std::istream &in)
  {
    repository_metadata _metadata;
    std::unordered_map<std::string, tree> _trees;
    std::size_t _line_number = 0;

    for (std::string _line; std::getline(in, _line);)
    {
      ++_line_number;
      const auto _fields = split_fields(_line);
      if (_fields.empty() || _fields.front().starts_with('#'))
        continue;

      const auto &_type = _fields.front();
      if (_type == "default_retention")
      {
        expect_fields(_fields, 2, 2, _line_number);
        _metadata.rules_.default_retention_days_ = parse_integer(_fields[1], _line_number);
      }
      else if (_type == "rule")
      {
        expect_fields(_fields, 3, 3, _line_number);
        _metadata.rules_.branches_.push_back(retention_rule{_fields[1], parse_integer(_fields[2], _line_number)});
      }
      else if (_type == "branch")
      {
        expect_fields(_fields, 3, 3, _line_number);
        _metadata.store_->set_branch(_fields[1], _fields[2]);
      }
      else if (_type == "dangling")
      {
        expect_fields(_fields, 2, 4, _line_number);
        dangling_root _root{_fields[1], std::nullopt, {}};
        if (_fields.size() > 2)
          _root.deleted_at_ = parse_timestamp(_fields[2], _line_number);
        if (_fields.size() > 3)
          _root.branch_name_ = _fields[3];
        _metadata.store_->add_dangling_root(std::move(_root));
      }
      else if (_type == "commit")
      {
        expect_fields(_fields, 4, std::numeric_limits<std::size_t>::max(), _line_number);
        commit _commit{
          .id_ = _fields[1],
          .parents_ = std::vector<std::string>(_fields.begin() + 4, _fields.end()),
          .created_at_ = parse_timestamp(_fields[2], _line_number),
          .tree_id_ = _fields[3],
        };
        if (!_metadata.store_->add_commit(std::move(_commit)))
          throw serialize_error(fmt::format("line {}: duplicate commit {}", _line_number, _fields[1]));
      }
      else if (_type == "tree")
      {
        expect_fields(_fields, 2, 2, _line_number);
        _trees.try_emplace(_fields[1]);
      }
      else if (_type == "entry")
      {
        expect_fields(_fields, 4, 4, _line_number);
        _trees[_fields[1]][_fields[2]] = _fields[3];
      }
      else
      {
        throw serialize_error(fmt::format("line {}: unknown record type '{}'", _line_number, _type));
      }
    }

    if (in.bad())
      throw serialize_error("unable to read metadata stream");

    for (auto &[_id, _entries] : _trees)
      _metadata.store_->add_tree(_id, std::move(_entries));

    return _metadata;
  }

  repository_metadata read_metadata_file(const std::string &filename)
  {
    std::ifstream _in(filename);
    if (!_in)
      throw serialize_error(fmt::format("unable to open metadata file {}", filename));
    return read_metadata(_in);
  }

  repository_metadata read_metadata_url(retry_client &client, run_context &context, const std::string &url)
  {
    http_request _request{boost::beast::http::verb::get, "/", 11};
    _request.set(boost::beast::http::field::accept, "text/plain");

    const auto _response = client.execute(context, std::move(_request), url);
    if (_response.result_int() != 200)
      throw transport_error(fmt::format("GET {} returned status {}", url, _response.result_int()));

    std::istringstream _in(_response.body());
    return read_metadata(_in);
  }
} // namespace reclaim
