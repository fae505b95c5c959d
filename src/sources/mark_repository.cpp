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

#include <reclaim/mark_repository.hpp>

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <reclaim/exceptions.hpp>

namespace reclaim
{
  namespace
  {
    template<typename Writer>
    void write_atomically(const std::filesystem::path &target, std::ios::openmode mode, Writer &&writer)
    {
      auto _temporary = target;
      _temporary += ".tmp";

      {
        std::ofstream _out(_temporary, mode);
        if (!_out)
          throw serialize_error(fmt::format("Unable to open {} for writing", _temporary.string()));
        writer(_out);
        _out.flush();
        if (!_out)
          throw serialize_error(fmt::format("Unable to write {}", _temporary.string()));
      }

      std::error_code _ec;
      std::filesystem::rename(_temporary, target, _ec);
      if (_ec)
        throw serialize_error(fmt::format("Unable to publish {}: {}", target.string(), _ec.message()));
    }
  } // namespace

  mark_repository::mark_repository(std::filesystem::path directory) : directory_(std::move(directory))
  {
  }

  void mark_repository::validate_mark_id(const std::string &mark_id)
  {
    if (mark_id.empty())
      throw validation_error("mark id must not be empty");

    const auto _allowed = [](const char c)
    { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-'; };
    if (!std::ranges::all_of(mark_id, _allowed) || mark_id == "." || mark_id == "..")
      throw validation_error(fmt::format("invalid mark id '{}'", mark_id));
  }

  std::filesystem::path mark_repository::manifest_path(const std::string &mark_id) const
  {
    validate_mark_id(mark_id);
    return directory_ / (mark_id + ".manifest");
  }

  void mark_repository::save(const mark_manifest &manifest) const
  {
    const auto _path = manifest_path(manifest.mark_id_);

    std::error_code _ec;
    std::filesystem::create_directories(directory_, _ec);
    if (_ec)
      throw serialize_error(fmt::format("Unable to create {}: {}", directory_.string(), _ec.message()));

    write_atomically(_path, std::ios::binary, [&manifest](std::ostream &out) { dump_manifest(manifest, out); });
  }

  mark_manifest mark_repository::load(const std::string &mark_id) const
  {
    const auto _path = manifest_path(mark_id);
    std::ifstream _in(_path, std::ios::binary);
    if (!_in)
      throw mark_not_found(fmt::format("mark {} not found in {}", mark_id, directory_.string()));

    auto _manifest = restore_manifest(_in);
    if (_manifest.mark_id_ != mark_id)
      throw serialize_error(fmt::format("manifest {} carries mark id {}", _path.string(), _manifest.mark_id_));
    return _manifest;
  }

  bool mark_repository::exists(const std::string &mark_id) const
  {
    std::error_code _ec;
    return std::filesystem::is_regular_file(manifest_path(mark_id), _ec);
  }

  std::filesystem::path mark_repository::save_report(const sweep_report &report) const
  {
    validate_mark_id(report.mark_id_);
    const auto _path = directory_ / (report.mark_id_ + ".report");

    std::error_code _ec;
    std::filesystem::create_directories(directory_, _ec);
    if (_ec)
      throw serialize_error(fmt::format("Unable to create {}: {}", directory_.string(), _ec.message()));

    write_atomically(_path, std::ios::out | std::ios::trunc, [&report](std::ostream &out) { dump_report(report, out); });
    return _path;
  }
} // namespace reclaim
