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

#include <reclaim/mark_manifest.hpp>

#include <array>
#include <bit>
#include <boost/endian/conversion.hpp>
#include <fmt/format.h>
#include <reclaim/exceptions.hpp>
#include <type_traits>

namespace reclaim
{
  namespace
  {
    constexpr auto MAGIC_ = "RCLM";
    constexpr uint8_t VERSION_ = 1;

    template<typename T> void write_raw(std::ostream &out, const T &value)
    {
      static_assert(std::is_trivially_copyable_v<T>);
      const auto _little = boost::endian::native_to_little(value);
      for (const std::byte _b : std::bit_cast<std::array<std::byte, sizeof(T)>>(_little))
        out.put(static_cast<char>(_b));
    }

    template<typename T> void read_raw(std::istream &in, T &value)
    {
      static_assert(std::is_trivially_copyable_v<T>);
      std::array<std::byte, sizeof(T)> _bytes{};
      for (auto &_byte : _bytes)
      {
        char _c = 0;
        if (!in.get(_c))
          throw serialize_error("Truncated manifest");
        _byte = static_cast<std::byte>(_c);
      }
      value = boost::endian::little_to_native(std::bit_cast<T>(_bytes));
    }

    void write_string(std::ostream &out, const std::string &value)
    {
      write_raw(out, static_cast<uint32_t>(value.size()));
      out.write(value.data(), static_cast<std::streamsize>(value.size()));
    }

    std::string read_string(std::istream &in)
    {
      uint32_t _size = 0;
      read_raw(in, _size);
      std::string _value(_size, '\0');
      if (!in.read(_value.data(), _size))
        throw serialize_error("Truncated manifest");
      return _value;
    }
  } // namespace

  void dump_manifest(const mark_manifest &manifest, std::ostream &out)
  {
    out.write(MAGIC_, 4);
    write_raw(out, VERSION_);
    write_string(out, manifest.mark_id_);
    write_raw(out, to_seconds(manifest.created_at_));
    write_raw(out, static_cast<uint64_t>(manifest.addresses_.size()));
    for (const auto &_address : manifest.addresses_)
      write_string(out, _address);

    if (!out)
      throw serialize_error("Unable to write manifest");
  }

  mark_manifest restore_manifest(std::istream &in)
  {
    std::string _magic(4, '\0');
    in.read(_magic.data(), 4);
    if (!in || std::string_view(_magic) != MAGIC_)
      throw serialize_error("Invalid manifest format");

    uint8_t _version = 0;
    read_raw(in, _version);
    if (_version != VERSION_)
      throw serialize_error("Unsupported manifest version");

    mark_manifest _manifest;
    _manifest.mark_id_ = read_string(in);

    int64_t _created_at = 0;
    read_raw(in, _created_at);
    if (!in_timestamp_range(_created_at))
      throw serialize_error("Manifest creation time is out of range");
    _manifest.created_at_ = from_seconds(_created_at);

    uint64_t _count = 0;
    read_raw(in, _count);
    for (uint64_t _i = 0; _i < _count; ++_i)
      _manifest.addresses_.push_back(read_string(in));

    return _manifest;
  }

  void dump_report(const sweep_report &report, std::ostream &out)
  {
    out << fmt::format(
      "mark_id {}\nremoved_count {}\nabsent_count {}\nfailed_count {}\n",
      report.mark_id_,
      report.removed_.size(),
      report.absent_.size(),
      report.failed_.size());
    for (const auto &_address : report.removed_)
      out << "removed " << _address << '\n';
    for (const auto &_address : report.absent_)
      out << "absent " << _address << '\n';
    for (const auto &_address : report.failed_)
      out << "failed " << _address << '\n';

    if (!out)
      throw serialize_error("Unable to write sweep report");
  }
} // namespace reclaim
