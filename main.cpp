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

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <reclaim/app.hpp>
#include <reclaim/utils.hpp>
#include <reclaim/version.hpp>

int
main(const int argc, const char *argv[])
{
  using namespace boost::program_options;
  using namespace reclaim;
  options_description _options("Options");

  int default_threads = 1;
  if (const char *env_threads = std::getenv("THREADS"))
  {
    const std::string_view _value(env_threads);
    if (int _parsed = 0; std::from_chars(_value.data(), _value.data() + _value.size(), _parsed).ec == std::errc())
      default_threads = std::max(1, _parsed);
  }

  auto _push_option = _options.add_options();

  _push_option("help", "show options");
  _push_option("version", "show version");
  _push_option("mode", value<std::string>()->default_value("both"), "mark, sweep or both");
  _push_option("mark_id", value<std::string>()->default_value(""), "mark identifier, required by sweep");
  _push_option("metadata", value<std::string>()->default_value("repository.meta"), "repository metadata export, file or http:// url");
  _push_option("marks_dir", value<std::string>()->default_value("marks"), "manifests and reports directory");
  _push_option("storage_type", value<std::string>()->default_value("local"), "s3, azure or local");
  _push_option("storage_namespace", value<std::string>()->default_value(""), "scheme://bucket-or-account/prefix/");
  _push_option("endpoint", value<std::string>()->default_value(""), "storage endpoint override, s3-compatible service or azure emulator");
  _push_option("region", value<std::string>()->default_value("us-east-1"), "aws region");
  _push_option("sas_token", value<std::string>()->default_value(""), "azure shared access signature");
  _push_option("threads", value<int>()->default_value(default_threads));
  _push_option("now", value<std::int64_t>()->default_value(0), "evaluation time in seconds since epoch");
  _push_option("retry_max", value<int>()->default_value(4));
  _push_option("retry_wait_min_ms", value<int>()->default_value(200));
  _push_option("retry_wait_max_ms", value<int>()->default_value(5000));
  _push_option("deadline_s", value<int>()->default_value(0), "run deadline in seconds, 0 disables it");

  try
  {
    variables_map _vm;
    store(parse_command_line(argc, argv, _options), _vm);
    notify(_vm);

    if (_vm.contains("help"))
    {
      std::cout << _options << '\n';
      return EXIT_SUCCESS;
    }

    if (_vm.contains("version"))
    {
      fmt::print("reclaim {}\n", get_version());
      return EXIT_SUCCESS;
    }

    program_parameters _program_options{
      .mode_ = _vm["mode"].as<std::string>(),
      .mark_id_ = _vm["mark_id"].as<std::string>(),
      .metadata_ = _vm["metadata"].as<std::string>(),
      .marks_dir_ = _vm["marks_dir"].as<std::string>(),
      .storage_type_ = _vm["storage_type"].as<std::string>(),
      .storage_namespace_ = _vm["storage_namespace"].as<std::string>(),
      .endpoint_ = _vm["endpoint"].as<std::string>(),
      .region_ = _vm["region"].as<std::string>(),
      .sas_token_ = _vm["sas_token"].as<std::string>(),
      .threads_ = _vm["threads"].as<int>(),
      .now_ = _vm["now"].as<std::int64_t>(),
      .retry_max_ = _vm["retry_max"].as<int>(),
      .retry_wait_min_ms_ = _vm["retry_wait_min_ms"].as<int>(),
      .retry_wait_max_ms_ = _vm["retry_wait_max_ms"].as<int>(),
      .deadline_s_ = _vm["deadline_s"].as<int>(),
    };

    const auto _app = std::make_shared<app>(_program_options);

    return _app->run();
  }
  catch (const error &e)
  {
    fmt::print(stderr, "[reclaim] [{:%Y-%m-%d %H:%M:%S}] INVALID OPTIONS error={}\n", std::chrono::system_clock::now(), e.what());
  }
  catch (const std::exception &e)
  {
    fmt::print(stderr, "[reclaim] [{:%Y-%m-%d %H:%M:%S}] FATAL error={}\n", std::chrono::system_clock::now(), e.what());
  }

  return EXIT_FAILURE;
}
