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

#include <reclaim/app.hpp>

#include <boost/asio/signal_set.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <reclaim/bulk_remover_factory.hpp>
#include <reclaim/clients/s3_client.hpp>
#include <reclaim/mark_repository.hpp>
#include <reclaim/metadata_reader.hpp>
#include <reclaim/retention.hpp>
#include <reclaim/services/reachability_marker.hpp>
#include <reclaim/services/sweep_executor.hpp>
#include <reclaim/utils.hpp>
#include <reclaim/version.hpp>

#include <cstdlib>
#include <thread>

namespace reclaim
{
  namespace
  {
    std::unique_ptr<run_context> make_context(const program_parameters &program_options)
    {
      if (program_options.deadline_s_ > 0)
        return std::make_unique<run_context>(
          std::chrono::steady_clock::now() + std::chrono::seconds(program_options.deadline_s_));
      return std::make_unique<run_context>();
    }
  } // namespace

  app::app(const program_parameters &program_options) :
      program_options_(program_options), context_(make_context(program_options))
  {
  }

  int app::run()
  {
    const auto _mode = parse_run_mode(program_options_.mode_);
    const auto _storage_type = parse_storage_type(program_options_.storage_type_);

    auto _mark_id = program_options_.mark_id_;
    if (_mark_id.empty())
    {
      if (_mode == run_modes::sweep)
        throw validation_error("sweep requires a mark id");
      _mark_id = to_string(id_);
    }
    mark_repository::validate_mark_id(_mark_id);

    if (!in_timestamp_range(program_options_.now_))
      throw validation_error(fmt::format("evaluation time {} is out of range", program_options_.now_));

    if (program_options_.threads_ < 1)
      throw validation_error(fmt::format("threads must be positive, got {}", program_options_.threads_));

    fmt::print(
      "[{}] [{:%Y-%m-%d %H:%M:%S}] RUN STARTED version={} mode={} mark_id={} storage={}\n",
      to_string(id_),
      std::chrono::system_clock::now(),
      get_version(),
      to_string(_mode),
      _mark_id,
      to_string(_storage_type));

    boost::asio::signal_set _signals(ioc_, SIGINT, SIGTERM);
    _signals.async_wait(
      [this](const boost::system::error_code &ec, int /*signal_number*/)
      {
        if (ec)
          return;
        fmt::print("[{}] [{:%Y-%m-%d %H:%M:%S}] SIGNAL RECEIVED\n", to_string(id_), std::chrono::system_clock::now());
        stop();
      });
    std::jthread _signals_thread([self = shared_from_this()] { self->ioc_.run(); });

    try
    {
      const mark_repository _repository(program_options_.marks_dir_);

      const auto _wait_min = std::chrono::milliseconds(program_options_.retry_wait_min_ms_);
      const auto _wait_max = std::chrono::milliseconds(program_options_.retry_wait_max_ms_);

      std::unique_ptr<aws_api> _aws;
      if (_mode != run_modes::mark && _storage_type == storage_types::s3)
        _aws = std::make_unique<aws_api>();

      std::unique_ptr<bulk_remover> _remover;
      if (_mode != run_modes::mark)
        _remover = make_bulk_remover(
          _storage_type,
          bulk_remover_options{
            .storage_namespace_ = program_options_.storage_namespace_,
            .endpoint_ = program_options_.endpoint_,
            .region_ = program_options_.region_,
            .sas_token_ = program_options_.sas_token_,
            .retry_max_ = program_options_.retry_max_,
            .wait_min_ = _wait_min,
            .wait_max_ = _wait_max,
            .context_ = context_.get(),
          });

      if (_mode != run_modes::sweep)
      {
        const auto _now =
          program_options_.now_ > 0 ? from_seconds(program_options_.now_) : std::chrono::system_clock::now();

        repository_metadata _metadata;
        if (program_options_.metadata_.starts_with("http://"))
        {
          retry_client _client(retry_client_options{
            .retry_max_ = program_options_.retry_max_,
            .wait_min_ = _wait_min,
            .wait_max_ = _wait_max,
          });
          _metadata = read_metadata_url(_client, *context_, program_options_.metadata_);
        }
        else
        {
          _metadata = read_metadata_file(program_options_.metadata_);
        }
        validate_rules(_metadata.rules_);

        const reachability_marker _marker(*_metadata.store_, _metadata.rules_, id_, program_options_.threads_);
        const auto _manifest = _marker.mark(_mark_id, _now);
        _repository.save(_manifest);

        fmt::print(
          "[{}] [{:%Y-%m-%d %H:%M:%S}] MARK SAVED mark_id={} path={}\n",
          to_string(id_),
          std::chrono::system_clock::now(),
          _mark_id,
          _repository.manifest_path(_mark_id).string());
      }

      if (_remover)
      {
        sweep_executor _executor(
          _repository, *_remover, program_options_.storage_namespace_, id_, *context_, program_options_.threads_);
        const auto _report = _executor.sweep(_mark_id);
        const auto _path = _repository.save_report(_report);

        fmt::print(
          "[{}] [{:%Y-%m-%d %H:%M:%S}] SWEEP REPORT SAVED mark_id={} path={}\n",
          to_string(id_),
          std::chrono::system_clock::now(),
          _mark_id,
          _path.string());
      }
    }
    catch (const std::exception &e)
    {
      fmt::print(
        "[{}] [{:%Y-%m-%d %H:%M:%S}] RUN FAILED mark_id={} error={}\n",
        to_string(id_),
        std::chrono::system_clock::now(),
        _mark_id,
        e.what());
      _signals.cancel();
      ioc_.stop();
      throw;
    }

    _signals.cancel();
    ioc_.stop();

    fmt::print(
      "[{}] [{:%Y-%m-%d %H:%M:%S}] RUN COMPLETED mark_id={}\n", to_string(id_), std::chrono::system_clock::now(), _mark_id);

    return EXIT_SUCCESS;
  }

  void app::stop()
  {
    context_->cancel();
  }
} // namespace reclaim
