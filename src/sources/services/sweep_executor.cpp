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

#include <reclaim/services/sweep_executor.hpp>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <optional>
#include <unordered_set>
#include <reclaim/utils.hpp>

namespace reclaim
{
  sweep_executor::sweep_executor(
    const mark_repository &repository,
    bulk_remover &remover,
    std::string storage_namespace,
    const boost::uuids::uuid run_id,
    run_context &context,
    const int threads) :
      repository_(repository),
      remover_(remover),
      storage_namespace_(std::move(storage_namespace)),
      run_id_(run_id),
      context_(context),
      threads_(std::max(1, threads))
  {
  }

  std::vector<std::vector<object_address>>
  sweep_executor::make_batches(const std::vector<object_address> &addresses, const std::size_t size)
  {
    const auto _size = std::max<std::size_t>(1, size);
    std::vector<std::vector<object_address>> _batches;
    _batches.reserve((addresses.size() + _size - 1) / _size);
    for (std::size_t _offset = 0; _offset < addresses.size(); _offset += _size)
    {
      const auto _end = std::min(addresses.size(), _offset + _size);
      _batches.emplace_back(
        addresses.begin() + static_cast<std::ptrdiff_t>(_offset), addresses.begin() + static_cast<std::ptrdiff_t>(_end));
    }
    return _batches;
  }

  sweep_report sweep_executor::sweep(const std::string &mark_id)
  {
    const auto _manifest = repository_.load(mark_id);
    const auto _batches = make_batches(_manifest.addresses_, remover_.get_max_bulk_size());

    fmt::print(
      "[{}] [{:%Y-%m-%d %H:%M:%S}] SWEEP STARTED mark_id={} storage={} addresses={} batches={}\n",
      to_string(run_id_),
      std::chrono::system_clock::now(),
      mark_id,
      to_string(remover_.type()),
      _manifest.addresses_.size(),
      _batches.size());

    std::vector<std::optional<delete_result>> _results(_batches.size());
    {
      boost::asio::thread_pool _pool(static_cast<std::size_t>(threads_));
      for (std::size_t _i = 0; _i < _batches.size(); ++_i)
      {
        boost::asio::post(
          _pool,
          [this, &_batches, &_results, _i]
          {
            if (context_.done())
              return;

            try
            {
              _results[_i] = remover_.delete_objects(_batches[_i], storage_namespace_);
            }
            catch (const std::exception &e)
            {
              _results[_i] = delete_result{.deleted_ = {}, .absent_ = {}, .error_ = e.what()};
            }
          });
      }
      _pool.join();
    }

    sweep_report _report{.mark_id_ = mark_id, .removed_ = {}, .absent_ = {}, .failed_ = {}};
    for (std::size_t _i = 0; _i < _batches.size(); ++_i)
    {
      const auto &_batch = _batches[_i];
      if (!_results[_i])
      {
        fmt::print(
          "[{}] [{:%Y-%m-%d %H:%M:%S}] SWEEP BATCH SKIPPED mark_id={} batch={} keys={} reason={}\n",
          to_string(run_id_),
          std::chrono::system_clock::now(),
          mark_id,
          _i,
          _batch.size(),
          context_.error().value_or("context canceled"));
        _report.failed_.insert(_report.failed_.end(), _batch.begin(), _batch.end());
        continue;
      }

      const auto &_result = *_results[_i];
      const std::unordered_set<object_address> _deleted(_result.deleted_.begin(), _result.deleted_.end());
      const std::unordered_set<object_address> _absent(_result.absent_.begin(), _result.absent_.end());

      std::size_t _failed = 0;
      for (const auto &_address : _batch)
      {
        if (_deleted.contains(_address))
        {
          _report.removed_.push_back(_address);
        }
        else if (_absent.contains(_address))
        {
          _report.absent_.push_back(_address);
        }
        else
        {
          _report.failed_.push_back(_address);
          ++_failed;
        }
      }

      if (!_result.absent_.empty())
        fmt::print(
          "[{}] [{:%Y-%m-%d %H:%M:%S}] SWEEP ALREADY ABSENT mark_id={} batch={} keys={}\n",
          to_string(run_id_),
          std::chrono::system_clock::now(),
          mark_id,
          _i,
          _result.absent_.size());

      if (_failed > 0)
        fmt::print(
          "[{}] [{:%Y-%m-%d %H:%M:%S}] SWEEP BATCH FAILED mark_id={} batch={} failed={} error={}\n",
          to_string(run_id_),
          std::chrono::system_clock::now(),
          mark_id,
          _i,
          _failed,
          _result.error_.empty() ? "unconfirmed by backend" : _result.error_);
#ifndef NDEBUG
      else
        fmt::print(
          "[{}] [{:%Y-%m-%d %H:%M:%S}] SWEEP BATCH COMPLETED mark_id={} batch={} removed={}\n",
          to_string(run_id_),
          std::chrono::system_clock::now(),
          mark_id,
          _i,
          _deleted.size());
#endif
    }

    fmt::print(
      "[{}] [{:%Y-%m-%d %H:%M:%S}] SWEEP COMPLETED mark_id={} removed={} absent={} failed={}\n",
      to_string(run_id_),
      std::chrono::system_clock::now(),
      mark_id,
      _report.removed_.size(),
      _report.absent_.size(),
      _report.failed_.size());

    return _report;
  }
} // namespace reclaim
