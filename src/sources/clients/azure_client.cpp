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

#include <reclaim/clients/azure_client.hpp>

#include <azure/storage/blobs/blob_batch.hpp>
#include <map>
#include <reclaim/exceptions.hpp>
#include <reclaim/utils.hpp>

namespace reclaim
{
  namespace blobs = Azure::Storage::Blobs;

  blob_batch_client::blob_batch_client(azure_client_options options) :
      endpoint_(std::move(options.endpoint_)), sas_token_(std::move(options.sas_token_))
  {
    while (endpoint_.ends_with('/'))
      endpoint_.pop_back();
    if (sas_token_.starts_with('?'))
      sas_token_.erase(0, 1);

    client_options_.Retry.MaxRetries = options.retry_max_;
    client_options_.Retry.RetryDelay = options.wait_min_;
    client_options_.Retry.MaxRetryDelay = options.wait_max_;
  }

  blob_location blob_batch_client::locate(const std::string &url) const
  {
    const auto _scheme = url.find("://");
    const auto _path = _scheme == std::string::npos ? std::string::npos : url.find('/', _scheme + 3);
    const auto _container_end = _path == std::string::npos ? std::string::npos : url.find('/', _path + 1);
    if (_container_end == std::string::npos || _container_end == _path + 1 || _container_end + 1 == url.size())
      throw validation_error(fmt::format("blob url '{}' has no container or blob name", url));

    const auto _account = url.substr(0, _path);
    const auto _container = url.substr(_path, _container_end - _path);
    return blob_location{
      .container_url_ = (endpoint_.empty() ? _account : endpoint_) + _container,
      .blob_name_ = url.substr(_container_end + 1),
    };
  }

  blobs::BlobContainerClient blob_batch_client::container(const std::string &container_url) const
  {
    return blobs::BlobContainerClient(sas_token_.empty() ? container_url : container_url + "?" + sas_token_, client_options_);
  }

  std::vector<unsigned> blob_batch_client::delete_blobs(const std::vector<std::string> &urls)
  {
    std::vector<unsigned> _statuses(urls.size(), 0);

    std::map<std::string, std::vector<std::pair<std::size_t, std::string>>> _containers;
    for (std::size_t _i = 0; _i < urls.size(); ++_i)
    {
      auto _location = locate(urls[_i]);
      _containers[_location.container_url_].emplace_back(_i, std::move(_location.blob_name_));
    }

    blobs::DeleteBlobOptions _delete_options;
    _delete_options.DeleteSnapshots = blobs::Models::DeleteSnapshotsOption::IncludeSnapshots;

    for (const auto &[_container_url, _blobs] : _containers)
    {
      auto _client = container(_container_url);
      auto _batch = _client.CreateBatch();

      std::vector<Azure::Storage::DeferredResponse<blobs::Models::DeleteBlobResult>> _responses;
      _responses.reserve(_blobs.size());
      for (const auto &[_position, _name] : _blobs)
        _responses.push_back(_batch.DeleteBlob(_name, _delete_options));

      try
      {
        _client.SubmitBatch(_batch);
      }
      catch (const Azure::Core::RequestFailedException &e)
      {
        throw backend_error(fmt::format(
          "azure batch delete on {} failed with status {}: {}", _container_url, static_cast<int>(e.StatusCode), e.what()));
      }

      for (std::size_t _i = 0; _i < _blobs.size(); ++_i)
      {
        try
        {
          static_cast<void>(_responses[_i].GetResponse());
          _statuses[_blobs[_i].first] = 202;
        }
        catch (const Azure::Core::RequestFailedException &e)
        {
          _statuses[_blobs[_i].first] = static_cast<unsigned>(e.StatusCode);
#ifndef NDEBUG
          fmt::print(
            "[azure] [{:%Y-%m-%d %H:%M:%S}] BLOB DELETE FAILED url={} status={} error={}\n",
            std::chrono::system_clock::now(),
            urls[_blobs[_i].first],
            _statuses[_blobs[_i].first],
            e.ErrorCode);
#endif
        }
      }
    }
    return _statuses;
  }
} // namespace reclaim
