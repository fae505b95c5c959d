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

#include <reclaim/bulk_remover_factory.hpp>

#include <reclaim/clients/azure_client.hpp>
#include <reclaim/clients/s3_client.hpp>
#include <reclaim/removers/azure_bulk_remover.hpp>
#include <reclaim/removers/local_bulk_remover.hpp>
#include <reclaim/removers/s3_bulk_remover.hpp>
#include <reclaim/storage_namespace.hpp>
#include <reclaim/utils.hpp>

namespace reclaim
{
  namespace
  {
    bool matches_scheme(const storage_types type, const std::string_view scheme)
    {
      switch (type)
      {
        case storage_types::s3:
          return scheme == "s3";
        case storage_types::azure:
          return scheme == "https" || scheme == "http";
        default:
          return scheme == "local";
      }
    }
  } // namespace

  std::unique_ptr<bulk_remover> make_bulk_remover(const storage_types type, const bulk_remover_options &options)
  {
    const auto _namespace = parse_storage_namespace(options.storage_namespace_);
    if (!matches_scheme(type, _namespace.scheme_))
      throw validation_error(fmt::format(
        "storage namespace '{}' does not match storage type {}", options.storage_namespace_, to_string(type)));

    if (type == storage_types::local)
      return std::make_unique<local_bulk_remover>();

    if (!options.endpoint_.empty() && !options.endpoint_.starts_with("http://") && !options.endpoint_.starts_with("https://"))
      throw validation_error(fmt::format("endpoint '{}' must be an http or https url", options.endpoint_));

    if (type == storage_types::s3)
    {
      if (options.context_ == nullptr)
        throw validation_error("storage type s3 requires a run context");
      if (_namespace.host_.empty())
        throw validation_error(fmt::format("storage namespace '{}' has no bucket", options.storage_namespace_));

      auto _client = std::make_shared<aws_s3_client>(
        *options.context_,
        s3_client_options{
          .region_ = options.region_,
          .endpoint_ = options.endpoint_,
          .retry_max_ = options.retry_max_,
          .wait_min_ = options.wait_min_,
          .wait_max_ = options.wait_max_,
        });
      return std::make_unique<s3_bulk_remover>(std::move(_client), options.storage_namespace_);
    }

    if (_namespace.host_.empty() || _namespace.path_.size() <= 1 || _namespace.path_[1] == '/')
      throw validation_error(fmt::format("storage namespace '{}' has no account or container", options.storage_namespace_));

    auto _client = std::make_shared<blob_batch_client>(azure_client_options{
      .endpoint_ = options.endpoint_,
      .sas_token_ = options.sas_token_,
      .retry_max_ = options.retry_max_,
      .wait_min_ = options.wait_min_,
      .wait_max_ = options.wait_max_,
    });
    return std::make_unique<azure_bulk_remover>(std::move(_client));
  }
} // namespace reclaim
