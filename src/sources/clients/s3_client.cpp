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

#include <reclaim/clients/s3_client.hpp>

#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/http/Scheme.h>
#include <aws/s3/model/Delete.h>
#include <aws/s3/model/DeleteObjectsRequest.h>
#include <aws/s3/model/ObjectIdentifier.h>
#include <reclaim/exceptions.hpp>
#include <reclaim/utils.hpp>

namespace reclaim
{
  aws_api::aws_api()
  {
    Aws::InitAPI(options_);
  }

  aws_api::~aws_api()
  {
    Aws::ShutdownAPI(options_);
  }

  context_retry_strategy::context_retry_strategy(const run_context &context, const int retry_max, retry_policy policy) :
      context_(context), retry_max_(retry_max), policy_(policy)
  {
  }

  bool context_retry_strategy::ShouldRetry(
    const Aws::Client::AWSError<Aws::Client::CoreErrors> &error,
    const long attemptedRetries) const
  {
    if (attemptedRetries >= retry_max_)
      return false;

    std::optional<unsigned> _status;
    std::optional<transport_failure> _failure;
    if (const auto _code = static_cast<int>(error.GetResponseCode()); _code > 0)
      _status = static_cast<unsigned>(_code);
    else
      _failure = transport_failure{error.GetMessage()};

    const auto _decision = retry_policy::should_retry(context_, _status, _failure);
#ifndef NDEBUG
    fmt::print(
      "[s3] [{:%Y-%m-%d %H:%M:%S}] RETRY DECISION attempt={} status={} error={} retry={}\n",
      std::chrono::system_clock::now(),
      attemptedRetries + 1,
      _status.value_or(0),
      error.GetMessage(),
      _decision.retry_);
#endif
    return _decision.retry_;
  }

  long context_retry_strategy::CalculateDelayBeforeNextRetry(
    const Aws::Client::AWSError<Aws::Client::CoreErrors> & /*error*/,
    const long attemptedRetries) const
  {
    return static_cast<long>(policy_.backoff(static_cast<int>(attemptedRetries)).count());
  }

  long context_retry_strategy::GetMaxAttempts() const
  {
    return retry_max_ + 1;
  }

  aws_s3_client::aws_s3_client(const run_context &context, const s3_client_options &options)
  {
    Aws::Client::ClientConfiguration _config;
    _config.region = options.region_;
    _config.retryStrategy = std::make_shared<context_retry_strategy>(
      context, options.retry_max_, retry_policy(options.wait_min_, options.wait_max_));

    if (options.endpoint_.empty())
    {
      client_ = std::make_shared<Aws::S3::S3Client>(_config);
      return;
    }

    _config.endpointOverride = options.endpoint_;
    _config.scheme = options.endpoint_.starts_with("https://") ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_ = std::make_shared<Aws::S3::S3Client>(
      _config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, false);
  }

  std::vector<std::string> aws_s3_client::delete_objects(const std::string &bucket, const std::vector<std::string> &keys)
  {
    Aws::S3::Model::Delete _delete;
    for (const auto &_key : keys)
      _delete.AddObjects(Aws::S3::Model::ObjectIdentifier().WithKey(_key));
    _delete.SetQuiet(false);

    Aws::S3::Model::DeleteObjectsRequest _request;
    _request.SetBucket(bucket);
    _request.SetDelete(std::move(_delete));

    const auto _outcome = client_->DeleteObjects(_request);
    if (!_outcome.IsSuccess())
    {
      const auto &_error = _outcome.GetError();
      throw backend_error(fmt::format(
        "s3 delete objects on bucket {} failed with status {}: {} {}",
        bucket,
        static_cast<int>(_error.GetResponseCode()),
        _error.GetExceptionName(),
        _error.GetMessage()));
    }

    const auto &_result = _outcome.GetResult();
    for (const auto &_error : _result.GetErrors())
      fmt::print(
        "[s3] [{:%Y-%m-%d %H:%M:%S}] OBJECT DELETE FAILED bucket={} key={} code={} message={}\n",
        std::chrono::system_clock::now(),
        bucket,
        _error.GetKey(),
        _error.GetCode(),
        _error.GetMessage());

    std::vector<std::string> _deleted;
    _deleted.reserve(_result.GetDeleted().size());
    for (const auto &_object : _result.GetDeleted())
      _deleted.emplace_back(_object.GetKey());
    return _deleted;
  }
} // namespace reclaim
