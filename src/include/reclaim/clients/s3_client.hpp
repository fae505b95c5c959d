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

#ifndef RECLAIM_CLIENTS_S3_CLIENT_HPP
#define RECLAIM_CLIENTS_S3_CLIENT_HPP

#include <aws/core/Aws.h>
#include <aws/core/client/AWSError.h>
#include <aws/core/client/CoreErrors.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/s3/S3Client.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <reclaim/retry_policy.hpp>
#include <reclaim/run_context.hpp>

namespace reclaim
{
  /**
   * S3 client
   */
  class s3_client
  {
  public:
    /**
     * Destructor
     */
    virtual ~s3_client() = default;

    /**
     * Multi-object delete
     *
     * @param bucket
     * @param keys
     * @return std::vector<std::string> keys reported deleted, throws backend_error
     */
    virtual std::vector<std::string> delete_objects(const std::string &bucket, const std::vector<std::string> &keys) = 0;
  };

  /**
   * AWS SDK lifetime
   *
   * Must outlive every aws_s3_client.
   */
  class aws_api
  {
  public:
    aws_api();

    ~aws_api();

    aws_api(const aws_api &) = delete;
    aws_api &operator=(const aws_api &) = delete;
    aws_api(aws_api &&) = delete;
    aws_api &operator=(aws_api &&) = delete;

  private:
    /**
     * SDK options
     */
    Aws::SDKOptions options_;
  };

  /**
   * S3 client options
   */
  struct s3_client_options
  {
    /**
     * Region
     */
    std::string region_ = "us-east-1";

    /**
     * Endpoint override, path-style addressing when set
     */
    std::string endpoint_;

    /**
     * Retries after the first attempt
     */
    int retry_max_ = 4;

    /**
     * Minimum wait
     */
    std::chrono::milliseconds wait_min_{200};

    /**
     * Maximum wait
     */
    std::chrono::milliseconds wait_max_{5000};
  };

  /**
   * Retry strategy driven by retry_policy
   *
   * The run context is consulted only after a failed attempt, a call that
   * completed is never discarded.
   */
  class context_retry_strategy final : public Aws::Client::RetryStrategy
  {
  public:
    /**
     * Constructor
     *
     * @param context
     * @param retry_max
     * @param policy
     */
    context_retry_strategy(const run_context &context, int retry_max, retry_policy policy);

    bool ShouldRetry(const Aws::Client::AWSError<Aws::Client::CoreErrors> &error, long attemptedRetries) const override;

    long CalculateDelayBeforeNextRetry(
      const Aws::Client::AWSError<Aws::Client::CoreErrors> &error,
      long attemptedRetries) const override;

    long GetMaxAttempts() const override;

  private:
    /**
     * Context
     */
    const run_context &context_;

    /**
     * Retry max
     */
    int retry_max_;

    /**
     * Policy
     */
    retry_policy policy_;
  };

  /**
   * AWS S3 client
   *
   * Credentials come from the SDK default provider chain.
   */
  class aws_s3_client final : public s3_client
  {
  public:
    /**
     * Constructor
     *
     * @param context
     * @param options
     */
    aws_s3_client(const run_context &context, const s3_client_options &options);

    std::vector<std::string> delete_objects(const std::string &bucket, const std::vector<std::string> &keys) override;

  private:
    /**
     * Client
     */
    std::shared_ptr<Aws::S3::S3Client> client_;
  };
} // namespace reclaim

#endif // RECLAIM_CLIENTS_S3_CLIENT_HPP
