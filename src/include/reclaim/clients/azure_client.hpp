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

#ifndef RECLAIM_CLIENTS_AZURE_CLIENT_HPP
#define RECLAIM_CLIENTS_AZURE_CLIENT_HPP

#include <azure/storage/blobs.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace reclaim
{
  /**
   * Azure client
   */
  class azure_client
  {
  public:
    /**
     * Destructor
     */
    virtual ~azure_client() = default;

    /**
     * Delete blobs including their snapshots
     *
     * @param urls
     * @return std::vector<unsigned> one status per url, 0 when no response was received
     */
    virtual std::vector<unsigned> delete_blobs(const std::vector<std::string> &urls) = 0;
  };

  /**
   * Azure client options
   */
  struct azure_client_options
  {
    /**
     * Endpoint, replaces scheme://account of every url when not empty
     */
    std::string endpoint_;

    /**
     * SAS token
     */
    std::string sas_token_;

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
   * Blob location
   */
  struct blob_location
  {
    /**
     * Container URL, without the SAS token
     */
    std::string container_url_;

    /**
     * Blob name inside the container
     */
    std::string blob_name_;
  };

  /**
   * Blob batch client
   *
   * Deletes the blobs of each container with one batch request.
   */
  class blob_batch_client final : public azure_client
  {
  public:
    /**
     * Constructor
     *
     * @param options
     */
    explicit blob_batch_client(azure_client_options options);

    std::vector<unsigned> delete_blobs(const std::vector<std::string> &urls) override;

    /**
     * Locate a blob url, throws validation_error
     *
     * @param url
     * @return blob_location
     */
    [[nodiscard]] blob_location locate(const std::string &url) const;

  private:
    /**
     * Container client for a container url
     *
     * @param container_url
     * @return Azure::Storage::Blobs::BlobContainerClient
     */
    [[nodiscard]] Azure::Storage::Blobs::BlobContainerClient container(const std::string &container_url) const;

    /**
     * Endpoint
     */
    std::string endpoint_;

    /**
     * SAS token, without the leading '?'
     */
    std::string sas_token_;

    /**
     * SDK options
     */
    Azure::Storage::Blobs::BlobClientOptions client_options_;
  };
} // namespace reclaim

#endif // RECLAIM_CLIENTS_AZURE_CLIENT_HPP
