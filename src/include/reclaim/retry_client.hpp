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

#ifndef RECLAIM_RETRY_CLIENT_HPP
#define RECLAIM_RETRY_CLIENT_HPP

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <reclaim/retry_policy.hpp>
#include <reclaim/run_context.hpp>

namespace reclaim
{
  /**
   * HTTP request
   */
  using http_request = boost::beast::http::request<boost::beast::http::string_body>;

  /**
   * HTTP response
   */
  using http_response = boost::beast::http::response<boost::beast::http::string_body>;

  /**
   * Default idle connections kept per host
   */
  constexpr std::size_t default_max_idle_connections_per_host = 100;

  /**
   * Retry client options
   */
  struct retry_client_options
  {
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

    /**
     * Idle keep-alive connections kept per host
     */
    std::size_t max_idle_connections_per_host_ = default_max_idle_connections_per_host;

    /**
     * Redirects followed before giving up
     */
    int max_redirects_ = 10;
  };

  /**
   * HTTP URL
   */
  struct http_url
  {
    /**
     * Host
     */
    std::string host_;

    /**
     * Port
     */
    std::string port_ = "80";

    /**
     * Target, path and query
     */
    std::string target_ = "/";

    /**
     * Host and port
     *
     * @return std::string
     */
    [[nodiscard]] std::string authority() const
    {
      return host_ + ":" + port_;
    }

    /**
     * To string
     *
     * @return std::string
     */
    [[nodiscard]] std::string to_string() const
    {
      return "http://" + authority() + target_;
    }
  };

  /**
   * Parse URL, only plain http is supported
   *
   * @param url
   * @return http_url
   */
  http_url parse_http_url(std::string_view url);

  /**
   * Retry client
   *
   * Blocking HTTP/1.1 client. Every attempt goes through retry_policy and the
   * waits between attempts are interrupted by the run context.
   */
  class retry_client
  {
  public:
    /**
     * Constructor
     *
     * @param options
     */
    explicit retry_client(retry_client_options options = {});

    /**
     * Execute
     *
     * Throws transport_error for terminal failures and when the budget is
     * exhausted on a transport failure. An exhausted budget on a retryable
     * status returns the last response.
     *
     * @param context
     * @param request
     * @param url
     * @return http_response
     */
    http_response execute(run_context &context, http_request request, const std::string &url);

    /**
     * Idle connections kept for a host
     *
     * @param authority host:port
     * @return std::size_t
     */
    [[nodiscard]] std::size_t idle_connections(const std::string &authority) const;

  private:
    /**
     * Send following redirects
     *
     * @param url
     * @param request
     * @return http_response
     */
    http_response send(http_url url, http_request request);

    /**
     * Round trip over a pooled or fresh connection
     *
     * @param url
     * @param request
     * @return http_response
     */
    http_response round_trip(const http_url &url, http_request &request);

    /**
     * Acquire connection
     *
     * @param url
     * @return std::unique_ptr<boost::beast::tcp_stream>
     */
    std::unique_ptr<boost::beast::tcp_stream> acquire(const http_url &url);

    /**
     * Release connection into the idle pool
     *
     * @param url
     * @param stream
     */
    void release(const http_url &url, std::unique_ptr<boost::beast::tcp_stream> stream);

    /**
     * Options
     */
    retry_client_options options_;

    /**
     * Policy
     */
    retry_policy policy_;

    /**
     * IO Context
     */
    boost::asio::io_context ioc_;

    /**
     * Pool mutex
     */
    mutable std::mutex pool_mutex_;

    /**
     * Idle connections by host:port
     */
    std::unordered_map<std::string, std::vector<std::unique_ptr<boost::beast::tcp_stream>>> idle_;
  };
} // namespace reclaim

#endif // RECLAIM_RETRY_CLIENT_HPP
