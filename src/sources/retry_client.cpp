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

#include <reclaim/retry_client.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/core/ignore_unused.hpp>
#include <reclaim/exceptions.hpp>
#include <reclaim/utils.hpp>

namespace reclaim
{
  namespace http = boost::beast::http;

  namespace
  {
    std::string method_name(const http_request &request)
    {
      const auto _method = request.method_string();
      return {_method.data(), _method.size()};
    }

    bool is_redirect(const unsigned status)
    {
      return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
    }

    http_url resolve_location(const http_url &base, const std::string_view location)
    {
      if (location.starts_with("http://") || location.starts_with("https://"))
        return parse_http_url(location);

      http_url _next = base;
      _next.target_ = location.starts_with('/') ? std::string(location) : "/" + std::string(location);
      return _next;
    }
  } // namespace

  http_url parse_http_url(const std::string_view url)
  {
    constexpr std::string_view _scheme = "http://";
    if (!url.starts_with(_scheme))
      throw validation_error(fmt::format("unsupported url '{}', expected http://host[:port]/path", url));

    const auto _rest = url.substr(_scheme.size());
    const auto _slash = _rest.find('/');
    const auto _authority = _rest.substr(0, _slash);
    if (_authority.empty())
      throw validation_error(fmt::format("url '{}' has no host", url));

    http_url _result;
    if (_slash != std::string_view::npos)
      _result.target_ = std::string(_rest.substr(_slash));

    if (const auto _colon = _authority.rfind(':'); _colon != std::string_view::npos)
    {
      _result.host_ = std::string(_authority.substr(0, _colon));
      _result.port_ = std::string(_authority.substr(_colon + 1));
    }
    else
    {
      _result.host_ = std::string(_authority);
    }
    return _result;
  }

  retry_client::retry_client(retry_client_options options) :
      options_(options), policy_(options.wait_min_, options.wait_max_)
  {
  }

  http_response retry_client::execute(run_context &context, http_request request, const std::string &url)
  {
    const auto _url = parse_http_url(url);

    for (int _attempt = 0;; ++_attempt)
    {
      std::optional<http_response> _response;
      std::optional<transport_failure> _failure;
      try
      {
        _response = send(_url, request);
      }
      catch (const transport_error &e)
      {
        _failure = transport_failure{e.what(), e.redirect_limit_};
      }

      std::optional<unsigned> _status;
      if (_response)
        _status = _response->result_int();

      // A call that completed is kept even when the context ended while it was in flight.
      if (_status && !retry_policy::is_retryable_status(*_status))
        return std::move(*_response);

      auto _decision = retry_policy::should_retry(context, _status, _failure);
      if (!_decision.retry_)
      {
        if (_decision.error_)
          throw transport_error(*_decision.error_, _failure && _failure->redirect_limit_);
        return std::move(*_response);
      }

      if (_attempt >= options_.retry_max_)
      {
        if (_failure)
          throw transport_error(
            fmt::format("{} {} giving up after {} attempt(s): {}", method_name(request), url, _attempt + 1, _failure->message_));
        return std::move(*_response);
      }

      const auto _wait = policy_.backoff(_attempt);
#ifndef NDEBUG
      fmt::print(
        "[http] [{:%Y-%m-%d %H:%M:%S}] RETRYING {} {} attempt={} status={} error={} wait_ms={}\n",
        std::chrono::system_clock::now(),
        method_name(request),
        url,
        _attempt + 1,
        _status.value_or(0),
        _failure ? _failure->message_ : "none",
        _wait.count());
#endif
      if (!context.sleep_for(_wait))
        throw transport_error(context.error().value_or("context canceled"));
    }
  }

  http_response retry_client::send(http_url url, http_request request)
  {
    for (int _redirects = 0;; ++_redirects)
    {
      auto _response = round_trip(url, request);
      const auto _status = _response.result_int();
      const auto _location = _response.find(http::field::location);
      if (!is_redirect(_status) || _location == _response.end())
        return _response;

      if (_redirects >= options_.max_redirects_)
        throw transport_error(
          fmt::format(
            "{} \"{}\": stopped after {} redirects", method_name(request), url.to_string(), options_.max_redirects_),
          true);

      const auto _value = _location->value();
      url = resolve_location(url, std::string_view(_value.data(), _value.size()));
      if (_status == 303 || ((_status == 301 || _status == 302) && request.method() == http::verb::post))
      {
        request.method(http::verb::get);
        request.body().clear();
        request.erase(http::field::content_type);
      }
    }
  }

  http_response retry_client::round_trip(const http_url &url, http_request &request)
  {
    request.target(url.target_);
    request.set(http::field::host, url.port_ == "80" ? url.host_ : url.authority());
    request.keep_alive(true);
    request.prepare_payload();

    auto _stream = acquire(url);

    boost::beast::error_code _ec;
    http::write(*_stream, request, _ec);
    if (_ec)
      throw transport_error(fmt::format("{} \"{}\": {}", method_name(request), url.to_string(), _ec.message()));

    boost::beast::flat_buffer _buffer;
    http_response _response;
    http::read(*_stream, _buffer, _response, _ec);
    if (_ec)
      throw transport_error(fmt::format("{} \"{}\": {}", method_name(request), url.to_string(), _ec.message()));

    if (_response.keep_alive())
    {
      release(url, std::move(_stream));
    }
    else
    {
      _stream->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, _ec);
      boost::ignore_unused(_ec);
    }
    return _response;
  }

  std::unique_ptr<boost::beast::tcp_stream> retry_client::acquire(const http_url &url)
  {
    {
      std::scoped_lock _guard(pool_mutex_);
      if (const auto _it = idle_.find(url.authority()); _it != idle_.end() && !_it->second.empty())
      {
        auto _stream = std::move(_it->second.back());
        _it->second.pop_back();
        return _stream;
      }
    }

    boost::asio::ip::tcp::resolver _resolver(ioc_);
    boost::beast::error_code _ec;
    const auto _endpoints = _resolver.resolve(url.host_, url.port_, _ec);
    if (_ec)
      throw transport_error(fmt::format("dial {}: {}", url.authority(), _ec.message()));

    auto _stream = std::make_unique<boost::beast::tcp_stream>(ioc_);
    _stream->connect(_endpoints, _ec);
    if (_ec)
      throw transport_error(fmt::format("dial {}: {}", url.authority(), _ec.message()));
    return _stream;
  }

  void retry_client::release(const http_url &url, std::unique_ptr<boost::beast::tcp_stream> stream)
  {
    std::scoped_lock _guard(pool_mutex_);
    if (auto &_pool = idle_[url.authority()]; _pool.size() < options_.max_idle_connections_per_host_)
      _pool.push_back(std::move(stream));
  }

  std::size_t retry_client::idle_connections(const std::string &authority) const
  {
    std::scoped_lock _guard(pool_mutex_);
    const auto _it = idle_.find(authority);
    return _it == idle_.end() ? 0 : _it->second.size();
  }
} // namespace reclaim
