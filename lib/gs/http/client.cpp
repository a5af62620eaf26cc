/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <memory>
#include <string>
#ifdef __clang__
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#ifndef BOOST_ALLOW_DEPRECATED_HEADERS
#   define BOOST_ALLOW_DEPRECATED_HEADERS
#   define GS_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#ifdef GS_CLEAR_BOOST_DEPRECATED_HEADERS
#   undef BOOST_ALLOW_DEPRECATED_HEADERS
#   undef GS_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#ifdef __clang__
#   pragma GCC diagnostic pop
#endif
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <gs/http/client.hpp>
#include <gs/logger.hpp>

namespace graph_sentinel::http {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    namespace {
        struct connection: std::enable_shared_from_this<connection> {
            connection(net::io_context &ioc, post_result &res, const std::chrono::steady_clock::time_point deadline)
                : _resolver { ioc }, _stream { ioc }, _res { res }, _deadline { deadline }
            {
            }

            void run(const std::string &host, const std::string &port, http::request<http::string_body> &&req)
            {
                _req = std::move(req);
                logger::trace("{}: resolving {}:{}", _res.url, host, port);
                _resolver.async_resolve(host, port, beast::bind_front_handler(&connection::_on_resolve, shared_from_this()));
            }
        private:
            tcp::resolver _resolver;
            beast::tcp_stream _stream;
            beast::flat_buffer _buffer {};
            http::request<http::string_body> _req {};
            http::response<http::string_body> _resp {};
            post_result &_res;
            const std::chrono::steady_clock::time_point _deadline;

            std::chrono::milliseconds _remaining() const
            {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(_deadline - std::chrono::steady_clock::now());
                return std::max(left, std::chrono::milliseconds { 0 });
            }

            void _handle_error(const beast::error_code ec, const std::string_view op)
            {
                _res.timed_out = ec == beast::error::timeout;
                _res.error = fmt::format("{} failed: {}", op, ec.message());
                logger::trace("{}: {}", _res.url, *_res.error);
            }

            void _on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec) {
                    _handle_error(ec, "async_resolve");
                    return;
                }
                _stream.expires_after(_remaining());
                _stream.async_connect(results, beast::bind_front_handler(&connection::_on_connect, shared_from_this()));
            }

            void _on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (ec) {
                    _handle_error(ec, "async_connect");
                    return;
                }
                _stream.expires_after(_remaining());
                http::async_write(_stream, _req, beast::bind_front_handler(&connection::_on_write, shared_from_this()));
            }

            void _on_write(beast::error_code ec, std::size_t /*bytes_transferred*/)
            {
                if (ec) {
                    _handle_error(ec, "async_write");
                    return;
                }
                _stream.expires_after(_remaining());
                http::async_read(_stream, _buffer, _resp, beast::bind_front_handler(&connection::_on_read, shared_from_this()));
            }

            void _on_read(beast::error_code ec, std::size_t /*bytes_transferred*/)
            {
                if (ec) {
                    _handle_error(ec, "async_read");
                    return;
                }
                _res.status = _resp.result_int();
                _res.body = std::move(_resp.body());
                beast::error_code close_ec {};
                _stream.socket().shutdown(tcp::socket::shutdown_both, close_ec);
                if (close_ec && close_ec != beast::errc::not_connected)
                    logger::trace("{}: socket shutdown failed: {}", _res.url, close_ec.message());
            }
        };
    }

    post_result post(const std::string &url, const std::string &body, const std::chrono::milliseconds timeout, const header_list &headers)
    {
        post_result res { .url=url };
        const auto start = std::chrono::steady_clock::now();
        const boost::url_view uri { url };
        if (uri.scheme() != "http")
            throw error(fmt::format("only http urls are supported but got {}", url));
        std::string target { uri.encoded_path() };
        if (target.empty())
            target = "/";
        if (uri.has_query())
            target += fmt::format("?{}", std::string_view { uri.encoded_query() });
        const std::string host { uri.host() };
        std::string port { uri.port() };
        if (port.empty())
            port = "80";

        http::request<http::string_body> req {};
        req.version(11);
        req.keep_alive(false);
        req.method(http::verb::post);
        req.target(target);
        req.set(http::field::host, host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        for (const auto &[name, val]: headers)
            req.set(name, val);
        req.body() = body;
        req.prepare_payload();

        net::io_context ioc {};
        std::make_shared<connection>(ioc, res, start + timeout)->run(host, port, std::move(req));
        // the resolver has no deadline of its own
        ioc.run_for(timeout);
        if (!res.status && !res.error) {
            res.timed_out = true;
            res.error = fmt::format("no response within {}", timeout);
        }
        res.duration = std::chrono::duration<double> { std::chrono::steady_clock::now() - start }.count();
        return res;
    }
}
