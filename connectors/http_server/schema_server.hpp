// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>

#include <memory>

#include "provider/schema_provider.hpp"
#include "utility/logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace http_server {
    // GET /health, GET /collections, POST /fetch
    class Session : public std::enable_shared_from_this<Session> {
        tcp::socket socket_;
        beast::flat_buffer buffer_{8192};
        http::request<http::string_body> request_;
        http::response<http::string_body> response_;
        std::shared_ptr<const metadata::SchemaProvider> provider_;
        log_t log_;

    public:
        Session(tcp::socket socket, std::shared_ptr<const metadata::SchemaProvider> provider);
        void start();

    private:
        void read_request();
        void handle_request();
        void handle_fetch();
        void write_json(http::status status, const boost::json::value& body);
        void write_error(http::status status, const char* kind, const std::string& message);
        void write_response();
    };

    class Server {
        asio::io_context& ioc_;
        tcp::acceptor acceptor_;

    public:
        Server(asio::io_context& ioc, unsigned short port, std::shared_ptr<const metadata::SchemaProvider> provider);

    private:
        void accept();
        std::shared_ptr<const metadata::SchemaProvider> provider_;
    };
} // namespace http_server
