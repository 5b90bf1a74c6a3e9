// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "schema_server.hpp"

#include "json_utils.hpp"
#include "metadata/schema_error.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
    std::string get_current_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %X");
        return ss.str();
    }

    http::status status_for(metadata::schema_mistake_t mistake) {
        switch (mistake) {
            case metadata::schema_mistake_t::UNKNOWN_COLLECTION:
                return http::status::not_found;
            case metadata::schema_mistake_t::MALFORMED_RESTRICTION:
                return http::status::bad_request;
            case metadata::schema_mistake_t::EXECUTION_FAILED:
                return http::status::bad_gateway;
        }
        return http::status::internal_server_error;
    }
} // namespace

namespace http_server {
    Session::Session(tcp::socket socket, std::shared_ptr<const metadata::SchemaProvider> provider)
        : socket_(std::move(socket))
        , provider_(std::move(provider))
        , log_(get_logger(logger_tag::HTTP_SERVER)) {}

    void Session::start() { read_request(); }

    void Session::read_request() {
        auto self = shared_from_this();
        http::async_read(socket_, buffer_, request_, [self](beast::error_code ec, std::size_t) {
            if (!ec) {
                self->handle_request();
            } else if (ec != http::error::end_of_stream) {
                self->log_->warn("read failed: {}", ec.message());
            }
        });
    }

    void Session::handle_request() {
        response_.clear();
        response_.version(request_.version());
        response_.keep_alive(false);

        log_->debug("{} {}", std::string(request_.method_string()), std::string(request_.target()));
        if (request_.method() == http::verb::get && request_.target() == "/health") {
            write_json(http::status::ok,
                       boost::json::object{{"status", "healthy"}, {"timestamp", get_current_timestamp()}});
        } else if (request_.method() == http::verb::get && request_.target() == "/collections") {
            write_json(http::status::ok, to_json(provider_->list_collections()));
        } else if (request_.method() == http::verb::post && request_.target() == "/fetch") {
            handle_fetch();
        } else {
            write_error(http::status::not_found, "NotFound", "Resource not found");
        }
    }

    void Session::handle_fetch() {
        std::string collection;
        sql_gen::restriction_set restrictions;
        try {
            auto json_body = boost::json::parse(request_.body());
            if (!json_body.is_object()) {
                write_error(http::status::bad_request, "InvalidRequest", "Body must be a JSON object");
                return;
            }
            const auto& body = json_body.as_object();
            if (!body.contains("collection") || !body.at("collection").is_string()) {
                write_error(http::status::bad_request, "InvalidRequest", "Missing key: collection");
                return;
            }
            collection = body.at("collection").as_string().c_str();
            if (body.contains("restrictions")) {
                restrictions = restrictions_from_json(body.at("restrictions"));
            }
        } catch (const std::exception& e) {
            write_error(http::status::bad_request, "InvalidRequest", e.what());
            return;
        }

        boost::json::object result;
        try {
            result = to_json(provider_->fetch(collection, restrictions));
        } catch (const metadata::schema_error& e) {
            log_->error("fetch {} failed: {}", collection, e.what());
            write_error(status_for(e.mistake()), metadata::to_string(e.mistake()), e.what());
            return;
        }
        write_json(http::status::ok, result);
    }

    void Session::write_json(http::status status, const boost::json::value& body) {
        response_.result(status);
        response_.set(http::field::content_type, "application/json");
        response_.body() = boost::json::serialize(body);
        response_.prepare_payload();
        write_response();
    }

    void Session::write_error(http::status status, const char* kind, const std::string& message) {
        write_json(status, boost::json::object{{"error", kind}, {"message", message}});
    }

    void Session::write_response() {
        auto self = shared_from_this();
        http::async_write(socket_, response_, [self](beast::error_code ec, std::size_t) {
            if (ec) {
                self->log_->warn("write failed: {}", ec.message());
            }
            self->socket_.shutdown(tcp::socket::shutdown_send, ec);
        });
    }

    Server::Server(asio::io_context& ioc,
                   unsigned short port,
                   std::shared_ptr<const metadata::SchemaProvider> provider)
        : ioc_(ioc)
        , acceptor_(ioc, tcp::endpoint(tcp::v4(), port))
        , provider_(std::move(provider)) {
        accept();
    }

    void Server::accept() {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<Session>(std::move(socket), provider_)->start();
            } else {
                get_logger(logger_tag::HTTP_SERVER)->warn("accept failed: {}", ec.message());
            }
            accept();
        });
    }
} // namespace http_server
