// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "mysql_connector.hpp"

#include <chrono>
#include <thread>

namespace mysql = boost::mysql;
namespace asio = boost::asio;

namespace mysqlc {
    Connector::Connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias)
        : log_(get_logger(logger_tag::CONNECTOR))
        , conn_(io_ctx)
        , params_{std::move(params)}
        , status_{Status::Created}
        , alias_{std::move(alias)} {}

    mysql::connect_params Connector::params() const noexcept { return params_; }

    Status Connector::status() const noexcept { return status_; }

    void Connector::close() {
        if (status_ != Status::Connected) {
            return;
        }
        log_->info("Alias: {} close connection", alias_);
        boost::system::error_code ec;
        mysql::diagnostics diag;
        conn_.close(ec, diag);
        if (ec) {
            log_->warn("Alias: {} close failed: {}", alias_, ec.message());
        }
        status_ = Status::Closed;
    }

    Connector::~Connector() { close(); }

    void Connector::connect() {
        // column labels are needed to project rows onto the collection schema
        conn_.set_meta_mode(mysql::metadata_mode::full);
        boost::system::error_code ec;
        mysql::diagnostics diag;
        conn_.connect(params_, ec, diag);
        if (ec) {
            log_->warn("Alias: {} connect failed: {} {}", alias_, ec.message(), diag.server_message());
            tryReconnect();
            return;
        }
        status_ = Status::Connected;
    }

    bool Connector::isConnected() {
        if (status_ != Status::Connected)
            return false;
        boost::system::error_code ec;
        mysql::diagnostics diag;
        conn_.ping(ec, diag);
        if (ec) {
            status_ = Status::Disconnected;
            log_->warn("Alias: {} ping failed: {}", alias_, ec.message());
            return false;
        }
        return true;
    }

    void Connector::tryReconnect() {
        if (status_ == Status::Connected) {
            return;
        }
        status_ = Status::Disconnected;
        size_t attempts = 0;
        log_->info("Alias: {} try to reconnect", alias_);

        boost::system::error_code ec;
        mysql::diagnostics diag;
        do {
            conn_.connect(params_, ec, diag);
            if (!ec) {
                log_->info("Alias: {} reconnect success", alias_);
                status_ = Status::Connected;
                return;
            }
            log_->warn("Alias: {} reconnect attempt: {} failed: {} {}",
                       alias_,
                       attempts,
                       ec.message(),
                       diag.server_message());
            ++attempts;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        } while (attempts < 3);
        std::string error = "[Connector] Alias: " + alias_ + " connect failed " + ec.message();
        log_->error(error);
        throw std::runtime_error(error);
    }

    bool Connector::isClosed() const noexcept { return status_ == Status::Closed; }
    std::string Connector::alias() const noexcept { return alias_; }

    std::runtime_error Connector::failure(std::string_view query,
                                          const boost::system::error_code& ec,
                                          const mysql::diagnostics& diag) const {
        log_->error("Alias: {} query [{}] failed: {} {}", alias_, query, ec.message(), diag.server_message());
        std::string message = "[Run statement] Alias: " + alias_ + " query [" + std::string(query) +
                              "]\nfailed: " + ec.message();
        if (!diag.server_message().empty()) {
            message += ": " + std::string(diag.server_message());
        }
        return std::runtime_error(message);
    }
} // namespace mysqlc
