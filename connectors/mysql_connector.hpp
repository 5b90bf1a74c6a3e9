// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/asio.hpp>
#include <boost/mysql.hpp>
#include <boost/mysql/any_address.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/error_with_diagnostics.hpp>
#include <boost/mysql/results.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "metadata/types.hpp"
#include "query_generation/positional_statement.hpp"
#include "query_generation/restriction_builder.hpp"
#include "utility/logger.hpp"

#include <concepts>
#include <coroutine>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mysqlc {

    namespace mysql = boost::mysql;
    namespace asio = boost::asio;

    enum class Status
    {
        Created,
        Connected,
        Disconnected,
        Closed
    };

    using raw_handler = std::function<metadata::raw_result(const boost::mysql::results&)>;

    class IConnector {
    public:
        virtual ~IConnector() = default;
        virtual Status status() const noexcept = 0;
        virtual mysql::connect_params params() const noexcept = 0;
        virtual void close() = 0;
        virtual void connect() = 0;
        virtual bool isConnected() = 0;
        virtual void tryReconnect() = 0;
        virtual bool isClosed() const noexcept = 0;
        virtual std::string alias() const noexcept = 0;

        virtual asio::awaitable<metadata::raw_result> runStatement(sql_gen::bound_statement statement,
                                                                   raw_handler handler) = 0;
    };

    class Connector : public IConnector {
    public:
        Connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias = "");
        Status status() const noexcept override;
        mysql::connect_params params() const noexcept override;
        void close() override;
        ~Connector() override;
        void connect() override;
        bool isConnected() override;
        void tryReconnect() override;
        bool isClosed() const noexcept override;
        std::string alias() const noexcept override;

        asio::awaitable<metadata::raw_result> runStatement(sql_gen::bound_statement statement,
                                                           raw_handler handler) override {
            return runStatement_(std::move(statement), std::move(handler));
        }

    private:
        template<typename Callable>
        requires std::invocable<Callable, const boost::mysql::results&>
            asio::awaitable<std::invoke_result_t<Callable, const boost::mysql::results&>>
            runStatement_(sql_gen::bound_statement statement, Callable handler) {
            if (status_ != Status::Connected) {
                std::string err = "[Run statement] Connector with alias: " + alias_ + " is not connected";
                log_->error(err);
                throw std::runtime_error(err);
            }
            boost::system::error_code ec;
            mysql::diagnostics diag;
            co_await conn_.async_ping(diag, asio::redirect_error(asio::use_awaitable, ec));

            if (ec) {
                std::string err = "[Run statement] Connector with alias: " + alias_ + " ping failed: " + ec.message();
                log_->error(err);
                throw std::runtime_error(err);
            }

            log_->debug("Alias: {} statement: {} ({} parameters)", alias_, statement.text, statement.parameters.size());
            mysql::results result;
            if (statement.parameters.empty()) {
                co_await conn_.async_execute(statement.text, result, diag, asio::redirect_error(asio::use_awaitable, ec));
                if (ec) {
                    throw failure(statement.text, ec, diag);
                }
                co_return handler(result);
            }

            // named markers are rewritten to '?', values stay bound, never spliced into the text
            auto positional = sql_gen::to_positional(statement);
            mysql::statement stmt = co_await conn_.async_prepare_statement(
                positional.text, diag, asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                throw failure(positional.text, ec, diag);
            }

            std::vector<mysql::field_view> values;
            values.reserve(positional.values.size());
            for (const auto& value : positional.values) {
                values.emplace_back(std::string_view(value));
            }

            co_await conn_.async_execute(stmt.bind(values.begin(), values.end()),
                                         result,
                                         diag,
                                         asio::redirect_error(asio::use_awaitable, ec));
            auto execute_ec = ec;
            auto execute_diag = diag;

            co_await conn_.async_close_statement(stmt, diag, asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                log_->warn("Alias: {} failed to close prepared statement: {}", alias_, ec.message());
            }
            if (execute_ec) {
                throw failure(positional.text, execute_ec, execute_diag);
            }

            co_return handler(result);
        }

        std::runtime_error
        failure(std::string_view query, const boost::system::error_code& ec, const mysql::diagnostics& diag) const;

    private:
        log_t log_;
        mysql::any_connection conn_;
        mysql::connect_params params_;
        Status status_;
        std::string alias_;
    };

    using connector_factory =
        std::function<std::unique_ptr<IConnector>(asio::io_context&, mysql::connect_params, std::string)>;

} // namespace mysqlc
