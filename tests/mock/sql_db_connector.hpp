// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "connectors/mysql_connector.hpp"
#include "mock_config.hpp"

#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/mysql.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <utility>

// Shared by every connector a factory creates
struct mock_stats {
    std::atomic<int> calls{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
};

namespace mysqlc {

    class MockConnector : public mysqlc::IConnector {
    public:
        explicit MockConnector(mock_config config = {}, std::shared_ptr<mock_stats> stats = nullptr)
            : config_(std::move(config))
            , stats_(std::move(stats)) {}

        mysqlc::Status status() const noexcept override { return closed_ ? Status::Closed : Status::Connected; }

        mysql::connect_params params() const noexcept override { return mysql::connect_params{}; }

        void close() override { closed_ = true; }

        void connect() override { closed_ = false; }

        bool isConnected() override { return !closed_; }

        void tryReconnect() override { connect(); }

        bool isClosed() const noexcept override { return closed_; }

        std::string alias() const noexcept override { return "mock_connector"; }

        asio::awaitable<metadata::raw_result> runStatement(sql_gen::bound_statement statement,
                                                           raw_handler) override {
            if (config_.can_throw) {
                throw std::runtime_error(config_.error_message.empty() ? "MockConnector: exception in runStatement"
                                                                       : config_.error_message);
            }
            if (!stats_) {
                std::this_thread::sleep_for(config_.wait_time); // Simulate some processing delay
                co_return config_.result;
            }

            ++stats_->calls;
            const int running = ++stats_->active;
            int seen = stats_->max_active.load();
            while (running > seen && !stats_->max_active.compare_exchange_weak(seen, running)) {
            }
            std::this_thread::sleep_for(config_.wait_time);
            --stats_->active;
            co_return config_.result;
        }

    private:
        mock_config config_;
        std::shared_ptr<mock_stats> stats_;
        bool closed_ = false;
    };

} // namespace mysqlc

inline auto mysql_mock_connector_factory(mock_config config = {}, std::shared_ptr<mock_stats> stats = nullptr) {
    return [config, stats](boost::asio::io_context&, boost::mysql::connect_params, std::string) {
        return std::make_unique<mysqlc::MockConnector>(config, stats);
    };
}

inline auto mysql_mock_connector_factory_throw(std::string error_message) {
    return mysql_mock_connector_factory(mock_config{.can_throw = true, .error_message = std::move(error_message)});
}
