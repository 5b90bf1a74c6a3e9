// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "mysql_connector.hpp"

#include "utility/thread_pool_manager.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace mysqlc {

    std::unique_ptr<mysqlc::IConnector>
    make_mysql_connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias);

    class ConnectorManager {
    public:
        explicit ConnectorManager(connector_factory make_connector = make_mysql_connector,
                                  size_t pool_size = std::thread::hardware_concurrency());
        thread_pool_status status() const noexcept;
        void start();
        void stop();

        std::string addConnection(mysql::connect_params connection_param, const std::string& alias);
        void removeConnection(const std::string& alias);

        // Runs the statement on the pool and waits for it; rethrows whatever the connector threw.
        // Statements on one alias never overlap, different aliases run in parallel.
        metadata::raw_result
        executeQuery(const std::string& alias, sql_gen::bound_statement statement, raw_handler handler);

        size_t totalConnections() const;
        std::optional<mysql::connect_params> conn_params(const std::string& alias) const;
        bool hasConnection(const std::string& alias) const;

    private:
        // a connection accepts one operation at a time
        struct connection_slot {
            std::unique_ptr<mysqlc::IConnector> connector;
            std::mutex mutex;
        };
        using slot_ptr = std::shared_ptr<connection_slot>;

        slot_ptr find(const std::string& alias) const;

        log_t log_;
        thread_pool_manager thread_pool_manager_;
        connector_factory make_connector_;
        mutable std::shared_mutex connections_mutex_;
        std::unordered_map<std::string, slot_ptr> connections_;
    };
} // namespace mysqlc
