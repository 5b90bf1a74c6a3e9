// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "mysql_manager.hpp"

#include <boost/asio/use_future.hpp>

namespace mysqlc {

    std::unique_ptr<mysqlc::IConnector>
    make_mysql_connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias) {
        return std::make_unique<mysqlc::Connector>(io_ctx, std::move(params), std::move(alias));
    }

    ConnectorManager::ConnectorManager(connector_factory make_connector, size_t pool_size)
        : log_(get_logger(logger_tag::CONNECTOR_MANAGER))
        , thread_pool_manager_(pool_size)
        , make_connector_(std::move(make_connector)) {}

    thread_pool_status ConnectorManager::status() const noexcept { return thread_pool_manager_.status(); }

    void ConnectorManager::start() { thread_pool_manager_.start(); }

    void ConnectorManager::stop() { thread_pool_manager_.stop(); }

    std::string ConnectorManager::addConnection(mysql::connect_params connection_param, const std::string& alias) {
        try {
            log_->debug("Try add connection with alias: {}", alias);
            auto slot = std::make_shared<connection_slot>();
            slot->connector = make_connector_(thread_pool_manager_.ctx(), std::move(connection_param), alias);
            slot->connector->connect();

            std::unique_lock lock(connections_mutex_);
            connections_[alias] = std::move(slot);
            log_->info("Connection added: {}", alias);
            return alias;
        } catch (const boost::mysql::error_with_diagnostics& e) {
            log_->error("MySQL error occurred - Error code: {}, Message: {}, Diagnostics: {}",
                        e.code().value(),
                        e.what(),
                        e.get_diagnostics().server_message());
            throw std::runtime_error("Add connection mysql error: " + std::string(e.what()));
        } catch (const std::exception& e) {
            log_->error("Error: {}", e.what());
            throw std::runtime_error("Add connection common error: " + std::string(e.what()));
        }
    }

    void ConnectorManager::removeConnection(const std::string& alias) {
        slot_ptr slot;
        {
            std::unique_lock lock(connections_mutex_);
            auto conn = connections_.find(alias);
            if (conn == connections_.end()) {
                log_->error("Invalid connection alias: {}", alias);
                throw std::runtime_error("Invalid connection alias: " + alias);
            }
            slot = std::move(conn->second);
            connections_.erase(conn);
        }
        // waits for a statement still running on this connection
        std::lock_guard guard(slot->mutex);
        slot->connector->close();
    }

    ConnectorManager::slot_ptr ConnectorManager::find(const std::string& alias) const {
        std::shared_lock lock(connections_mutex_);
        auto conn = connections_.find(alias);
        if (conn == connections_.end()) {
            return nullptr;
        }
        return conn->second;
    }

    metadata::raw_result
    ConnectorManager::executeQuery(const std::string& alias, sql_gen::bound_statement statement, raw_handler handler) {
        auto slot = find(alias);
        if (!slot) {
            log_->error("executeQuery: invalid connection alias: {}", alias);
            throw std::runtime_error("[ConnectorManager::executeQuery] Invalid connection alias: " + alias);
        }

        std::lock_guard guard(slot->mutex);
        auto& connector = *slot->connector;
        if (connector.status() == Status::Closed) {
            log_->error("executeQuery: connector {} is closed", alias);
            throw std::runtime_error("[ConnectorManager::executeQuery] Connector is not connected: " + alias);
        }
        if (!connector.isConnected()) {
            try {
                connector.tryReconnect();
            } catch (const std::exception& e) {
                throw std::runtime_error("Failed to reconnect. Error message: " + std::string(e.what()));
            }
        }
        return asio::co_spawn(thread_pool_manager_.ctx(),
                              connector.runStatement(std::move(statement), std::move(handler)),
                              asio::use_future)
            .get();
    }

    size_t ConnectorManager::totalConnections() const {
        std::shared_lock lock(connections_mutex_);
        return connections_.size();
    }

    std::optional<mysql::connect_params> ConnectorManager::conn_params(const std::string& alias) const {
        auto slot = find(alias);
        if (!slot) {
            return std::nullopt;
        }
        return slot->connector->params();
    }

    bool ConnectorManager::hasConnection(const std::string& alias) const { return find(alias) != nullptr; }
} // namespace mysqlc
