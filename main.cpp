// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include "app/config.hpp"
#include "connectors/http_server/json_utils.hpp"
#include "connectors/http_server/schema_server.hpp"
#include "connectors/mysql_executor.hpp"
#include "connectors/mysql_manager.hpp"
#include "metadata/schema_error.hpp"
#include "provider/schema_provider.hpp"
#include "utility/logger.hpp"

namespace {
    int exit_code(metadata::schema_mistake_t mistake) {
        switch (mistake) {
            case metadata::schema_mistake_t::UNKNOWN_COLLECTION:
                return 2;
            case metadata::schema_mistake_t::MALFORMED_RESTRICTION:
                return 3;
            case metadata::schema_mistake_t::EXECUTION_FAILED:
                return 4;
        }
        return 1;
    }

    std::shared_ptr<mysqlc::ConnectorManager> connect(const configuration::app_config& config) {
        auto manager = std::make_shared<mysqlc::ConnectorManager>(mysqlc::make_mysql_connector, config.pool_size);
        manager->start();
        manager->addConnection(config.connect_params(), config.mysql.alias);
        return manager;
    }

    bool needs_connection(const configuration::app_config& config) {
        if (config.run == configuration::action::SERVE) {
            return true;
        }
        if (config.run != configuration::action::FETCH || config.dry_run) {
            return false;
        }
        const auto* descriptor = metadata::default_catalog().find(config.collection);
        return descriptor && !descriptor->is_static();
    }

    void serve(const configuration::app_config& config, std::shared_ptr<const metadata::SchemaProvider> provider) {
        auto log = get_logger(logger_tag::METASTAX);
        asio::io_context ctx;
        http_server::Server server(ctx, config.http_port, std::move(provider));

        asio::signal_set signals(ctx, SIGINT, SIGTERM);
        signals.async_wait([&ctx, log](const boost::system::error_code&, int signal) {
            log->info("Signal {} received, stopping", signal);
            ctx.stop();
        });

        log->info("HTTP Server running on port {}...", config.http_port);
        ctx.run();
    }
} // namespace

int main(int argc, char* argv[]) {
    std::optional<configuration::app_config> parsed;
    try {
        parsed = configuration::parse(argc, argv, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }
    if (!parsed) {
        return 0;
    }
    const auto& config = *parsed;

    initialize_all_loggers(config.log.dir, config.log_level());
    auto log = get_logger(logger_tag::METASTAX);

    std::shared_ptr<mysqlc::ConnectorManager> manager;
    std::shared_ptr<metadata::IQueryExecutor> executor;
    if (needs_connection(config)) {
        try {
            manager = connect(config);
        } catch (const std::exception& e) {
            log->error("Failed to connect to {}:{}: {}", config.mysql.host, config.mysql.port, e.what());
            return 1;
        }
        executor = std::make_shared<mysqlc::MysqlExecutor>(manager, config.mysql.alias);
    }

    auto provider = std::make_shared<const metadata::SchemaProvider>(executor,
                                                                     metadata::default_catalog(),
                                                                     metadata::provider_options{config.restriction_mode()});

    try {
        switch (config.run) {
            case configuration::action::LIST:
                std::cout << boost::json::serialize(http_server::to_json(provider->list_collections())) << std::endl;
                break;
            case configuration::action::FETCH:
                if (config.dry_run) {
                    auto statement = provider->prepare(config.collection, config.restriction_set());
                    std::cout << boost::json::serialize(http_server::to_json(statement)) << std::endl;
                } else {
                    auto result = provider->fetch(config.collection, config.restriction_set());
                    log->info("{}: {} rows", result.name(), result.size());
                    std::cout << boost::json::serialize(http_server::to_json(result)) << std::endl;
                }
                break;
            case configuration::action::SERVE:
                serve(config, provider);
                break;
        }
    } catch (const metadata::schema_error& e) {
        log->error("{}: {}", metadata::to_string(e.mistake()), e.what());
        return exit_code(e.mistake());
    } catch (const std::exception& e) {
        log->error("Unexpected error: {}", e.what());
        return 1;
    }

    if (manager) {
        manager->stop();
    }
    return 0;
}
