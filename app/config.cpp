// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "config.hpp"

#include <fstream>
#include <ostream>
#include <stdexcept>

namespace po = boost::program_options;

namespace configuration {

    sql_gen::restriction_set app_config::restriction_set() const {
        sql_gen::restriction_set result;
        result.reserve(restrictions.size());
        for (const auto& value : restrictions) {
            if (value.empty()) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(value);
            }
        }
        return result;
    }

    spdlog::level::level_enum app_config::log_level() const {
        auto parsed = spdlog::level::from_str(log.level);
        // from_str maps unknown names to off
        if (parsed == spdlog::level::off && log.level != "off") {
            throw std::invalid_argument("Unknown log level: " + log.level);
        }
        return parsed;
    }

    boost::mysql::connect_params app_config::connect_params() const {
        boost::mysql::connect_params params;
        params.server_address.emplace_host_and_port(mysql.host, mysql.port);
        params.username = mysql.username;
        params.password = mysql.password;
        params.database = mysql.database;
        return params;
    }

    po::options_description make_options(app_config& config) {
        po::options_description general("General options");
        general.add_options()("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "INI-style configuration file")
        ("list,l", "List the available metadata collections")
        ("collection,C", po::value<std::string>(&config.collection), "Metadata collection to fetch")
        ("restriction,r",
         po::value<std::vector<std::string>>(&config.restrictions)->composing(),
         "Positional restriction value, repeat in column order, \"\" leaves a position unrestricted")
        ("dry-run", po::bool_switch(&config.dry_run), "Print the bound statement instead of executing it")
        ("serve", "Serve the collections over HTTP")
        ("strict-restrictions",
         po::bool_switch(&config.strict_restrictions),
         "Reject more restriction values than the collection accepts")
        ("pool-size", po::value<size_t>(&config.pool_size)->default_value(config.pool_size), "Connector threads");

        po::options_description connection("Connection options");
        connection.add_options()
        ("mysql.host", po::value<std::string>(&config.mysql.host)->default_value(config.mysql.host), "MySQL host")
        ("mysql.port", po::value<uint16_t>(&config.mysql.port)->default_value(config.mysql.port), "MySQL port")
        ("mysql.user",
         po::value<std::string>(&config.mysql.username)->default_value(config.mysql.username),
         "MySQL user")
        ("mysql.password", po::value<std::string>(&config.mysql.password), "MySQL password")
        ("mysql.database", po::value<std::string>(&config.mysql.database), "Default database")
        ("mysql.alias", po::value<std::string>(&config.mysql.alias)->default_value(config.mysql.alias), "Connection alias")
        ("http.port", po::value<uint16_t>(&config.http_port)->default_value(config.http_port), "HTTP server port");

        po::options_description logging("Logging options");
        logging.add_options()
        ("log.dir", po::value<std::string>(&config.log.dir)->default_value(config.log.dir), "Log directory")
        ("log.level",
         po::value<std::string>(&config.log.level)->default_value(config.log.level),
         "trace, debug, info, warn, err, critical or off");

        po::options_description all("Allowed options");
        all.add(general).add(connection).add(logging);
        return all;
    }

    std::optional<app_config> parse(int argc, const char* const argv[], std::ostream& help) {
        app_config config;
        auto desc = make_options(config);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            help << desc << "\n";
            return std::nullopt;
        }
        if (vm.count("config")) {
            const auto path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file) {
                throw std::invalid_argument("Cannot open config file: " + path);
            }
            // values already given on the command line win
            po::store(po::parse_config_file(file, desc), vm);
        }
        po::notify(vm);

        if (vm.count("serve")) {
            config.run = action::SERVE;
        } else if (!config.collection.empty()) {
            config.run = action::FETCH;
        } else {
            config.run = action::LIST;
        }
        if (!config.restrictions.empty() && config.run != action::FETCH) {
            throw std::invalid_argument("--restriction requires --collection");
        }
        config.log_level(); // rejects unknown levels before any logger exists
        return config;
    }

} // namespace configuration
