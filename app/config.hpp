// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "query_generation/restriction_builder.hpp"

#include <boost/mysql/connect_params.hpp>
#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace configuration {

    struct mysql_config {
        std::string host = "127.0.0.1";
        uint16_t port = 3306;
        std::string username = "root";
        std::string password;
        std::string database;
        std::string alias = "default";
    };

    struct log_config {
        std::string dir = "/tmp/metastax/logs";
        std::string level = "info";
    };

    enum class action : uint8_t
    {
        LIST,
        FETCH,
        SERVE,
    };

    struct app_config {
        mysql_config mysql;
        log_config log;
        uint16_t http_port = 8085;
        size_t pool_size = std::thread::hardware_concurrency();
        bool strict_restrictions = false;
        bool dry_run = false;

        action run = action::LIST;
        std::string collection;
        // empty strings stay in place as absent entries
        std::vector<std::string> restrictions;

        sql_gen::restriction_mode restriction_mode() const noexcept {
            return strict_restrictions ? sql_gen::restriction_mode::STRICT : sql_gen::restriction_mode::PERMISSIVE;
        }
        sql_gen::restriction_set restriction_set() const;
        spdlog::level::level_enum log_level() const;
        boost::mysql::connect_params connect_params() const;
    };

    boost::program_options::options_description make_options(app_config& config);

    // Command line first, then the optional --config file; std::nullopt when --help was requested.
    // Throws boost::program_options::error and std::invalid_argument.
    std::optional<app_config> parse(int argc, const char* const argv[], std::ostream& help);

} // namespace configuration
