// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using log_t = std::shared_ptr<spdlog::logger>;

namespace logger_tag {
    inline constexpr std::string_view CONNECTOR = "Connector";
    inline constexpr std::string_view CONNECTOR_MANAGER = "ConnectorManager";
    inline constexpr std::string_view HTTP_SERVER = "HttpServer";
    inline constexpr std::string_view METASTAX = "Metastax";
} // namespace logger_tag

// unit tests never initialize named loggers, fall back to the default one
inline log_t get_logger(std::string_view tag) {
    if (auto logger = spdlog::get(std::string(tag)); logger) {
        return logger;
    }
    return spdlog::default_logger();
}

inline log_t initialize_logger(std::string name, std::string prefix, spdlog::level::level_enum level) {
    if (auto log_ptr = spdlog::get(name); log_ptr) {
        // prevent creating two loggers with same name
        return log_ptr;
    }

    std::filesystem::create_directories(prefix);
    if (prefix.back() != '/') {
        prefix += '/';
    }

    using namespace std::chrono;
    system_clock::time_point tp = system_clock::now();
    system_clock::duration dtn = tp.time_since_epoch();

    auto file_name = fmt::format("{}{}-{}.txt", prefix, name, duration_cast<seconds>(dtn).count());
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true);
    std::vector<spdlog::sink_ptr> sinks{stdout_sink, file_sink};
    auto logger = std::make_shared<spdlog::logger>(std::move(name), sinks.begin(), sinks.end());

    spdlog::flush_every(std::chrono::seconds(1));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::err);
    spdlog::register_logger(logger);
    return logger;
}

inline void initialize_all_loggers(const std::string& prefix, spdlog::level::level_enum level) {
    static constexpr std::array<std::string_view, 4> all_loggers = {
        logger_tag::CONNECTOR,
        logger_tag::CONNECTOR_MANAGER,
        logger_tag::HTTP_SERVER,
        logger_tag::METASTAX,
    };

    for (auto tag : all_loggers) {
        initialize_logger(std::string(tag), prefix, level);
    }
}
