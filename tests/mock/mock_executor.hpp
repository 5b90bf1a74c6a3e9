// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "mock_config.hpp"
#include "provider/schema_provider.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

// Records every statement it receives and answers with the configured rows.
class MockExecutor : public metadata::IQueryExecutor {
public:
    explicit MockExecutor(mock_config config = {})
        : config_(std::move(config)) {}

    metadata::raw_result execute(const sql_gen::bound_statement& statement) override {
        statements.push_back(statement);
        if (config_.can_throw) {
            throw std::runtime_error(config_.error_message.empty() ? "MockExecutor: exception in execute"
                                                                   : config_.error_message);
        }
        if (config_.wait_time.count() > 0) {
            std::this_thread::sleep_for(config_.wait_time);
        }
        return config_.result;
    }

    std::vector<sql_gen::bound_statement> statements;

private:
    mock_config config_;
};
