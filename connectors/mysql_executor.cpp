// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "mysql_executor.hpp"

#include "translators/mysql_to_raw.hpp"

#include <stdexcept>

namespace mysqlc {

    MysqlExecutor::MysqlExecutor(std::shared_ptr<ConnectorManager> manager, std::string alias)
        : manager_(std::move(manager))
        , alias_(std::move(alias)) {
        if (!manager_) {
            throw std::invalid_argument("MysqlExecutor requires a connector manager");
        }
    }

    metadata::raw_result MysqlExecutor::execute(const sql_gen::bound_statement& statement) {
        return manager_->executeQuery(alias_, statement, tsl::mysql_to_raw);
    }

} // namespace mysqlc
