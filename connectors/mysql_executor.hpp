// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "mysql_manager.hpp"
#include "provider/schema_provider.hpp"

#include <memory>
#include <string>

namespace mysqlc {

    // Binds the schema provider to one connection of the connector manager.
    class MysqlExecutor final : public metadata::IQueryExecutor {
    public:
        MysqlExecutor(std::shared_ptr<ConnectorManager> manager, std::string alias);

        metadata::raw_result execute(const sql_gen::bound_statement& statement) override;

    private:
        std::shared_ptr<ConnectorManager> manager_;
        std::string alias_;
    };

} // namespace mysqlc
