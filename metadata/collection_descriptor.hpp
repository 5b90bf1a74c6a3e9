// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "metadata/types.hpp"
#include "query_generation/restriction_builder.hpp"

#include <functional>
#include <string>
#include <vector>

namespace metadata {

    class collection_catalog;

    // In-memory rows for collections that are not backed by a query
    using row_source_t = std::function<std::vector<row_t>(const collection_catalog&)>;

    struct collection_descriptor {
        std::string name;
        std::vector<column_definition> result_columns;
        std::string query_template;
        std::vector<std::string> restriction_columns;
        sql_gen::clause_start clause_start = sql_gen::clause_start::WHERE;
        size_t identifier_parts = 0;
        row_source_t rows;

        bool is_static() const noexcept { return static_cast<bool>(rows); }
    };

    struct collection_summary {
        std::string name;
        std::vector<std::string> restriction_columns;
        size_t identifier_parts = 0;
    };

} // namespace metadata
