// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "metadata/collection_catalog.hpp"
#include "metadata/types.hpp"
#include "query_generation/restriction_builder.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace metadata {

    // Runs a bound statement against the relational store.
    // Connectivity, syntax and permission failures are reported by throwing.
    class IQueryExecutor {
    public:
        virtual ~IQueryExecutor() = default;
        virtual raw_result execute(const sql_gen::bound_statement& statement) = 0;
    };

    struct provider_options {
        sql_gen::restriction_mode mode = sql_gen::restriction_mode::PERMISSIVE;
    };

    // Projects raw rows onto the declared columns. Labels are matched case-insensitively,
    // missing columns are NULL, values are coerced to the declared type.
    // Throws execution_failed when a value does not convert.
    result_set project_rows(const collection_descriptor& descriptor, const raw_result& raw);

    // throws execution_failed
    value_t coerce(const value_t& value, logical_type type, std::string_view column);

    class SchemaProvider {
    public:
        explicit SchemaProvider(std::shared_ptr<IQueryExecutor> executor,
                                const collection_catalog& catalog = default_catalog(),
                                provider_options options = {});

        std::vector<collection_summary> list_collections() const;

        // throws unknown_collection, malformed_restriction (strict mode), execution_failed
        result_set fetch(std::string_view name, const sql_gen::restriction_set& restrictions = {}) const;

        // Builds the statement fetch() would execute; static collections yield an empty statement.
        sql_gen::bound_statement prepare(std::string_view name, const sql_gen::restriction_set& restrictions = {}) const;

        const collection_catalog& catalog() const noexcept { return catalog_; }

    private:
        sql_gen::bound_statement build(const collection_descriptor& descriptor,
                                       const sql_gen::restriction_set& restrictions) const;

        std::shared_ptr<IQueryExecutor> executor_;
        const collection_catalog& catalog_;
        provider_options options_;
    };

} // namespace metadata
