// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "schema_provider.hpp"

#include "metadata/schema_error.hpp"

#include <charconv>
#include <optional>

namespace metadata {

    namespace {
        [[noreturn]] void conversion_failed(const value_t& value, logical_type type, std::string_view column) {
            throw execution_failed("Column " + std::string(column) + ": cannot convert '" + to_string(value) +
                                   "' to " + std::string(to_string(type)));
        }

        std::optional<int64_t> parse_integer(const std::string& text) {
            int64_t result = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, result);
            if (ec != std::errc() || ptr != end || text.empty()) {
                return std::nullopt;
            }
            return result;
        }

        std::optional<bool> parse_boolean(const std::string& text) {
            if (iequals(text, "YES") || iequals(text, "TRUE") || text == "1") {
                return true;
            }
            if (iequals(text, "NO") || iequals(text, "FALSE") || text == "0") {
                return false;
            }
            return std::nullopt;
        }
    } // namespace

    value_t coerce(const value_t& value, logical_type type, std::string_view column) {
        if (is_null(value)) {
            return value;
        }
        switch (type) {
            case logical_type::STRING_LITERAL:
                if (std::holds_alternative<std::string>(value)) {
                    return value;
                }
                return to_string(value);
            case logical_type::INTEGER:
                if (std::holds_alternative<int64_t>(value)) {
                    return value;
                }
                if (std::holds_alternative<bool>(value)) {
                    return static_cast<int64_t>(std::get<bool>(value) ? 1 : 0);
                }
                if (auto parsed = parse_integer(std::get<std::string>(value)); parsed) {
                    return *parsed;
                }
                break;
            case logical_type::BOOLEAN:
                if (std::holds_alternative<bool>(value)) {
                    return value;
                }
                if (std::holds_alternative<int64_t>(value)) {
                    return std::get<int64_t>(value) != 0;
                }
                if (auto parsed = parse_boolean(std::get<std::string>(value)); parsed) {
                    return *parsed;
                }
                break;
        }
        conversion_failed(value, type, column);
    }

    result_set project_rows(const collection_descriptor& descriptor, const raw_result& raw) {
        // position of every declared column in the raw result
        std::vector<std::optional<size_t>> mapping;
        mapping.reserve(descriptor.result_columns.size());
        for (const auto& column : descriptor.result_columns) {
            std::optional<size_t> position;
            for (size_t i = 0; i < raw.column_names.size(); ++i) {
                if (iequals(raw.column_names[i], column.name)) {
                    position = i;
                    break;
                }
            }
            mapping.push_back(position);
        }

        result_set result(descriptor.name, descriptor.result_columns);
        for (const auto& raw_row : raw.rows) {
            row_t row;
            row.reserve(mapping.size());
            for (size_t i = 0; i < mapping.size(); ++i) {
                const auto& column = descriptor.result_columns[i];
                if (!mapping[i] || *mapping[i] >= raw_row.size()) {
                    row.emplace_back(std::monostate{});
                    continue;
                }
                row.push_back(coerce(raw_row[*mapping[i]], column.type, column.name));
            }
            result.append(std::move(row));
        }
        return result;
    }

    SchemaProvider::SchemaProvider(std::shared_ptr<IQueryExecutor> executor,
                                   const collection_catalog& catalog,
                                   provider_options options)
        : executor_(std::move(executor))
        , catalog_(catalog)
        , options_(options) {}

    std::vector<collection_summary> SchemaProvider::list_collections() const { return catalog_.list(); }

    sql_gen::bound_statement SchemaProvider::build(const collection_descriptor& descriptor,
                                                   const sql_gen::restriction_set& restrictions) const {
        return sql_gen::build_statement(descriptor.query_template,
                                        descriptor.restriction_columns,
                                        restrictions,
                                        {.start = descriptor.clause_start, .mode = options_.mode});
    }

    sql_gen::bound_statement SchemaProvider::prepare(std::string_view name,
                                                     const sql_gen::restriction_set& restrictions) const {
        const auto& descriptor = catalog_.resolve(name);
        if (descriptor.is_static()) {
            return {};
        }
        return build(descriptor, restrictions);
    }

    result_set SchemaProvider::fetch(std::string_view name, const sql_gen::restriction_set& restrictions) const {
        const auto& descriptor = catalog_.resolve(name);

        if (descriptor.is_static()) {
            result_set result(descriptor.name, descriptor.result_columns);
            for (auto& row : descriptor.rows(catalog_)) {
                result.append(std::move(row));
            }
            return result;
        }

        auto statement = build(descriptor, restrictions);
        if (!executor_) {
            throw execution_failed("No query executor configured for collection " + descriptor.name);
        }

        raw_result raw;
        try {
            raw = executor_->execute(statement);
        } catch (const schema_error&) {
            throw;
        } catch (const std::exception& e) {
            throw execution_failed(e.what());
        }
        return project_rows(descriptor, raw);
    }

} // namespace metadata
