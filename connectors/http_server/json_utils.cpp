// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "json_utils.hpp"

#include <stdexcept>
#include <string>

namespace http_server {

    boost::json::value to_json(const metadata::value_t& value) {
        return std::visit(
            [](const auto& v) -> boost::json::value {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return nullptr;
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return boost::json::string(v);
                } else {
                    return v;
                }
            },
            value);
    }

    boost::json::object to_json(const metadata::result_set& result) {
        boost::json::array columns;
        for (const auto& column : result.columns()) {
            columns.push_back(boost::json::object{{"name", column.name},
                                                  {"type", std::string(metadata::to_string(column.type))}});
        }

        boost::json::array rows;
        for (const auto& row : result) {
            boost::json::array json_row;
            for (const auto& value : row) {
                json_row.push_back(to_json(value));
            }
            rows.push_back(std::move(json_row));
        }

        return boost::json::object{{"collection", result.name()},
                                   {"columns", std::move(columns)},
                                   {"rows", std::move(rows)}};
    }

    boost::json::array to_json(const std::vector<metadata::collection_summary>& collections) {
        boost::json::array result;
        for (const auto& collection : collections) {
            boost::json::array restrictions;
            for (const auto& column : collection.restriction_columns) {
                restrictions.emplace_back(column);
            }
            result.push_back(boost::json::object{{"name", collection.name},
                                                 {"restrictions", std::move(restrictions)},
                                                 {"identifier_parts", collection.identifier_parts}});
        }
        return result;
    }

    boost::json::object to_json(const sql_gen::bound_statement& statement) {
        boost::json::array parameters;
        for (const auto& param : statement.parameters) {
            parameters.push_back(boost::json::object{{"name", param.name}, {"value", param.value}});
        }
        return boost::json::object{{"text", statement.text}, {"parameters", std::move(parameters)}};
    }

    sql_gen::restriction_set restrictions_from_json(const boost::json::value& value) {
        sql_gen::restriction_set restrictions;
        if (value.is_null()) {
            return restrictions;
        }
        if (!value.is_array()) {
            throw std::invalid_argument("restrictions must be an array");
        }
        for (const auto& item : value.as_array()) {
            if (item.is_null()) {
                restrictions.emplace_back(std::nullopt);
            } else if (item.is_string()) {
                restrictions.emplace_back(std::string(item.as_string()));
            } else {
                throw std::invalid_argument("restriction values must be strings or null");
            }
        }
        return restrictions;
    }

} // namespace http_server
