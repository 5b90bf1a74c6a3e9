// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace metadata {

    std::string_view to_string(logical_type type) noexcept {
        switch (type) {
            case logical_type::STRING_LITERAL:
                return "string";
            case logical_type::INTEGER:
                return "integer";
            case logical_type::BOOLEAN:
                return "boolean";
        }
        return "unknown";
    }

    std::string to_string(const value_t& value) {
        switch (value.index()) {
            case 0:
                return "NULL";
            case 1:
                return std::get<bool>(value) ? "true" : "false";
            case 2:
                return std::to_string(std::get<int64_t>(value));
            default:
                return std::get<std::string>(value);
        }
    }

    result_set::result_set(std::string name, std::vector<column_definition> columns)
        : name_(std::move(name))
        , columns_(std::move(columns)) {}

    std::optional<size_t> result_set::column_index(std::string_view column) const noexcept {
        auto it = std::find_if(columns_.begin(), columns_.end(), [column](const column_definition& def) {
            return iequals(def.name, column);
        });
        if (it == columns_.end()) {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(columns_.begin(), it));
    }

    const value_t& result_set::value(size_t row, std::string_view column) const {
        auto index = column_index(column);
        if (!index) {
            throw std::out_of_range("result_set " + name_ + " has no column " + std::string(column));
        }
        return rows_.at(row).at(*index);
    }

    void result_set::append(row_t row) {
        if (row.size() != columns_.size()) {
            throw std::invalid_argument("result_set " + name_ + ": row has " + std::to_string(row.size()) +
                                        " values, schema has " + std::to_string(columns_.size()) + " columns");
        }
        rows_.push_back(std::move(row));
    }

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
        return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
               });
    }

} // namespace metadata
