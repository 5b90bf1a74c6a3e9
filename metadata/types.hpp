// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace metadata {

    enum class logical_type : uint8_t
    {
        STRING_LITERAL,
        INTEGER,
        BOOLEAN,
    };

    std::string_view to_string(logical_type type) noexcept;

    // std::monostate is SQL NULL
    using value_t = std::variant<std::monostate, bool, int64_t, std::string>;
    using row_t = std::vector<value_t>;

    inline bool is_null(const value_t& value) noexcept { return std::holds_alternative<std::monostate>(value); }

    std::string to_string(const value_t& value);

    struct column_definition {
        std::string name;
        logical_type type = logical_type::STRING_LITERAL;
    };

    // Rows exactly as the relational store returned them, labels included.
    struct raw_result {
        std::vector<std::string> column_names;
        std::vector<row_t> rows;
    };

    class result_set {
    public:
        result_set(std::string name, std::vector<column_definition> columns);

        const std::string& name() const noexcept { return name_; }
        const std::vector<column_definition>& columns() const noexcept { return columns_; }
        const std::vector<row_t>& rows() const noexcept { return rows_; }

        size_t size() const noexcept { return rows_.size(); }
        bool empty() const noexcept { return rows_.empty(); }

        std::optional<size_t> column_index(std::string_view column) const noexcept;

        const row_t& row(size_t index) const { return rows_.at(index); }
        // throws std::out_of_range for an unknown column or row
        const value_t& value(size_t row, std::string_view column) const;

        // throws std::invalid_argument when the row width differs from the schema
        void append(row_t row);

        auto begin() const noexcept { return rows_.begin(); }
        auto end() const noexcept { return rows_.end(); }

    private:
        std::string name_;
        std::vector<column_definition> columns_;
        std::vector<row_t> rows_;
    };

    // ASCII only, catalog and column names never need more
    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace metadata
