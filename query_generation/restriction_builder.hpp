// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sql_gen {

    // Positional: entry i filters on restriction column i.
    // An entry is present when it holds a non-empty value.
    using restriction_set = std::vector<std::optional<std::string>>;

    struct parameter {
        std::string name;
        std::string value;

        bool operator==(const parameter&) const = default;
    };

    struct bound_statement {
        std::string text;
        std::vector<parameter> parameters;
    };

    enum class clause_start : bool
    {
        WHERE,
        AND, // template already ends with its own WHERE clause
    };

    enum class restriction_mode : bool
    {
        PERMISSIVE,
        STRICT,
    };

    struct builder_options {
        clause_start start = clause_start::WHERE;
        restriction_mode mode = restriction_mode::PERMISSIVE;
    };

    inline bool is_present(const std::optional<std::string>& restriction) noexcept {
        return restriction.has_value() && !restriction->empty();
    }

    /// Appends one "<column> = :<column>" predicate per present restriction to the template.
    /// Restriction values are only ever bound as parameters, column names come from the catalog.
    /// In STRICT mode a restriction set longer than the column list throws metadata::malformed_restriction.
    bound_statement build_statement(std::string_view query_template,
                                    const std::vector<std::string>& restriction_columns,
                                    const restriction_set& restrictions,
                                    builder_options options = {});

} // namespace sql_gen
