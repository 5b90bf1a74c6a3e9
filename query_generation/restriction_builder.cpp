// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "restriction_builder.hpp"

#include "metadata/schema_error.hpp"

#include <algorithm>
#include <sstream>

namespace sql_gen {

    bound_statement build_statement(std::string_view query_template,
                                    const std::vector<std::string>& restriction_columns,
                                    const restriction_set& restrictions,
                                    builder_options options) {
        if (options.mode == restriction_mode::STRICT && restrictions.size() > restriction_columns.size()) {
            std::stringstream err;
            err << "Got " << restrictions.size() << " restrictions, collection accepts at most "
                << restriction_columns.size();
            throw metadata::malformed_restriction(err.str());
        }

        std::stringstream stream;
        stream << query_template;
        bound_statement statement;

        bool add_where = options.start == clause_start::WHERE;
        const size_t count = std::min(restrictions.size(), restriction_columns.size());
        for (size_t i = 0; i < count; ++i) {
            if (!is_present(restrictions[i])) {
                continue;
            }
            if (add_where) {
                stream << " WHERE ";
                add_where = false;
            } else {
                stream << " AND ";
            }
            const auto& column = restriction_columns[i];
            stream << column << " = :" << column;
            statement.parameters.push_back({column, *restrictions[i]});
        }

        statement.text = stream.str();
        return statement;
    }

} // namespace sql_gen
