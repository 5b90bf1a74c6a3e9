// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "restriction_builder.hpp"

#include <string>
#include <vector>

namespace sql_gen {

    // MySQL prepared statements only understand anonymous '?' markers
    struct positional_statement {
        std::string text;
        std::vector<std::string> values;
    };

    // Rewrites every :name marker outside of quoted text and comments into '?' and collects the bound values
    // in marker order.
    // Throws std::invalid_argument when a marker has no matching parameter.
    positional_statement to_positional(const bound_statement& statement);

} // namespace sql_gen
