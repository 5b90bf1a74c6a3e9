// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "metadata/collection_descriptor.hpp"

#include <string_view>
#include <vector>

namespace metadata {

    // MySQL 8.0 reserved keywords
    const std::vector<std::string_view>& reserved_words();

    std::vector<column_definition> reserved_words_columns();
    std::vector<column_definition> data_source_information_columns();
    std::vector<column_definition> meta_data_collections_columns();
    std::vector<column_definition> restrictions_columns();

    std::vector<row_t> reserved_words_rows(const collection_catalog& catalog);
    std::vector<row_t> data_source_information_rows(const collection_catalog& catalog);
    // one row per registered collection
    std::vector<row_t> meta_data_collections_rows(const collection_catalog& catalog);
    // one row per (collection, restriction column), numbered from 1
    std::vector<row_t> restrictions_rows(const collection_catalog& catalog);

} // namespace metadata
