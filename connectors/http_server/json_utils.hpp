// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "metadata/collection_descriptor.hpp"
#include "metadata/types.hpp"
#include "query_generation/restriction_builder.hpp"

#include <boost/json.hpp>

#include <vector>

namespace http_server {

    boost::json::value to_json(const metadata::value_t& value);
    boost::json::object to_json(const metadata::result_set& result);
    boost::json::array to_json(const std::vector<metadata::collection_summary>& collections);
    boost::json::object to_json(const sql_gen::bound_statement& statement);

    // strings and nulls only, throws std::invalid_argument otherwise
    sql_gen::restriction_set restrictions_from_json(const boost::json::value& value);

} // namespace http_server
