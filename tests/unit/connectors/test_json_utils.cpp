// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "connectors/http_server/json_utils.hpp"

#include <catch2/catch.hpp>

using namespace http_server;

TEST_CASE("json_utils: result set") {
    metadata::result_set result("Users",
                                {{"user_name", metadata::logical_type::STRING_LITERAL},
                                 {"locked", metadata::logical_type::BOOLEAN},
                                 {"grants", metadata::logical_type::INTEGER}});
    result.append({std::string("root"), false, int64_t(3)});
    result.append({std::string("guest"), std::monostate{}, std::monostate{}});

    auto json = to_json(result);

    REQUIRE(json.at("collection").as_string() == "Users");
    REQUIRE(json.at("columns").as_array().size() == 3);
    REQUIRE(json.at("columns").as_array()[2].as_object().at("type").as_string() == "integer");
    const auto& rows = json.at("rows").as_array();
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].as_array()[0].as_string() == "root");
    REQUIRE(rows[0].as_array()[1].as_bool() == false);
    REQUIRE(rows[0].as_array()[2].as_int64() == 3);
    REQUIRE(rows[1].as_array()[1].is_null());
}

TEST_CASE("json_utils: collection summaries") {
    std::vector<metadata::collection_summary> collections{{"Tables", {"table_catalog", "table_schema"}, 3}};

    auto json = to_json(collections);

    REQUIRE(json.size() == 1);
    const auto& tables = json[0].as_object();
    REQUIRE(tables.at("name").as_string() == "Tables");
    REQUIRE(tables.at("restrictions").as_array().size() == 2);
    REQUIRE(tables.at("restrictions").as_array()[1].as_string() == "table_schema");
}

TEST_CASE("json_utils: bound statement") {
    auto json = to_json(sql_gen::bound_statement{"SELECT 1 WHERE a = :a", {{"a", "x"}}});

    REQUIRE(json.at("text").as_string() == "SELECT 1 WHERE a = :a");
    REQUIRE(json.at("parameters").as_array()[0].as_object().at("value").as_string() == "x");
}

TEST_CASE("json_utils: restrictions from json") {
    auto restrictions = restrictions_from_json(boost::json::parse(R"([null, "shop", ""])"));

    REQUIRE(restrictions.size() == 3);
    REQUIRE_FALSE(restrictions[0].has_value());
    REQUIRE(*restrictions[1] == "shop");
    REQUIRE_FALSE(sql_gen::is_present(restrictions[2]));

    REQUIRE(restrictions_from_json(nullptr).empty());
    REQUIRE_THROWS_AS(restrictions_from_json(boost::json::parse(R"({"a": 1})")), std::invalid_argument);
    REQUIRE_THROWS_AS(restrictions_from_json(boost::json::parse("[1]")), std::invalid_argument);
}
