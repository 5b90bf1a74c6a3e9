// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "metadata/schema_error.hpp"
#include "query_generation/restriction_builder.hpp"

#include <catch2/catch.hpp>

using namespace sql_gen;

namespace {
    const std::string TABLES_QUERY =
        "SELECT table_catalog, table_schema, table_name, table_type FROM information_schema.tables";
    const std::vector<std::string> TABLES_COLUMNS = {"table_catalog", "table_schema", "table_name", "table_type"};
} // namespace

TEST_CASE("restriction_builder: single schema restriction") {
    auto statement = build_statement(TABLES_QUERY, TABLES_COLUMNS, {"", "public", "", ""});

    REQUIRE(statement.text == TABLES_QUERY + " WHERE table_schema = :table_schema");
    REQUIRE(statement.parameters.size() == 1);
    REQUIRE(statement.parameters[0] == parameter{"table_schema", "public"});
}

TEST_CASE("restriction_builder: no restrictions keep the template") {
    REQUIRE(build_statement(TABLES_QUERY, TABLES_COLUMNS, {}).text == TABLES_QUERY);

    auto statement = build_statement(TABLES_QUERY, TABLES_COLUMNS, {std::nullopt, "", std::nullopt, ""});
    REQUIRE(statement.text == TABLES_QUERY);
    REQUIRE(statement.parameters.empty());
}

TEST_CASE("restriction_builder: predicates follow column order") {
    auto statement = build_statement(TABLES_QUERY, TABLES_COLUMNS, {"def", std::nullopt, "orders", "BASE TABLE"});

    REQUIRE(statement.text == TABLES_QUERY +
                                  " WHERE table_catalog = :table_catalog AND table_name = :table_name"
                                  " AND table_type = :table_type");
    REQUIRE(statement.parameters ==
            std::vector<parameter>{{"table_catalog", "def"}, {"table_name", "orders"}, {"table_type", "BASE TABLE"}});
}

TEST_CASE("restriction_builder: values are never spliced into the text") {
    auto statement = build_statement(TABLES_QUERY, TABLES_COLUMNS, {"", "x' OR '1'='1"});

    REQUIRE(statement.text.find("OR '1'") == std::string::npos);
    REQUIRE(statement.parameters[0].value == "x' OR '1'='1");
}

TEST_CASE("restriction_builder: template with its own WHERE continues with AND") {
    const std::string query = "SELECT index_name FROM information_schema.statistics WHERE table_schema <> 'mysql'";
    auto statement = build_statement(query,
                                     {"table_catalog", "table_schema", "table_name"},
                                     {"", "shop", "orders"},
                                     {.start = clause_start::AND});

    REQUIRE(statement.text == query + " AND table_schema = :table_schema AND table_name = :table_name");
    REQUIRE(statement.parameters.size() == 2);

    REQUIRE(build_statement(query, {"table_catalog"}, {}, {.start = clause_start::AND}).text == query);
}

TEST_CASE("restriction_builder: shorter restriction set") {
    auto statement = build_statement(TABLES_QUERY, TABLES_COLUMNS, {"def"});

    REQUIRE(statement.text == TABLES_QUERY + " WHERE table_catalog = :table_catalog");
    REQUIRE(statement.parameters.size() == 1);
}

TEST_CASE("restriction_builder: longer restriction set") {
    const std::vector<std::string> columns = {"schema_name"};
    const restriction_set restrictions = {"shop", "extra"};

    SECTION("permissive mode ignores the surplus") {
        auto statement = build_statement("SELECT 1", columns, restrictions);
        REQUIRE(statement.text == "SELECT 1 WHERE schema_name = :schema_name");
        REQUIRE(statement.parameters.size() == 1);
    }

    SECTION("strict mode rejects it") {
        REQUIRE_THROWS_AS(build_statement("SELECT 1", columns, restrictions, {.mode = restriction_mode::STRICT}),
                          metadata::malformed_restriction);
        REQUIRE_THROWS_WITH(build_statement("SELECT 1", columns, restrictions, {.mode = restriction_mode::STRICT}),
                            "Got 2 restrictions, collection accepts at most 1");
    }

    SECTION("strict mode accepts sets that fit") {
        auto statement = build_statement("SELECT 1", columns, {"shop"}, {.mode = restriction_mode::STRICT});
        REQUIRE(statement.parameters.size() == 1);
    }
}

TEST_CASE("restriction_builder: collection without restriction columns") {
    auto statement = build_statement("SELECT 1", {}, {"anything"});

    REQUIRE(statement.text == "SELECT 1");
    REQUIRE(statement.parameters.empty());
}

TEST_CASE("restriction_builder: is_present") {
    REQUIRE_FALSE(is_present(std::nullopt));
    REQUIRE_FALSE(is_present(std::string()));
    REQUIRE(is_present(std::string(" ")));
}
