// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "query_generation/positional_statement.hpp"

#include <catch2/catch.hpp>

using namespace sql_gen;

TEST_CASE("positional_statement: markers become question marks") {
    bound_statement statement{"SELECT * FROM t WHERE a = :a AND b = :b", {{"a", "1"}, {"b", "2"}}};

    auto positional = to_positional(statement);

    REQUIRE(positional.text == "SELECT * FROM t WHERE a = ? AND b = ?");
    REQUIRE(positional.values == std::vector<std::string>{"1", "2"});
}

TEST_CASE("positional_statement: values follow marker order") {
    bound_statement statement{"SELECT :b, :a, :b", {{"a", "first"}, {"b", "second"}}};

    auto positional = to_positional(statement);

    REQUIRE(positional.text == "SELECT ?, ?, ?");
    REQUIRE(positional.values == std::vector<std::string>{"second", "first", "second"});
}

TEST_CASE("positional_statement: quoted text is left alone") {
    bound_statement statement{"SELECT ':a', \"x:a\", `col:a`, 'it''s :a' FROM t WHERE c = :a", {{"a", "v"}}};

    auto positional = to_positional(statement);

    REQUIRE(positional.text == "SELECT ':a', \"x:a\", `col:a`, 'it''s :a' FROM t WHERE c = ?");
    REQUIRE(positional.values == std::vector<std::string>{"v"});
}

TEST_CASE("positional_statement: backslash escapes inside strings") {
    bound_statement statement{R"(SELECT 'a\':b' WHERE x = :x)", {{"x", "1"}}};

    auto positional = to_positional(statement);

    REQUIRE(positional.text == R"(SELECT 'a\':b' WHERE x = ?)");
    REQUIRE(positional.values.size() == 1);
}

TEST_CASE("positional_statement: casts and bare colons") {
    bound_statement statement{"SELECT x::text, '1' : 2, :x", {{"x", "v"}}};

    auto positional = to_positional(statement);

    REQUIRE(positional.text == "SELECT x::text, '1' : 2, ?");
    REQUIRE(positional.values.size() == 1);
}

TEST_CASE("positional_statement: comments are left alone") {
    bound_statement statement{"SELECT a -- filter on :unbound\n"
                              "FROM t # owner :nobody\n"
                              "WHERE /* :skipped */ a = :a --:a",
                              {{"a", "v"}}};

    auto positional = to_positional(statement);

    REQUIRE(positional.text == "SELECT a -- filter on :unbound\n"
                               "FROM t # owner :nobody\n"
                               "WHERE /* :skipped */ a = ? --?");
    REQUIRE(positional.values == std::vector<std::string>{"v", "v"});
}

TEST_CASE("positional_statement: unterminated comment runs to the end") {
    auto positional = to_positional({"SELECT :a /* :b", {{"a", "1"}}});

    REQUIRE(positional.text == "SELECT ? /* :b");
    REQUIRE(positional.values == std::vector<std::string>{"1"});
}

TEST_CASE("positional_statement: statement without parameters") {
    auto positional = to_positional({"SELECT schema_name FROM information_schema.schemata", {}});

    REQUIRE(positional.text == "SELECT schema_name FROM information_schema.schemata");
    REQUIRE(positional.values.empty());
}

TEST_CASE("positional_statement: unbound marker") {
    REQUIRE_THROWS_AS(to_positional({"SELECT :missing", {}}), std::invalid_argument);
    REQUIRE_THROWS_WITH(to_positional({"SELECT :missing", {{"other", "1"}}}),
                        "No value bound for parameter :missing");
}

TEST_CASE("positional_statement: works on builder output") {
    auto statement = build_statement("SELECT table_name FROM information_schema.tables",
                                     {"table_catalog", "table_schema"},
                                     {"def", "shop"});

    auto positional = to_positional(statement);

    REQUIRE(positional.text ==
            "SELECT table_name FROM information_schema.tables WHERE table_catalog = ? AND table_schema = ?");
    REQUIRE(positional.values == std::vector<std::string>{"def", "shop"});
}
