// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "metadata/collection_catalog.hpp"
#include "metadata/schema_error.hpp"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace metadata;

namespace {
    collection_descriptor make_descriptor(std::string name, std::vector<std::string> restriction_columns = {}) {
        return {
            .name = std::move(name),
            .result_columns = {{"value", logical_type::STRING_LITERAL}},
            .query_template = "SELECT value FROM t",
            .restriction_columns = std::move(restriction_columns),
        };
    }
} // namespace

TEST_CASE("collection_catalog: resolve registered collections") {
    collection_catalog catalog({make_descriptor("Alpha", {"a"}), make_descriptor("Beta")});

    REQUIRE(catalog.size() == 2);
    REQUIRE(catalog.resolve("Alpha").restriction_columns == std::vector<std::string>{"a"});
    REQUIRE(catalog.resolve("Beta").name == "Beta");
    REQUIRE(catalog.contains("Alpha"));
}

TEST_CASE("collection_catalog: names are case-insensitive") {
    collection_catalog catalog({make_descriptor("IndexColumns")});

    REQUIRE(catalog.resolve("indexcolumns").name == "IndexColumns");
    REQUIRE(catalog.resolve("INDEXCOLUMNS").name == "IndexColumns");
    REQUIRE(catalog.find("indexColumns") != nullptr);
}

TEST_CASE("collection_catalog: unknown collection") {
    collection_catalog catalog({make_descriptor("Alpha")});

    REQUIRE(catalog.find("Gamma") == nullptr);
    REQUIRE_FALSE(catalog.contains(""));
    REQUIRE_THROWS_AS(catalog.resolve("Gamma"), unknown_collection);

    try {
        catalog.resolve("Gamma");
        FAIL("resolve must throw");
    } catch (const unknown_collection& e) {
        REQUIRE(e.collection() == "Gamma");
        REQUIRE(e.mistake() == schema_mistake_t::UNKNOWN_COLLECTION);
        REQUIRE_FALSE(e.retryable());
    }
}

TEST_CASE("collection_catalog: duplicate names are rejected") {
    REQUIRE_THROWS_AS(collection_catalog({make_descriptor("Alpha"), make_descriptor("ALPHA")}),
                      std::invalid_argument);
}

TEST_CASE("collection_catalog: list keeps registration order") {
    collection_catalog catalog({make_descriptor("Zeta", {"z"}), make_descriptor("Alpha"), make_descriptor("Mu")});

    auto summaries = catalog.list();

    REQUIRE(summaries.size() == 3);
    REQUIRE(summaries[0].name == "Zeta");
    REQUIRE(summaries[0].restriction_columns == std::vector<std::string>{"z"});
    REQUIRE(summaries[1].name == "Alpha");
    REQUIRE(summaries[2].name == "Mu");
    REQUIRE(catalog.list().size() == summaries.size());
}

TEST_CASE("collection_catalog: mysql manifest") {
    const auto& catalog = default_catalog();

    for (auto name : {collection_name::META_DATA_COLLECTIONS,
                      collection_name::DATA_SOURCE_INFORMATION,
                      collection_name::RESTRICTIONS,
                      collection_name::RESERVED_WORDS,
                      collection_name::DATABASES,
                      collection_name::TABLES,
                      collection_name::COLUMNS,
                      collection_name::VIEWS,
                      collection_name::USERS,
                      collection_name::INDEXES,
                      collection_name::INDEX_COLUMNS}) {
        INFO(name);
        REQUIRE(catalog.contains(name));
    }
    REQUIRE(catalog.size() == 11);

    const auto& tables = catalog.resolve(collection_name::TABLES);
    REQUIRE(tables.restriction_columns ==
            std::vector<std::string>{"table_catalog", "table_schema", "table_name", "table_type"});
    REQUIRE(tables.clause_start == sql_gen::clause_start::WHERE);
    REQUIRE_FALSE(tables.is_static());

    REQUIRE(catalog.resolve(collection_name::DATABASES).restriction_columns ==
            std::vector<std::string>{"schema_name"});
    REQUIRE(catalog.resolve(collection_name::INDEXES).clause_start == sql_gen::clause_start::AND);
    REQUIRE(catalog.resolve(collection_name::INDEX_COLUMNS).restriction_columns.size() == 5);
    REQUIRE(catalog.resolve(collection_name::RESERVED_WORDS).is_static());
}

TEST_CASE("collection_catalog: restriction columns are selectable") {
    // every queried collection filters on plain identifiers, never on expressions
    for (const auto& descriptor : default_catalog().descriptors()) {
        if (descriptor.is_static()) {
            REQUIRE(descriptor.restriction_columns.empty());
            continue;
        }
        REQUIRE_FALSE(descriptor.query_template.empty());
        for (const auto& column : descriptor.restriction_columns) {
            INFO(descriptor.name << "." << column);
            REQUIRE(std::all_of(column.begin(), column.end(), [](char c) {
                return (c >= 'a' && c <= 'z') || c == '_';
            }));
        }
    }
}
