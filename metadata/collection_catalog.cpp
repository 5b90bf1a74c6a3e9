// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "collection_catalog.hpp"

#include "metadata/schema_error.hpp"
#include "metadata/static_collections.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace metadata {

    namespace {
        constexpr auto STRING = logical_type::STRING_LITERAL;
        constexpr auto INTEGER = logical_type::INTEGER;

        // keeps the system schemas out of index listings
        constexpr std::string_view USER_SCHEMAS_ONLY =
            "table_schema NOT IN ('mysql', 'sys', 'performance_schema', 'information_schema')";

        collection_descriptor make_static(std::string_view name, std::vector<column_definition> columns, row_source_t rows) {
            collection_descriptor descriptor;
            descriptor.name = std::string(name);
            descriptor.result_columns = std::move(columns);
            descriptor.rows = std::move(rows);
            return descriptor;
        }
    } // namespace

    collection_catalog::collection_catalog(std::vector<collection_descriptor> descriptors)
        : descriptors_(std::move(descriptors)) {
        index_.reserve(descriptors_.size());
        for (size_t i = 0; i < descriptors_.size(); ++i) {
            if (!index_.emplace(key(descriptors_[i].name), i).second) {
                throw std::invalid_argument("Duplicate metadata collection: " + descriptors_[i].name);
            }
        }
    }

    std::string collection_catalog::key(std::string_view name) {
        std::string result(name);
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    const collection_descriptor& collection_catalog::resolve(std::string_view name) const {
        if (const auto* descriptor = find(name); descriptor) {
            return *descriptor;
        }
        throw unknown_collection(std::string(name));
    }

    const collection_descriptor* collection_catalog::find(std::string_view name) const noexcept {
        auto it = index_.find(key(name));
        if (it == index_.end()) {
            return nullptr;
        }
        return &descriptors_[it->second];
    }

    std::vector<collection_summary> collection_catalog::list() const {
        std::vector<collection_summary> result;
        result.reserve(descriptors_.size());
        for (const auto& descriptor : descriptors_) {
            result.push_back({descriptor.name, descriptor.restriction_columns, descriptor.identifier_parts});
        }
        return result;
    }

    std::vector<collection_descriptor> mysql_collections() {
        std::vector<collection_descriptor> collections;

        collections.push_back(make_static(collection_name::META_DATA_COLLECTIONS,
                                          meta_data_collections_columns(),
                                          meta_data_collections_rows));
        collections.push_back(make_static(collection_name::DATA_SOURCE_INFORMATION,
                                          data_source_information_columns(),
                                          data_source_information_rows));
        collections.push_back(
            make_static(collection_name::RESTRICTIONS, restrictions_columns(), restrictions_rows));
        collections.push_back(
            make_static(collection_name::RESERVED_WORDS, reserved_words_columns(), reserved_words_rows));

        collections.push_back({
            .name = std::string(collection_name::DATABASES),
            .result_columns = {{"database_name", STRING}, {"owner", STRING}, {"encoding", STRING}},
            .query_template = "SELECT schema_name AS database_name, NULL AS owner, "
                              "default_character_set_name AS encoding FROM information_schema.schemata",
            .restriction_columns = {"schema_name"},
            .identifier_parts = 1,
        });

        collections.push_back({
            .name = std::string(collection_name::TABLES),
            .result_columns = {{"table_catalog", STRING},
                               {"table_schema", STRING},
                               {"table_name", STRING},
                               {"table_type", STRING}},
            .query_template =
                "SELECT table_catalog, table_schema, table_name, table_type FROM information_schema.tables",
            .restriction_columns = {"table_catalog", "table_schema", "table_name", "table_type"},
            .identifier_parts = 3,
        });

        collections.push_back({
            .name = std::string(collection_name::COLUMNS),
            .result_columns = {{"table_catalog", STRING},
                               {"table_schema", STRING},
                               {"table_name", STRING},
                               {"column_name", STRING},
                               {"ordinal_position", INTEGER},
                               {"column_default", STRING},
                               {"is_nullable", STRING},
                               {"data_type", STRING},
                               {"character_maximum_length", INTEGER},
                               {"character_octet_length", INTEGER},
                               {"numeric_precision", INTEGER},
                               {"numeric_scale", INTEGER},
                               {"datetime_precision", INTEGER},
                               {"character_set_name", STRING},
                               {"collation_name", STRING}},
            .query_template = "SELECT table_catalog, table_schema, table_name, column_name, ordinal_position, "
                              "column_default, is_nullable, data_type, character_maximum_length, "
                              "character_octet_length, numeric_precision, numeric_scale, datetime_precision, "
                              "character_set_name, collation_name FROM information_schema.columns",
            .restriction_columns = {"table_catalog", "table_schema", "table_name", "column_name"},
            .identifier_parts = 4,
        });

        collections.push_back({
            .name = std::string(collection_name::VIEWS),
            .result_columns = {{"table_catalog", STRING},
                               {"table_schema", STRING},
                               {"table_name", STRING},
                               {"check_option", STRING},
                               {"is_updatable", STRING}},
            .query_template = "SELECT table_catalog, table_schema, table_name, check_option, is_updatable "
                              "FROM information_schema.views",
            .restriction_columns = {"table_catalog", "table_schema", "table_name"},
            .identifier_parts = 3,
        });

        collections.push_back({
            .name = std::string(collection_name::USERS),
            .result_columns = {{"user_name", STRING}, {"user_host", STRING}},
            .query_template = "SELECT user AS user_name, host AS user_host FROM mysql.user",
            .restriction_columns = {"user"},
            .identifier_parts = 1,
        });

        collections.push_back({
            .name = std::string(collection_name::INDEXES),
            .result_columns = {{"table_catalog", STRING},
                               {"table_schema", STRING},
                               {"table_name", STRING},
                               {"index_name", STRING}},
            .query_template = "SELECT DISTINCT table_catalog, table_schema, table_name, index_name "
                              "FROM information_schema.statistics WHERE " +
                              std::string(USER_SCHEMAS_ONLY),
            .restriction_columns = {"table_catalog", "table_schema", "table_name", "index_name"},
            .clause_start = sql_gen::clause_start::AND,
            .identifier_parts = 4,
        });

        collections.push_back({
            .name = std::string(collection_name::INDEX_COLUMNS),
            .result_columns = {{"table_catalog", STRING},
                               {"table_schema", STRING},
                               {"table_name", STRING},
                               {"index_name", STRING},
                               {"column_name", STRING},
                               {"ordinal_position", INTEGER}},
            .query_template = "SELECT table_catalog, table_schema, table_name, index_name, column_name, "
                              "seq_in_index AS ordinal_position FROM information_schema.statistics WHERE " +
                              std::string(USER_SCHEMAS_ONLY),
            .restriction_columns = {"table_catalog", "table_schema", "table_name", "index_name", "column_name"},
            .clause_start = sql_gen::clause_start::AND,
            .identifier_parts = 5,
        });

        return collections;
    }

    collection_catalog make_mysql_catalog() { return collection_catalog(mysql_collections()); }

    const collection_catalog& default_catalog() {
        static const collection_catalog catalog = make_mysql_catalog();
        return catalog;
    }

} // namespace metadata
