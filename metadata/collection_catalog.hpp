// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "metadata/collection_descriptor.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace metadata {

    namespace collection_name {
        inline constexpr std::string_view META_DATA_COLLECTIONS = "MetaDataCollections";
        inline constexpr std::string_view DATA_SOURCE_INFORMATION = "DataSourceInformation";
        inline constexpr std::string_view RESTRICTIONS = "Restrictions";
        inline constexpr std::string_view RESERVED_WORDS = "ReservedWords";
        inline constexpr std::string_view DATABASES = "Databases";
        inline constexpr std::string_view TABLES = "Tables";
        inline constexpr std::string_view COLUMNS = "Columns";
        inline constexpr std::string_view VIEWS = "Views";
        inline constexpr std::string_view USERS = "Users";
        inline constexpr std::string_view INDEXES = "Indexes";
        inline constexpr std::string_view INDEX_COLUMNS = "IndexColumns";
    } // namespace collection_name

    // Read-only after construction, lookups need no locking.
    class collection_catalog {
    public:
        // throws std::invalid_argument on duplicate (case-insensitive) names
        explicit collection_catalog(std::vector<collection_descriptor> descriptors);

        // throws unknown_collection
        const collection_descriptor& resolve(std::string_view name) const;
        const collection_descriptor* find(std::string_view name) const noexcept;
        bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

        // registration order
        std::vector<collection_summary> list() const;
        const std::vector<collection_descriptor>& descriptors() const noexcept { return descriptors_; }
        size_t size() const noexcept { return descriptors_.size(); }

    private:
        static std::string key(std::string_view name);

        std::vector<collection_descriptor> descriptors_;
        std::unordered_map<std::string, size_t> index_;
    };

    // Compiled-in manifest for MySQL information_schema
    std::vector<collection_descriptor> mysql_collections();
    collection_catalog make_mysql_catalog();

    // Built once on first use
    const collection_catalog& default_catalog();

} // namespace metadata
