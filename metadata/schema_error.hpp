// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace metadata {

    enum class schema_mistake_t : uint8_t
    {
        UNKNOWN_COLLECTION,
        MALFORMED_RESTRICTION,
        EXECUTION_FAILED,
    };

    class schema_error : public std::runtime_error {
    public:
        schema_error(schema_mistake_t mistake, const std::string& what)
            : std::runtime_error(what)
            , mistake_(mistake) {}

        schema_mistake_t mistake() const noexcept { return mistake_; }

        // only store failures may succeed when the same call is repeated
        bool retryable() const noexcept { return mistake_ == schema_mistake_t::EXECUTION_FAILED; }

    private:
        schema_mistake_t mistake_;
    };

    class unknown_collection : public schema_error {
    public:
        explicit unknown_collection(std::string collection)
            : schema_error(schema_mistake_t::UNKNOWN_COLLECTION, "Unknown metadata collection: " + collection)
            , collection_(std::move(collection)) {}

        const std::string& collection() const noexcept { return collection_; }

    private:
        std::string collection_;
    };

    class malformed_restriction : public schema_error {
    public:
        explicit malformed_restriction(const std::string& what)
            : schema_error(schema_mistake_t::MALFORMED_RESTRICTION, what) {}
    };

    class execution_failed : public schema_error {
    public:
        explicit execution_failed(std::string diagnostic)
            : schema_error(schema_mistake_t::EXECUTION_FAILED, diagnostic)
            , diagnostic_(std::move(diagnostic)) {}

        const std::string& diagnostic() const noexcept { return diagnostic_; }

    private:
        std::string diagnostic_;
    };

    inline const char* to_string(schema_mistake_t mistake) noexcept {
        switch (mistake) {
            case schema_mistake_t::UNKNOWN_COLLECTION:
                return "UnknownCollection";
            case schema_mistake_t::MALFORMED_RESTRICTION:
                return "MalformedRestriction";
            case schema_mistake_t::EXECUTION_FAILED:
                return "ExecutionFailed";
        }
        return "Unknown";
    }

} // namespace metadata
