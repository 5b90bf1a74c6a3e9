// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "mysql_to_raw.hpp"

#include <limits>
#include <sstream>

namespace tsl {

    metadata::value_t mysql_to_value(boost::mysql::field_view field) {
        switch (field.kind()) {
            case boost::mysql::field_kind::null:
                return std::monostate{};
            case boost::mysql::field_kind::int64:
                return field.as_int64();
            case boost::mysql::field_kind::uint64: {
                const auto value = field.as_uint64();
                if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return std::to_string(value);
                }
                return static_cast<int64_t>(value);
            }
            case boost::mysql::field_kind::string:
                return std::string(field.as_string());
            case boost::mysql::field_kind::blob: {
                auto blob = field.as_blob();
                return std::string(reinterpret_cast<const char*>(blob.data()), blob.size());
            }
            default: {
                // float, double, date, datetime, time
                std::ostringstream stream;
                stream << field;
                return stream.str();
            }
        }
    }

    metadata::raw_result mysql_to_raw(const boost::mysql::results& result) {
        metadata::raw_result raw;
        raw.column_names.reserve(result.meta().size());
        for (const auto& meta : result.meta()) {
            raw.column_names.emplace_back(meta.column_name());
        }

        raw.rows.reserve(result.rows().size());
        for (const auto& row : result.rows()) {
            metadata::row_t values;
            values.reserve(row.size());
            for (const auto field : row) {
                values.push_back(mysql_to_value(field));
            }
            raw.rows.push_back(std::move(values));
        }
        return raw;
    }

} // namespace tsl
