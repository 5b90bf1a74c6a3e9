// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "static_collections.hpp"

#include "metadata/collection_catalog.hpp"

namespace metadata {

    namespace {
        // values of System.Data.Common.GroupByBehavior / IdentifierCase / SupportedJoinOperators
        constexpr int64_t GROUP_BY_UNRELATED = 2;
        constexpr int64_t IDENTIFIER_CASE_INSENSITIVE = 1;
        constexpr int64_t IDENTIFIER_CASE_SENSITIVE = 2;
        constexpr int64_t JOIN_INNER_LEFT_RIGHT = 0x1 | 0x2 | 0x4;
        constexpr int64_t PARAMETER_NAME_MAX_LENGTH = 64;
    } // namespace

    const std::vector<std::string_view>& reserved_words() {
        static const std::vector<std::string_view> words = {
            "ACCESSIBLE",
            "ADD",
            "ALL",
            "ALTER",
            "ANALYZE",
            "AND",
            "AS",
            "ASC",
            "ASENSITIVE",
            "BEFORE",
            "BETWEEN",
            "BIGINT",
            "BINARY",
            "BLOB",
            "BOTH",
            "BY",
            "CALL",
            "CASCADE",
            "CASE",
            "CHANGE",
            "CHAR",
            "CHARACTER",
            "CHECK",
            "COLLATE",
            "COLUMN",
            "CONDITION",
            "CONSTRAINT",
            "CONTINUE",
            "CONVERT",
            "CREATE",
            "CROSS",
            "CUBE",
            "CUME_DIST",
            "CURRENT_DATE",
            "CURRENT_TIME",
            "CURRENT_TIMESTAMP",
            "CURRENT_USER",
            "CURSOR",
            "DATABASE",
            "DATABASES",
            "DAY_HOUR",
            "DAY_MICROSECOND",
            "DAY_MINUTE",
            "DAY_SECOND",
            "DEC",
            "DECIMAL",
            "DECLARE",
            "DEFAULT",
            "DELAYED",
            "DELETE",
            "DENSE_RANK",
            "DESC",
            "DESCRIBE",
            "DETERMINISTIC",
            "DISTINCT",
            "DISTINCTROW",
            "DIV",
            "DOUBLE",
            "DROP",
            "DUAL",
            "EACH",
            "ELSE",
            "ELSEIF",
            "EMPTY",
            "ENCLOSED",
            "ESCAPED",
            "EXCEPT",
            "EXISTS",
            "EXIT",
            "EXPLAIN",
            "FALSE",
            "FETCH",
            "FIRST_VALUE",
            "FLOAT",
            "FLOAT4",
            "FLOAT8",
            "FOR",
            "FORCE",
            "FOREIGN",
            "FROM",
            "FULLTEXT",
            "FUNCTION",
            "GENERATED",
            "GET",
            "GRANT",
            "GROUP",
            "GROUPING",
            "GROUPS",
            "HAVING",
            "HIGH_PRIORITY",
            "HOUR_MICROSECOND",
            "HOUR_MINUTE",
            "HOUR_SECOND",
            "IF",
            "IGNORE",
            "IN",
            "INDEX",
            "INFILE",
            "INNER",
            "INOUT",
            "INSENSITIVE",
            "INSERT",
            "INT",
            "INT1",
            "INT2",
            "INT3",
            "INT4",
            "INT8",
            "INTEGER",
            "INTERSECT",
            "INTERVAL",
            "INTO",
            "IO_AFTER_GTIDS",
            "IO_BEFORE_GTIDS",
            "IS",
            "ITERATE",
            "JOIN",
            "JSON_TABLE",
            "KEY",
            "KEYS",
            "KILL",
            "LAG",
            "LAST_VALUE",
            "LATERAL",
            "LEAD",
            "LEADING",
            "LEAVE",
            "LEFT",
            "LIKE",
            "LIMIT",
            "LINEAR",
            "LINES",
            "LOAD",
            "LOCALTIME",
            "LOCALTIMESTAMP",
            "LOCK",
            "LONG",
            "LONGBLOB",
            "LONGTEXT",
            "LOOP",
            "LOW_PRIORITY",
            "MASTER_BIND",
            "MASTER_SSL_VERIFY_SERVER_CERT",
            "MATCH",
            "MAXVALUE",
            "MEDIUMBLOB",
            "MEDIUMINT",
            "MEDIUMTEXT",
            "MIDDLEINT",
            "MINUTE_MICROSECOND",
            "MINUTE_SECOND",
            "MOD",
            "MODIFIES",
            "NATURAL",
            "NOT",
            "NO_WRITE_TO_BINLOG",
            "NTH_VALUE",
            "NTILE",
            "NULL",
            "NUMERIC",
            "OF",
            "ON",
            "OPTIMIZE",
            "OPTIMIZER_COSTS",
            "OPTION",
            "OPTIONALLY",
            "OR",
            "ORDER",
            "OUT",
            "OUTER",
            "OUTFILE",
            "OVER",
            "PARTITION",
            "PERCENT_RANK",
            "PRECISION",
            "PRIMARY",
            "PROCEDURE",
            "PURGE",
            "RANGE",
            "RANK",
            "READ",
            "READS",
            "READ_WRITE",
            "REAL",
            "RECURSIVE",
            "REFERENCES",
            "REGEXP",
            "RELEASE",
            "RENAME",
            "REPEAT",
            "REPLACE",
            "REQUIRE",
            "RESIGNAL",
            "RESTRICT",
            "RETURN",
            "REVOKE",
            "RIGHT",
            "RLIKE",
            "ROW",
            "ROWS",
            "ROW_NUMBER",
            "SCHEMA",
            "SCHEMAS",
            "SECOND_MICROSECOND",
            "SELECT",
            "SENSITIVE",
            "SEPARATOR",
            "SET",
            "SHOW",
            "SIGNAL",
            "SMALLINT",
            "SPATIAL",
            "SPECIFIC",
            "SQL",
            "SQLEXCEPTION",
            "SQLSTATE",
            "SQLWARNING",
            "SQL_BIG_RESULT",
            "SQL_CALC_FOUND_ROWS",
            "SQL_SMALL_RESULT",
            "SSL",
            "STARTING",
            "STORED",
            "STRAIGHT_JOIN",
            "SYSTEM",
            "TABLE",
            "TERMINATED",
            "THEN",
            "TINYBLOB",
            "TINYINT",
            "TINYTEXT",
            "TO",
            "TRAILING",
            "TRIGGER",
            "TRUE",
            "UNDO",
            "UNION",
            "UNIQUE",
            "UNLOCK",
            "UNSIGNED",
            "UPDATE",
            "USAGE",
            "USE",
            "USING",
            "UTC_DATE",
            "UTC_TIME",
            "UTC_TIMESTAMP",
            "VALUES",
            "VARBINARY",
            "VARCHAR",
            "VARCHARACTER",
            "VARYING",
            "VIRTUAL",
            "WHEN",
            "WHERE",
            "WHILE",
            "WINDOW",
            "WITH",
            "WRITE",
            "XOR",
            "YEAR_MONTH",
            "ZEROFILL",
        };
        return words;
    }

    std::vector<column_definition> reserved_words_columns() { return {{"ReservedWord", logical_type::STRING_LITERAL}}; }

    std::vector<column_definition> data_source_information_columns() {
        return {
            {"CompositeIdentifierSeparatorPattern", logical_type::STRING_LITERAL},
            {"DataSourceProductName", logical_type::STRING_LITERAL},
            {"GroupByBehavior", logical_type::INTEGER},
            {"IdentifierPattern", logical_type::STRING_LITERAL},
            {"IdentifierCase", logical_type::INTEGER},
            {"OrderByColumnsInSelect", logical_type::BOOLEAN},
            {"ParameterMarkerFormat", logical_type::STRING_LITERAL},
            {"ParameterMarkerPattern", logical_type::STRING_LITERAL},
            {"ParameterNameMaxLength", logical_type::INTEGER},
            {"ParameterNamePattern", logical_type::STRING_LITERAL},
            {"QuotedIdentifierPattern", logical_type::STRING_LITERAL},
            {"QuotedIdentifierCase", logical_type::INTEGER},
            {"StatementSeparatorPattern", logical_type::STRING_LITERAL},
            {"StringLiteralPattern", logical_type::STRING_LITERAL},
            {"SupportedJoinOperators", logical_type::INTEGER},
        };
    }

    std::vector<column_definition> meta_data_collections_columns() {
        return {
            {"CollectionName", logical_type::STRING_LITERAL},
            {"NumberOfRestrictions", logical_type::INTEGER},
            {"NumberOfIdentifierParts", logical_type::INTEGER},
        };
    }

    std::vector<column_definition> restrictions_columns() {
        return {
            {"CollectionName", logical_type::STRING_LITERAL},
            {"RestrictionName", logical_type::STRING_LITERAL},
            {"RestrictionDefault", logical_type::STRING_LITERAL},
            {"RestrictionNumber", logical_type::INTEGER},
        };
    }

    std::vector<row_t> reserved_words_rows(const collection_catalog&) {
        std::vector<row_t> rows;
        rows.reserve(reserved_words().size());
        for (auto word : reserved_words()) {
            rows.push_back({std::string(word)});
        }
        return rows;
    }

    std::vector<row_t> data_source_information_rows(const collection_catalog&) {
        row_t row{
            std::string(R"(\.)"),
            std::string("MySQL"),
            GROUP_BY_UNRELATED,
            std::string(R"((^[A-Za-z_$][A-Za-z0-9_$]*$)|(^`(([^`]|``)*)`$))"),
            IDENTIFIER_CASE_INSENSITIVE,
            false,
            std::string(":{0}"),
            std::string(":([A-Za-z_][A-Za-z0-9_]*)"),
            PARAMETER_NAME_MAX_LENGTH,
            std::string("^[A-Za-z_][A-Za-z0-9_]*$"),
            std::string("`(([^`]|``)*)`"),
            IDENTIFIER_CASE_SENSITIVE,
            std::string(";"),
            std::string("'(([^']|'')*)'"),
            JOIN_INNER_LEFT_RIGHT,
        };
        return {std::move(row)};
    }

    std::vector<row_t> meta_data_collections_rows(const collection_catalog& catalog) {
        std::vector<row_t> rows;
        rows.reserve(catalog.size());
        for (const auto& descriptor : catalog.descriptors()) {
            rows.push_back({descriptor.name,
                            static_cast<int64_t>(descriptor.restriction_columns.size()),
                            static_cast<int64_t>(descriptor.identifier_parts)});
        }
        return rows;
    }

    std::vector<row_t> restrictions_rows(const collection_catalog& catalog) {
        std::vector<row_t> rows;
        for (const auto& descriptor : catalog.descriptors()) {
            int64_t number = 0;
            for (const auto& column : descriptor.restriction_columns) {
                rows.push_back({descriptor.name, column, column, ++number});
            }
        }
        return rows;
    }

} // namespace metadata
