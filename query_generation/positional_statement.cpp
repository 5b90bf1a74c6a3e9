// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "positional_statement.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace sql_gen {

    namespace {
        bool is_identifier_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }

        bool is_identifier_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

        // index just past the closing quote, doubled quotes are escapes
        size_t skip_quoted(std::string_view text, size_t pos) {
            const char quote = text[pos];
            ++pos;
            while (pos < text.size()) {
                if (text[pos] == '\\' && quote != '`') {
                    pos += 2;
                    continue;
                }
                if (text[pos] == quote) {
                    if (pos + 1 < text.size() && text[pos + 1] == quote) {
                        pos += 2;
                        continue;
                    }
                    return pos + 1;
                }
                ++pos;
            }
            return text.size();
        }

        // length of the comment starting at pos, 0 when there is none
        size_t comment_length(std::string_view text, size_t pos) {
            auto rest = text.substr(pos);
            size_t end = std::string_view::npos;
            if (rest.starts_with("#")) {
                end = rest.find('\n');
            } else if (rest.starts_with("--") &&
                       (rest.size() == 2 || std::isspace(static_cast<unsigned char>(rest[2])))) {
                end = rest.find('\n');
            } else if (rest.starts_with("/*")) {
                end = rest.find("*/", 2);
                if (end != std::string_view::npos) {
                    end += 2;
                }
            } else {
                return 0;
            }
            return end == std::string_view::npos ? rest.size() : end;
        }
    } // namespace

    positional_statement to_positional(const bound_statement& statement) {
        positional_statement result;
        std::string_view text = statement.text;
        result.text.reserve(text.size());

        size_t pos = 0;
        while (pos < text.size()) {
            const char c = text[pos];
            if (c == '\'' || c == '"' || c == '`') {
                size_t end = skip_quoted(text, pos);
                result.text.append(text.substr(pos, end - pos));
                pos = end;
                continue;
            }
            if (size_t length = comment_length(text, pos); length > 0) {
                result.text.append(text.substr(pos, length));
                pos += length;
                continue;
            }
            if (c == ':' && pos + 1 < text.size() && text[pos + 1] == ':') {
                result.text.append("::");
                pos += 2;
                continue;
            }
            if (c == ':' && pos + 1 < text.size() && is_identifier_start(text[pos + 1])) {
                size_t end = pos + 1;
                while (end < text.size() && is_identifier_char(text[end])) {
                    ++end;
                }
                std::string_view name = text.substr(pos + 1, end - pos - 1);
                auto param = std::find_if(statement.parameters.begin(),
                                          statement.parameters.end(),
                                          [name](const parameter& p) { return p.name == name; });
                if (param == statement.parameters.end()) {
                    throw std::invalid_argument("No value bound for parameter :" + std::string(name));
                }
                result.text.push_back('?');
                result.values.push_back(param->value);
                pos = end;
                continue;
            }
            result.text.push_back(c);
            ++pos;
        }
        return result;
    }

} // namespace sql_gen
