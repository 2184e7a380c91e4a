#pragma once

// Private string helpers shared by the table, sample and model file parsers.

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mlmc::model::detail {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

inline std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

inline std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

/// Full-token conversion; partial matches such as "12abc" are rejected.
inline std::optional<double> parse_double(std::string_view token) {
    const std::string text = trim_copy(token);
    if (text.empty()) {
        return std::nullopt;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end != begin + text.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * Splits a line into cells.
 *
 * Without a delimiter, commas and whitespace all separate cells and runs of separators
 * collapse. With a delimiter, every occurrence starts a new cell and empty cells are kept
 * (a whitespace delimiter still collapses runs, like the default).
 */
inline std::vector<std::string> split_fields(std::string_view line, std::optional<char> delimiter) {
    std::vector<std::string> fields;

    const bool collapse = !delimiter ||
                          std::isspace(static_cast<unsigned char>(*delimiter)) != 0;
    if (collapse) {
        std::string current;
        for (char ch : line) {
            const bool separator = delimiter
                                       ? std::isspace(static_cast<unsigned char>(ch)) != 0
                                       : (ch == ',' || std::isspace(static_cast<unsigned char>(ch)) != 0);
            if (separator) {
                if (!current.empty()) {
                    fields.emplace_back(std::move(current));
                    current.clear();
                }
            } else {
                current.push_back(ch);
            }
        }
        if (!current.empty()) {
            fields.emplace_back(std::move(current));
        }
        return fields;
    }

    std::size_t start = 0;
    while (true) {
        const auto pos = line.find(*delimiter, start);
        if (pos == std::string_view::npos) {
            fields.emplace_back(trim_copy(line.substr(start)));
            break;
        }
        fields.emplace_back(trim_copy(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return fields;
}

}  // namespace mlmc::model::detail
