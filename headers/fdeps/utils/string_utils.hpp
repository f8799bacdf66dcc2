//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef FDEPS_STRING_UTILS_HPP
#define FDEPS_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief Small string helpers used by the extractor, resolver and CLI.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace fdeps::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits on a delimiter, keeping empty parts ("a..b" gives three parts).
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits a comma-separated option value into trimmed, non-empty items.
     */
    inline std::vector<std::string> split_list(const std::string_view s) {
        std::vector<std::string> items;
        for (const auto part : split(s, ',')) {
            if (const auto item = trim(part); !item.empty()) {
                items.emplace_back(item);
            }
        }
        return items;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    /**
     * Identifier characters: ASCII alphanumerics, '_' and any non-ASCII byte.
     */
    inline bool is_identifier_char(const char c) noexcept {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '_' || uc >= 0x80;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

}  // namespace fdeps::string_utils

#endif //FDEPS_STRING_UTILS_HPP
