// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file glob_pattern.cpp
 * @brief Wildcard matcher implementation
 */

#include "kcenon/webhdfs/core/glob_pattern.h"

#include <cstddef>

namespace kcenon::webhdfs::glob_pattern {

namespace {

/**
 * @brief Match one bracket expression starting at pattern[pos] == '['
 * @param c Character to test
 * @param pattern Pattern text
 * @param pos In: index of '['; out: index after the closing ']'
 * @return 1 on match, 0 on mismatch, -1 when the bracket is unterminated
 */
auto match_bracket(char c, std::string_view pattern, std::size_t& pos) -> int {
    std::size_t i = pos + 1;
    bool negate = false;
    if (i < pattern.size() && pattern[i] == '!') {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char low = pattern[i];
        char high = low;
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            high = pattern[i + 2];
            i += 3;
        } else {
            ++i;
        }
        if (low <= c && c <= high) {
            matched = true;
        }
    }

    if (i >= pattern.size()) {
        return -1;
    }
    pos = i + 1;
    return matched != negate ? 1 : 0;
}

}  // namespace

auto has_magic(std::string_view text) noexcept -> bool {
    return text.find_first_of("*?[") != std::string_view::npos;
}

auto is_hidden(std::string_view name) noexcept -> bool {
    return !name.empty() && name.front() == '.';
}

auto matches(std::string_view name, std::string_view pattern) -> bool {
    std::size_t n = 0;
    std::size_t p = 0;
    std::size_t star_p = std::string_view::npos;
    std::size_t star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size()) {
            char pc = pattern[p];
            if (pc == '*') {
                star_p = p++;
                star_n = n;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++n;
                continue;
            }
            if (pc == '[') {
                std::size_t next = p;
                int outcome = match_bracket(name[n], pattern, next);
                if (outcome == 1) {
                    p = next;
                    ++n;
                    continue;
                }
                if (outcome == -1 && name[n] == '[') {
                    ++p;
                    ++n;
                    continue;
                }
            } else if (pc == name[n]) {
                ++p;
                ++n;
                continue;
            }
        }

        if (star_p == std::string_view::npos) {
            return false;
        }
        p = star_p + 1;
        n = ++star_n;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace kcenon::webhdfs::glob_pattern
