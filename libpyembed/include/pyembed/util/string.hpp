// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_UTIL_STRING_HPP
#define PYEMBED_UTIL_STRING_HPP

#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace pyembed::util
{
    [[nodiscard]] auto is_space(char c) -> bool;

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto starts_with(std::string_view str, char c) -> bool;

    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, char c) -> bool;

    [[nodiscard]] auto lstrip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split the string at the first occurrence of the separator.
     *
     * If the separator is not found, the second element is empty.
     */
    [[nodiscard]] auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>;

    [[nodiscard]] auto split(std::string_view input, char sep) -> std::vector<std::string>;

    void replace_all(std::string& data, std::string_view search, std::string_view replace);

    template <typename Range>
    [[nodiscard]] auto join(std::string_view sep, const Range& container) -> std::string;

    template <typename... Args>
    [[nodiscard]] auto concat(const Args&... args) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    namespace detail
    {
        inline auto length(const char* s) -> std::size_t
        {
            return std::strlen(s);
        }

        inline auto length(std::string_view s) -> std::size_t
        {
            return s.size();
        }

        inline auto length(const std::string& s) -> std::size_t
        {
            return s.size();
        }

        inline auto length(char) -> std::size_t
        {
            return 1;
        }
    }

    template <typename Range>
    auto join(std::string_view sep, const Range& container) -> std::string
    {
        std::string out = {};
        bool first = true;
        for (const auto& elem : container)
        {
            if (!first)
            {
                out += sep;
            }
            out += elem;
            first = false;
        }
        return out;
    }

    template <typename... Args>
    auto concat(const Args&... args) -> std::string
    {
        std::string result;
        result.reserve((detail::length(args) + ...));
        ((result += args), ...);
        return result;
    }
}
#endif
