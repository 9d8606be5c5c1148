// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <iterator>

#include "pyembed/util/string.hpp"

namespace pyembed::util
{
    auto is_space(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string();
        out.reserve(str.size());
        std::transform(str.cbegin(), str.cend(), std::back_inserter(out), [](char c) { return to_lower(c); });
        return out;
    }

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    auto starts_with(std::string_view str, char c) -> bool
    {
        return !str.empty() && (str.front() == c);
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return str.size() >= suffix.size()
               && str.substr(str.size() - suffix.size(), suffix.size()) == suffix;
    }

    auto ends_with(std::string_view str, char c) -> bool
    {
        return !str.empty() && (str.back() == c);
    }

    /***************************************
     *  Implementation of strip functions  *
     ***************************************/

    namespace
    {
        template <typename UnaryFunc>
        auto lstrip_if(std::string_view input, UnaryFunc should_strip) -> std::string_view
        {
            const auto start = std::find_if_not(input.cbegin(), input.cend(), should_strip);
            return input.substr(static_cast<std::size_t>(start - input.cbegin()));
        }

        template <typename UnaryFunc>
        auto rstrip_if(std::string_view input, UnaryFunc should_strip) -> std::string_view
        {
            const auto rest = std::find_if_not(input.crbegin(), input.crend(), should_strip);
            return input.substr(0, static_cast<std::size_t>(input.crend() - rest));
        }
    }

    auto lstrip(std::string_view input, char c) -> std::string_view
    {
        return lstrip_if(input, [c](char x) { return x == c; });
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        return lstrip_if(input, [](char x) { return is_space(x); });
    }

    auto rstrip(std::string_view input, char c) -> std::string_view
    {
        return rstrip_if(input, [c](char x) { return x == c; });
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        return rstrip_if(input, [](char x) { return is_space(x); });
    }

    auto strip(std::string_view input, char c) -> std::string_view
    {
        return rstrip(lstrip(input, c), c);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return rstrip(lstrip(input));
    }

    /***************************************
     *  Implementation of split functions  *
     ***************************************/

    auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>
    {
        if (const auto pos = str.find(sep); pos != std::string_view::npos)
        {
            return { str.substr(0, pos), str.substr(pos + 1) };
        }
        return { str, std::nullopt };
    }

    auto split(std::string_view input, char sep) -> std::vector<std::string>
    {
        auto result = std::vector<std::string>();
        auto elem = std::string_view();
        auto rest = std::optional<std::string_view>(input);
        while (rest.has_value())
        {
            std::tie(elem, rest) = split_once(rest.value(), sep);
            result.emplace_back(elem);
        }
        return result;
    }

    void replace_all(std::string& data, std::string_view search, std::string_view replace)
    {
        if (search.empty())
        {
            return;
        }
        std::size_t pos = data.find(search);
        while (pos != std::string::npos)
        {
            data.replace(pos, search.size(), replace);
            pos = data.find(search, pos + replace.size());
        }
    }
}
