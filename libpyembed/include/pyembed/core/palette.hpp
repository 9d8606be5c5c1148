// Copyright (c) 2022, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_PALETTE_HPP
#define PYEMBED_CORE_PALETTE_HPP

#include <fmt/color.h>

namespace pyembed
{
    struct Palette
    {
        /** A step completed or something exists. */
        fmt::text_style success;
        /** A step failed. */
        fmt::text_style failure;
        /** Refers to an external resource (URL, interpreter, installer). */
        fmt::text_style external;
        /** Information that was already shown. */
        fmt::text_style shown;
        /** Reference to some input from the user. */
        fmt::text_style user;
        /** Input from the user was ignored or has no effect. */
        fmt::text_style ignored;

        /** A Palette with no colors at all. */
        static constexpr auto no_color() -> Palette;
        /** A Palette with terminal 4 bit colors. */
        static constexpr auto terminal() -> Palette;
    };

    /*******************************
     *  Implementation of Palette  *
     *******************************/

    inline constexpr auto Palette::no_color() -> Palette
    {
        return {};
    }

    inline constexpr auto Palette::terminal() -> Palette
    {
        return {
            /* .success= */ fmt::fg(fmt::terminal_color::green),
            /* .failure= */ fmt::fg(fmt::terminal_color::red),
            /* .external= */ fmt::fg(fmt::terminal_color::cyan),
            /* .shown= */ fmt::fg(fmt::terminal_color::bright_black),
            /* .user= */ fmt::fg(fmt::terminal_color::blue) | fmt::emphasis::bold,
            /* .ignored= */ fmt::fg(fmt::terminal_color::yellow),
        };
    }

}
#endif
