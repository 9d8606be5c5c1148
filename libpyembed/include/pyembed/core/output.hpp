// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_OUTPUT_HPP
#define PYEMBED_CORE_OUTPUT_HPP

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <fmt/color.h>

namespace pyembed
{
    class Context;

    class ConsoleStream : public std::stringstream
    {
    public:

        ConsoleStream() = default;
        ~ConsoleStream();
    };

    class ConsoleData;

    /**
     * User facing output of the program.
     *
     * Only one console can exist at a time, it registers itself as the global instance
     * on construction. Library code checks `is_available()` before printing so that it
     * stays silent when used without a console.
     */
    class Console
    {
    public:

        Console(const Console&) = delete;
        Console& operator=(const Console&) = delete;

        Console(Console&&) = delete;
        Console& operator=(Console&&) = delete;

        static Console& instance();
        static bool is_available();
        static ConsoleStream stream();

        static std::string hide_secrets(std::string_view str);

        /// Prints a line on the standard output, unless the context requests quiet output.
        void print(std::string_view str, bool force_print = false);

        /// Prints a line styled with the given text style if the palette has colors.
        void print_styled(std::string_view str, const fmt::text_style& style, bool force_print = false);

        const Context& context() const;

        explicit Console(const Context& context);
        ~Console();

    private:

        std::unique_ptr<ConsoleData> p_data;

        static void set_singleton(Console& console);
        static void clear_singleton();
    };
}

#endif
