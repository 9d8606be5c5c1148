// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifdef _WIN32
#include <windows.h>
#endif

#include <atomic>
#include <iostream>
#include <mutex>

#include <fmt/color.h>
#include <fmt/format.h>

#include "pyembed/core/context.hpp"
#include "pyembed/core/error_handling.hpp"
#include "pyembed/core/output.hpp"
#include "pyembed/core/util.hpp"

namespace pyembed
{
    namespace
    {
        std::atomic<Console*> main_console{ nullptr };
    }

    /*****************
     * ConsoleStream *
     *****************/

    ConsoleStream::~ConsoleStream()
    {
        if (Console::is_available())
        {
            Console::instance().print(str());
        }
    }

    /***********
     * Console *
     ***********/

    class ConsoleData
    {
    public:

        ConsoleData(const Context& ctx)
            : m_context(ctx)
        {
        }

        const Context& m_context;
        std::mutex m_mutex;
    };

    Console::Console(const Context& context)
        : p_data(new ConsoleData{ context })
    {
        set_singleton(*this);
#ifdef _WIN32
        // initialize ANSI codes on Win terminals
        auto hStdout = GetStdHandle(STD_OUTPUT_HANDLE);
        SetConsoleMode(hStdout, ENABLE_PROCESSED_OUTPUT | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
#endif
    }

    Console::~Console()
    {
        clear_singleton();
    }

    Console& Console::instance()
    {
        auto* console = main_console.load();
        if (!console)
        {
            throw pyembed_error(
                "attempted to access the console but it have not been created yet",
                pyembed_error_code::incorrect_usage
            );
        }
        return *console;
    }

    bool Console::is_available()
    {
        return main_console != nullptr;
    }

    void Console::set_singleton(Console& console)
    {
        Console* expected = nullptr;
        if (!main_console.compare_exchange_strong(expected, &console))
        {
            throw pyembed_error(
                "attempted to create multiple consoles",
                pyembed_error_code::incorrect_usage
            );
        }
    }

    void Console::clear_singleton()
    {
        main_console = nullptr;
    }

    const Context& Console::context() const
    {
        return p_data->m_context;
    }

    ConsoleStream Console::stream()
    {
        return ConsoleStream();
    }

    std::string Console::hide_secrets(std::string_view str)
    {
        return pyembed::hide_secrets(str);
    }

    void Console::print(std::string_view str, bool force_print)
    {
        if (force_print || !context().output_params.quiet)
        {
            const std::lock_guard<std::mutex> lock(p_data->m_mutex);
            std::cout << hide_secrets(str) << std::endl;
        }
    }

    void Console::print_styled(std::string_view str, const fmt::text_style& style, bool force_print)
    {
        print(fmt::format(style, "{}", hide_secrets(str)), force_print);
    }
}
