// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>

#include "pyembed/core/context.hpp"
#include "pyembed/core/logging_spdlog.hpp"
#include "pyembed/core/util.hpp"
#include "pyembed/core/util_os.hpp"
#include "pyembed/util/environment.hpp"

namespace pyembed
{
    Context::Context(const ContextOptions& options)
    {
        set_persist_temporary_directories(util::get_env("PYEMBED_KEEP_TEMP_DIRS").has_value());

        {
            const bool cout_is_atty = is_atty(std::cout);
            const bool no_color = util::get_env("NO_COLOR").has_value();
            graphics_params.palette = (cout_is_atty && !no_color) ? Palette::terminal()
                                                                   : Palette::no_color();
        }

        if (options.enable_logging)
        {
            enable_logging();
        }
    }

    Context::~Context()
    {
        if (m_logging_enabled)
        {
            logging::stop_logging();
        }
    }

    void Context::enable_logging()
    {
        logging::set_log_handler(
            logging::spdlogimpl::LogHandler_spdlog{},
            LoggingParams{
                .logging_level = output_params.logging_level,
                .log_pattern = output_params.log_pattern,
            }
        );
        m_logging_enabled = true;
    }

    void Context::set_verbosity(int lvl)
    {
        this->output_params.verbosity = lvl;

        switch (lvl)
        {
            case -3:
                this->output_params.logging_level = log_level::off;
                break;
            case -2:
                this->output_params.logging_level = log_level::critical;
                break;
            case -1:
                this->output_params.logging_level = log_level::err;
                break;
            case 0:
                this->output_params.logging_level = log_level::warn;
                break;
            case 1:
                this->output_params.logging_level = log_level::info;
                break;
            case 2:
                this->output_params.logging_level = log_level::debug;
                break;
            default:
                this->output_params.logging_level = lvl > 0 ? log_level::trace : log_level::off;
                break;
        }
        logging::set_log_level(output_params.logging_level);
    }

    void Context::set_log_level(log_level level)
    {
        output_params.logging_level = level;
        logging::set_log_level(level);
    }
}
