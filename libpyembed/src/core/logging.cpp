// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "pyembed/core/logging.hpp"
#include "pyembed/util/string.hpp"

namespace pyembed
{
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>
    {
        const auto lowered = util::to_lower(util::strip(name));
        static constexpr std::array levels{
            log_level::trace, log_level::debug,    log_level::info, log_level::warn,
            log_level::err,   log_level::critical, log_level::off,
        };
        for (const auto level : levels)
        {
            if (lowered == name_of(level))
            {
                return level;
            }
        }
        if (lowered == "warn")
        {
            return log_level::warn;
        }
        if (lowered == "err")
        {
            return log_level::err;
        }
        return std::nullopt;
    }
}

namespace pyembed::logging
{
    namespace
    {
        struct LoggingState
        {
            std::shared_mutex mutex;
            LoggingParams params;
        };

        auto logging_state() -> LoggingState&
        {
            static LoggingState state;
            return state;
        }

        auto current_log_handler() -> AnyLogHandler&
        {
            static AnyLogHandler handler;
            return handler;
        }
    }

    void AnyLogHandler::start_log_handling(LoggingParams params, std::vector<log_source> sources)
    {
        m_storage->start_log_handling(std::move(params), std::move(sources));
    }

    void AnyLogHandler::stop_log_handling(stop_reason reason)
    {
        m_storage->stop_log_handling(reason);
    }

    void AnyLogHandler::set_log_level(log_level new_level)
    {
        m_storage->set_log_level(new_level);
    }

    void AnyLogHandler::log(LogRecord record)
    {
        m_storage->log(std::move(record));
    }

    AnyLogHandler::~AnyLogHandler()
    {
        // The registered handler is destroyed at program exit without `stop_logging`.
        if (m_storage and this == &current_log_handler())
        {
            static std::once_flag flag;
            std::call_once(
                flag,
                [this]
                {
                    try
                    {
                        this->stop_log_handling(stop_reason::program_exit);
                    }
                    catch (const std::exception& error)
                    {
                        std::cerr << fmt::format(
                            "pyembed::logging: could not stop the log handler at exit: {}",
                            error.what()
                        ) << std::endl;
                    }
                }
            );
        }
    }

    auto stop_logging(stop_reason reason) -> AnyLogHandler
    {
        auto& handler = current_log_handler();
        if (handler)
        {
            handler.stop_log_handling(reason);
        }
        return std::exchange(handler, AnyLogHandler{});
    }

    auto set_log_handler(AnyLogHandler new_handler, std::optional<LoggingParams> maybe_new_params)
        -> AnyLogHandler
    {
        auto& handler = current_log_handler();
        if (handler)
        {
            handler.stop_log_handling();
        }

        auto previous_handler = std::exchange(handler, std::move(new_handler));

        LoggingParams params;
        {
            auto& state = logging_state();
            std::unique_lock lock{ state.mutex };
            if (maybe_new_params)
            {
                state.params = *maybe_new_params;
            }
            params = state.params;
        }

        if (handler)
        {
            handler.start_log_handling(std::move(params), all_log_sources());
        }

        return previous_handler;
    }

    auto set_log_level(log_level new_level) -> log_level
    {
        auto& state = logging_state();
        std::unique_lock lock{ state.mutex };
        const auto previous_level = state.params.logging_level;
        state.params.logging_level = new_level;
        if (auto& handler = current_log_handler())
        {
            handler.set_log_level(new_level);
        }
        return previous_level;
    }

    auto get_log_level() -> log_level
    {
        auto& state = logging_state();
        std::shared_lock lock{ state.mutex };
        return state.params.logging_level;
    }

    auto get_logging_params() -> LoggingParams
    {
        auto& state = logging_state();
        std::shared_lock lock{ state.mutex };
        return state.params;
    }

    void log(LogRecord record)
    {
        if (auto& handler = current_log_handler())
        {
            handler.log(std::move(record));
        }
    }

    ///////////////////////////////////////////////////////////////////
    // MessageLogger

    namespace
    {
        auto make_log_record(std::string_view message, log_level level, std::source_location location)
        {
            // Continuation lines are indented under the level and source columns.
            std::string formatted_message(message);
            util::replace_all(formatted_message, "\n", "\n    ");
            return LogRecord{
                .message = std::move(formatted_message),
                .level = level,
                .source = log_source::libpyembed,
                .location = std::move(location),
            };
        }
    }

    MessageLogger::MessageLogger(log_level level, std::source_location location)
        : m_level(level)
        , m_location(std::move(location))
    {
    }

    MessageLogger::~MessageLogger()
    {
        logging::log(make_log_record(m_stream.str(), m_level, std::move(m_location)));
    }
}
