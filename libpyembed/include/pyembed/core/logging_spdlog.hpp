// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_LOGGING_SPDLOG_HPP
#define PYEMBED_CORE_LOGGING_SPDLOG_HPP

#include <memory>
#include <vector>

#include <spdlog/common.h>

#include "pyembed/core/logging.hpp"

namespace pyembed::logging::spdlogimpl
{
    /// @returns The provided `log_level` value converted to the equivalent value for `spdlog`.
    inline constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
    {
        static_assert(sizeof(log_level) == sizeof(spdlog::level::level_enum));
        static_assert(static_cast<int>(log_level::off) == static_cast<int>(spdlog::level::off));
        return static_cast<spdlog::level::level_enum>(level);
    }

    /** `LogHandler` implementation using `spdlog` library.

        Every logger is owned and registered in `spdlog`, one per log source.
        By default records are written to the standard error with colors, a different
        sink can be provided at construction (used in tests to capture the output).

        @see `pyembed::logging::LogHandler`
    */
    class LogHandler_spdlog
    {
    public:

        LogHandler_spdlog();
        explicit LogHandler_spdlog(spdlog::sink_ptr sink);
        ~LogHandler_spdlog();

        LogHandler_spdlog(const LogHandler_spdlog& other) = delete;
        LogHandler_spdlog& operator=(const LogHandler_spdlog& other) = delete;

        LogHandler_spdlog(LogHandler_spdlog&& other) noexcept;
        LogHandler_spdlog& operator=(LogHandler_spdlog&& other) noexcept;

        auto start_log_handling(LoggingParams params, std::vector<log_source> sources) -> void;
        auto stop_log_handling(stop_reason reason) -> void;

        auto set_log_level(log_level new_level) -> void;

        auto log(logging::LogRecord record) -> void;

        auto is_started() const -> bool;

    private:

        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

    static_assert(logging::LogHandler<LogHandler_spdlog>);

}

#endif
