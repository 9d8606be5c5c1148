// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_LOGGING_HPP
#define PYEMBED_CORE_LOGGING_HPP

#include <array>
#include <concepts>
#include <memory>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   pyembed::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(pyembed::log_level::trace)
#define LOG_DEBUG       LOG(pyembed::log_level::debug)
#define LOG_INFO        LOG(pyembed::log_level::info)
#define LOG_WARNING     LOG(pyembed::log_level::warn)
#define LOG_ERROR       LOG(pyembed::log_level::err)
#define LOG_CRITICAL    LOG(pyembed::log_level::critical)
// clang-format on

namespace pyembed
{
    /** Severity of a log record, in increasing order.

        Records below the current level are dropped. The values match the ones of
        `spdlog::level::level_enum`.
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off,
    };

    inline constexpr auto operator<=>(log_level left, log_level right) noexcept
    {
        return static_cast<int>(left) <=> static_cast<int>(right);
    }

    /// @returns The name used for `level` in configuration files and on the command line.
    inline constexpr auto name_of(log_level level) -> const char*
    {
        constexpr std::array names{ "trace", "debug", "info", "warning", "error", "critical", "off" };
        return names.at(static_cast<std::size_t>(level));
    }

    /// @returns The log level named `name` (as printed by `name_of`, or "warn"/"err"), if any.
    [[nodiscard]] auto log_level_from_name(std::string_view name) -> std::optional<log_level>;

    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /// spdlog pattern of the formatted records.
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
    };

    /// Component a `LogRecord` is originating from, printed as the logger name.
    enum class log_source
    {
        libpyembed,
        libcurl,

        tests,  // only used for testing
    };

    inline constexpr auto name_of(log_source source) -> const char*
    {
        constexpr std::array names{ "pyembed", "libcurl", "tests" };
        return names.at(static_cast<std::size_t>(source));
    }

    /// @returns All `log_source` values used by the library, the default one first.
    inline auto all_log_sources() -> std::vector<log_source>
    {
        return { log_source::libpyembed, log_source::libcurl };
    }

    namespace logging
    {
        struct LogRecord
        {
            std::string message;
            log_level level = log_level::off;
            log_source source = log_source::libpyembed;
            std::source_location location = {};
        };

        enum class stop_reason
        {
            manual_stop,  ///< Requested by the program, e.g. when replacing the handler.
            program_exit  ///< Static destruction, the backend may already be gone.
        };

        // clang-format off
        /** Requirements for a log handling implementation.

            Records reach the handler unfiltered, it must drop the ones below its level.
         */
        template <typename T>
        concept LogHandler = requires(
                                T& handler,
                                LoggingParams params,
                                std::vector<log_source> sources,
                                LogRecord log_record
                            )
        {
            handler.start_log_handling(params, sources);
            handler.stop_log_handling(stop_reason::manual_stop);
            handler.set_log_level(params.logging_level);
            handler.log(log_record);
        };
        // clang-format on

        template <typename T>
        concept LogHandlerPtr = std::is_pointer_v<T> and LogHandler<std::remove_pointer_t<T>>;

        template <typename T>
        concept LogHandlerOrPtr = (LogHandler<T> and std::movable<T>) or LogHandlerPtr<T>;

        /** Owns a log handler, or refers to one which must outlive it.
         */
        class AnyLogHandler
        {
        public:

            AnyLogHandler() noexcept = default;
            ~AnyLogHandler();

            AnyLogHandler(AnyLogHandler&&) noexcept = default;
            AnyLogHandler& operator=(AnyLogHandler&&) noexcept = default;

            template <class T>
                requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
                        and LogHandlerOrPtr<std::remove_cvref_t<T>>
            AnyLogHandler(T&& handler);

            void start_log_handling(LoggingParams params, std::vector<log_source> sources);
            void stop_log_handling(stop_reason reason = stop_reason::manual_stop);
            void set_log_level(log_level new_level);
            void log(LogRecord record);

            explicit operator bool() const noexcept
            {
                return m_storage != nullptr;
            }

        private:

            struct Interface
            {
                virtual ~Interface() = default;
                virtual void start_log_handling(LoggingParams params, std::vector<log_source> sources) = 0;
                virtual void stop_log_handling(stop_reason reason) = 0;
                virtual void set_log_level(log_level new_level) = 0;
                virtual void log(LogRecord record) = 0;
            };

            template <LogHandlerOrPtr T>
            struct Wrapper;

            std::unique_ptr<Interface> m_storage;
        };

        /** Stops and unregisters the current log handler, if any.
            @returns The log handler that was registered.
         */
        auto stop_logging(stop_reason reason = stop_reason::manual_stop) -> AnyLogHandler;

        /** Registers a new log handler, stopping the previous one and starting the new one.
            Logging is a no-op while no handler is registered. Not thread-safe.
            @returns The previously registered log handler.
         */
        auto
        set_log_handler(AnyLogHandler handler, std::optional<LoggingParams> maybe_new_params = {})
            -> AnyLogHandler;

        /// @returns The previous log level.
        auto set_log_level(log_level new_level) -> log_level;
        auto get_log_level() -> log_level;
        auto get_logging_params() -> LoggingParams;

        void log(LogRecord record);

        class MessageLogger
        {
        public:

            MessageLogger(
                log_level level,
                std::source_location location = std::source_location::current()
            );
            ~MessageLogger();

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;
            std::source_location m_location;
        };

        /*******************************
         * Implementation of templates *
         *******************************/

        template <LogHandlerOrPtr T>
        struct AnyLogHandler::Wrapper final : Interface
        {
            T object;

            explicit Wrapper(T new_object)
                : object(std::move(new_object))
            {
            }

            auto handler() -> std::remove_pointer_t<T>&
            {
                if constexpr (std::is_pointer_v<T>)
                {
                    return *object;
                }
                else
                {
                    return object;
                }
            }

            void start_log_handling(LoggingParams params, std::vector<log_source> sources) override
            {
                handler().start_log_handling(std::move(params), std::move(sources));
            }

            void stop_log_handling(stop_reason reason) override
            {
                handler().stop_log_handling(reason);
            }

            void set_log_level(log_level new_level) override
            {
                handler().set_log_level(new_level);
            }

            void log(LogRecord record) override
            {
                handler().log(std::move(record));
            }
        };

        template <class T>
            requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
                    and LogHandlerOrPtr<std::remove_cvref_t<T>>
        AnyLogHandler::AnyLogHandler(T&& handler)
            : m_storage(std::make_unique<Wrapper<std::remove_cvref_t<T>>>(std::forward<T>(handler)))
        {
        }
    }
}

#endif
