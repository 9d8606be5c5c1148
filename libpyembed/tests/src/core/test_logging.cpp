// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include "pyembed/core/logging.hpp"
#include "pyembed/core/logging_spdlog.hpp"
#include "pyembed/core/util_scope.hpp"

namespace pyembed::logging
{
    namespace
    {
        struct LogHandler_Capture
        {
            struct Impl
            {
                std::mutex mutex;
                std::vector<LogRecord> records;
                log_level level = log_level::warn;
                std::size_t start_count = 0;
                std::size_t stop_count = 0;
            };

            std::unique_ptr<Impl> pimpl = std::make_unique<Impl>();

            auto start_log_handling(LoggingParams params, const std::vector<log_source>&) -> void
            {
                std::scoped_lock lock{ pimpl->mutex };
                ++pimpl->start_count;
                pimpl->level = params.logging_level;
            }

            auto stop_log_handling(stop_reason) -> void
            {
                std::scoped_lock lock{ pimpl->mutex };
                ++pimpl->stop_count;
            }

            auto set_log_level(log_level new_level) -> void
            {
                std::scoped_lock lock{ pimpl->mutex };
                pimpl->level = new_level;
            }

            auto log(LogRecord record) -> void
            {
                std::scoped_lock lock{ pimpl->mutex };
                if (record.level >= pimpl->level)
                {
                    pimpl->records.push_back(std::move(record));
                }
            }

            auto records() const -> std::vector<LogRecord>
            {
                std::scoped_lock lock{ pimpl->mutex };
                return pimpl->records;
            }
        };

        static_assert(LogHandler<LogHandler_Capture>);

        struct NotALogHandler
        {
        };

        static_assert(not LogHandler<NotALogHandler>);

        TEST_CASE("log_level names", "[pyembed::logging]")
        {
            REQUIRE(log_level_from_name("trace") == log_level::trace);
            REQUIRE(log_level_from_name("debug") == log_level::debug);
            REQUIRE(log_level_from_name("info") == log_level::info);
            REQUIRE(log_level_from_name("warn") == log_level::warn);
            REQUIRE(log_level_from_name("err") == log_level::err);
            REQUIRE(log_level_from_name("critical") == log_level::critical);
            REQUIRE(log_level_from_name("off") == log_level::off);
            REQUIRE_FALSE(log_level_from_name("loud").has_value());

            for (auto level : { log_level::trace, log_level::debug, log_level::info, log_level::warn,
                                log_level::err, log_level::critical, log_level::off })
            {
                REQUIRE(log_level_from_name(name_of(level)) == level);
            }
        }

        TEST_CASE("Logging through a registered handler", "[pyembed::logging]")
        {
            LogHandler_Capture capture;
            const auto previous_params = get_logging_params();
            auto previous = set_log_handler(&capture, LoggingParams{ .logging_level = log_level::info });
            on_scope_exit restore{ [&] { set_log_handler(std::move(previous), previous_params); } };

            REQUIRE(capture.pimpl->start_count == 1);
            REQUIRE(get_log_level() == log_level::info);

            SECTION("Records are filtered by level")
            {
                LOG_DEBUG << "not shown";
                LOG_INFO << "shown";
                LOG_ERROR << "also shown";

                const auto records = capture.records();
                REQUIRE(records.size() == 2);
                REQUIRE(records[0].message == "shown");
                REQUIRE(records[0].level == log_level::info);
                REQUIRE(records[0].source == log_source::libpyembed);
                REQUIRE(records[1].level == log_level::err);
            }

            SECTION("Continuation lines are indented")
            {
                LOG_WARNING << "first\nsecond";
                const auto records = capture.records();
                REQUIRE(records.size() == 1);
                REQUIRE(records[0].message == "first\n    second");
            }

            SECTION("Changing the level")
            {
                REQUIRE(set_log_level(log_level::err) == log_level::info);
                LOG_WARNING << "filtered";
                REQUIRE(capture.records().empty());
            }
        }

        TEST_CASE("Owned log handler", "[pyembed::logging]")
        {
            const auto previous_params = get_logging_params();
            auto previous = stop_logging();
            on_scope_exit restore{ [&] { set_log_handler(std::move(previous), previous_params); } };

            // Without handler, records go nowhere.
            LOG_ERROR << "dropped";

            LogHandler_Capture capture;
            auto* const impl = capture.pimpl.get();
            set_log_handler(std::move(capture), LoggingParams{ .logging_level = log_level::warn });
            REQUIRE(impl->start_count == 1);

            LOG_ERROR << "kept";
            REQUIRE(impl->records.size() == 1);
            REQUIRE(impl->records[0].message == "kept");

            auto owned = stop_logging();
            REQUIRE(owned);
            REQUIRE(impl->stop_count == 1);

            LOG_ERROR << "dropped again";
            REQUIRE(impl->records.size() == 1);
        }

        TEST_CASE("LogHandler_spdlog", "[pyembed::logging]")
        {
            // The global handler would lose its loggers when this one starts.
            auto previous = stop_logging();
            on_scope_exit restore{ [&]
                                   {
                                       if (previous)
                                       {
                                           set_log_handler(std::move(previous));
                                       }
                                   } };

            std::ostringstream output;
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
            spdlogimpl::LogHandler_spdlog handler{ sink };
            on_scope_exit stop{ [&] { handler.stop_log_handling(stop_reason::manual_stop); } };

            REQUIRE_FALSE(handler.is_started());
            handler.start_log_handling({}, all_log_sources());
            REQUIRE(handler.is_started());

            handler.log({ .message = "something went wrong", .level = log_level::warn });
            handler.log({ .message = "hidden details", .level = log_level::debug });
            handler.log({ .message = "from curl", .level = log_level::err, .source = log_source::libcurl });

            const auto text = output.str();
            REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("something went wrong"));
            REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("pyembed"));
            REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("from curl"));
            REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("libcurl"));
            REQUIRE_THAT(text, !Catch::Matchers::ContainsSubstring("hidden details"));

            handler.set_log_level(log_level::trace);
            handler.log({ .message = "now visible", .level = log_level::debug });
            REQUIRE_THAT(output.str(), Catch::Matchers::ContainsSubstring("now visible"));
        }
    }
}
