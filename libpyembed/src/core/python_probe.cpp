// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <fmt/format.h>
#include <reproc++/run.hpp>

#include "pyembed/core/context.hpp"
#include "pyembed/core/logging.hpp"
#include "pyembed/core/python_probe.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/util/environment.hpp"
#include "pyembed/util/string.hpp"

namespace pyembed
{
    namespace
    {
        auto has_directory_part(std::string_view name) -> bool
        {
            return fs::path(name).has_parent_path();
        }
    }

    auto resolve_interpreter(std::string_view name) -> expected_t<fs::path>
    {
        if (name.empty())
        {
            return make_unexpected(
                "No Python interpreter name given",
                pyembed_error_code::interpreter_not_found
            );
        }

        if (has_directory_part(name))
        {
            auto path = fs::path(name);
            std::error_code ec;
            if (fs::is_regular_file(path, ec))
            {
                return path;
            }
            return make_unexpected(
                fmt::format("Python interpreter \"{}\" does not exist", name),
                pyembed_error_code::interpreter_not_found
            );
        }

        auto path = util::which(name);
        if (path.empty())
        {
            return make_unexpected(
                fmt::format("Could not find Python interpreter \"{}\" in PATH", name),
                pyembed_error_code::interpreter_not_found
            );
        }
        LOG_DEBUG << "Found Python interpreter " << util::path_to_utf8(path);
        return path;
    }

    auto query_python_version(const fs::path& interpreter) -> expected_t<specs::PythonVersion>
    {
        std::string out, err;
        std::vector<std::string> args = { util::path_to_utf8(interpreter), "--version" };
        LOG_INFO << "Calling: " << util::join(" ", args);

        auto [status, ec] = reproc::run(
            args,
            reproc::options{},
            reproc::sink::string(out),
            reproc::sink::string(err)
        );

        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not run Python interpreter {}: {}", util::path_to_utf8(interpreter), ec.message()),
                pyembed_error_code::interpreter_not_found
            );
        }

        LOG_DEBUG << "Interpreter exited with status " << status << ", stdout: \"" << out
                  << "\", stderr: \"" << err << '"';
        if (status != 0)
        {
            LOG_WARNING << "Python interpreter " << util::path_to_utf8(interpreter) << " exited with status " << status;
        }

        // Python 2 prints its version on stderr
        auto output = util::concat(out, "\n", err);
        auto version = specs::PythonVersion::find_in(util::strip(output));
        if (!version)
        {
            return make_unexpected(
                fmt::format("Could not read the version of {}: {}", util::path_to_utf8(interpreter), version.error().what()),
                pyembed_error_code::unparseable_version
            );
        }
        return version.value();
    }

    auto resolve_python_version(const Context& ctx) -> expected_t<specs::PythonVersion>
    {
        const auto& params = ctx.interpreter_params;
        if (params.python_version.has_value())
        {
            LOG_INFO << "Using Python version " << params.python_version->to_string()
                     << " from configuration";
            return params.python_version.value();
        }

        return resolve_interpreter(params.python_exe)
            .and_then([](const fs::path& interpreter) { return query_python_version(interpreter); });
    }
}
