// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <map>

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <reproc++/run.hpp>
#include <reproc/reproc.h>

#include "pyembed/api/install.hpp"
#include "pyembed/core/context.hpp"
#include "pyembed/core/embedded_layout.hpp"
#include "pyembed/core/logging.hpp"
#include "pyembed/core/output.hpp"
#include "pyembed/download/downloader.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/util/environment.hpp"

namespace pyembed
{
    namespace
    {
        bool reproc_killed(int status)
        {
            return status == REPROC_SIGKILL;
        }

        bool reproc_terminated(int status)
        {
            return status == REPROC_SIGTERM;
        }

        auto installer_location(const InstallParams& params, const fs::path& prefix) -> fs::path
        {
            return prefix / params.installer_path;
        }
    }

    auto get_pip_install_command(
        const InstallParams& params,
        const fs::path& prefix,
        const fs::path& requirements
    ) -> expected_t<command_args>
    {
        const auto installer = installer_location(params, prefix);
        std::error_code ec;
        if (!fs::is_regular_file(installer, ec))
        {
            return make_unexpected(
                fmt::format("Package manager not found at {}", util::path_to_utf8(installer)),
                pyembed_error_code::install_failed
            );
        }

        command_args cmd = { util::path_to_utf8(installer), "install", "-r", util::path_to_utf8(requirements) };
        cmd.insert(cmd.end(), params.pip_args.cbegin(), params.pip_args.cend());
        return cmd;
    }

    namespace detail
    {
        auto run_in_prefix(const fs::path& prefix, const command_args& command, std::string_view what)
            -> expected_t<void>
        {
            reproc::options options;
            options.redirect.parent = true;
            options.env.behavior = reproc::env::extend;
            std::map<std::string, std::string> envmap;
            envmap["PATH"] = prefix_path_env(prefix, util::get_env("PATH").value_or(""));
            options.env.extra = envmap;

            LOG_INFO << fmt::format("Calling: {}", fmt::join(command, " "));

            auto [status, ec] = reproc::run(command, options);
            if (ec)
            {
                return make_unexpected(
                    fmt::format("Could not run {}: {}", what, ec.message()),
                    pyembed_error_code::install_failed
                );
            }
            if (reproc_killed(status) || reproc_terminated(status))
            {
                return make_unexpected(
                    fmt::format("{} was {}", what, reproc_killed(status) ? "killed" : "terminated"),
                    pyembed_error_code::install_failed
                );
            }
            if (status != 0)
            {
                return make_unexpected(
                    fmt::format("{} exited with status {}", what, status),
                    pyembed_error_code::install_failed
                );
            }
            return {};
        }
    }

    auto bootstrap_pip(const Context& ctx, const fs::path& prefix, const fs::path& download_dir)
        -> expected_t<void>
    {
        const auto& params = ctx.install_params;
        std::error_code ec;
        if (fs::exists(installer_location(params, prefix), ec))
        {
            LOG_DEBUG << "Package manager already present, skipping pip bootstrap";
            return {};
        }

        const auto& url = ctx.distribution_params.get_pip_url;
        Console::stream() << fmt::format(
            ctx.graphics_params.palette.external,
            "Downloading {}",
            url
        );
        const auto script = download_dir / "get-pip.py";
        auto result = download::download(
            download::Request("get-pip.py", url, script),
            ctx.remote_fetch_params,
            ctx.download_options()
        );
        if (!result)
        {
            return make_unexpected(
                fmt::format("Could not download get-pip.py: {}", result.error().message),
                pyembed_error_code::install_failed
            );
        }

        Console::stream() << "Installing pip";
        const command_args cmd = { util::path_to_utf8(python_executable(prefix)), util::path_to_utf8(script) };
        return detail::run_in_prefix(prefix, cmd, "get-pip.py");
    }

    auto install_requirements(const Context& ctx, const fs::path& prefix, const fs::path& requirements)
        -> expected_t<command_args>
    {
        auto cmd = get_pip_install_command(ctx.install_params, prefix, requirements);
        if (!cmd)
        {
            return forward_error(cmd);
        }

        Console::stream() << fmt::format(
            ctx.graphics_params.palette.external,
            "Installing requirements from {}",
            util::path_to_utf8(requirements)
        );

        return detail::run_in_prefix(prefix, cmd.value(), "Package manager")
            .map([&]() { return std::move(cmd).value(); });
    }
}
