// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>

#include <fmt/format.h>

#include "pyembed/api/create.hpp"
#include "pyembed/core/output.hpp"
#include "pyembed/version.hpp"

#include "common_options.hpp"
#include "pyembed.hpp"

using namespace pyembed;  // NOLINT(build/namespaces)

namespace
{
    void report_failure(const Context& ctx, const pyembed_error& error)
    {
        const auto message = fmt::format("{} failed: {}", step_name(error.error_code()), error.what());
        LOG_CRITICAL << message;
        if (Console::is_available())
        {
            Console::instance().print_styled(message, ctx.graphics_params.palette.failure, true);
        }
    }
}

void
set_pyembed_command(CLI::App* com, CliOptions& options)
{
    init_general_options(com, options);
    init_distribution_options(com, options);
    init_install_options(com, options);
    init_network_options(com, options);

    com->add_option("prefix", options.prefix, "Destination directory, created if absent")
        ->required()
        ->option_text("PATH");

    com->add_option("-r,--requirements", options.requirements, "Requirements file to install")
        ->required()
        ->option_text("PATH");

    auto print_version = [](int /*count*/)
    {
        std::cout << version() << std::endl;
        throw CLI::Success();
    };

    com->add_flag_function("--version", print_version, "Print the version and exit");
}

int
run_pyembed(Context& ctx, const CLI::App& app, const CliOptions& options)
{
    if (auto res = load_cli_configuration(ctx, app, options); !res)
    {
        report_failure(ctx, res.error());
        return 1;
    }

    auto result = create_embedded_environment(ctx, options.prefix, options.requirements);
    if (!result)
    {
        report_failure(ctx, result.error());
        return 1;
    }

    LOG_INFO << fmt::format(
        "Python {} from {} installed in {}",
        result->version,
        result->archive_url,
        util::path_to_utf8(options.prefix)
    );
    return 0;
}
