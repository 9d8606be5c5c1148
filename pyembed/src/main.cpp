// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "pyembed/core/context.hpp"
#include "pyembed/core/output.hpp"
#include "pyembed/version.hpp"

#include "common_options.hpp"
#include "pyembed.hpp"


using namespace pyembed;  // NOLINT(build/namespaces)

int
main(int argc, char** argv)
{
    pyembed::Context ctx{ {
        /* .enable_logging = */ true,
    } };
    pyembed::Console console{ ctx };

    CLI::App app{ "Build a portable Python runtime from the Windows embeddable distribution.\n"
                  "Version: "
                  + version() + "\n" };
    CliOptions options;
    set_pyembed_command(&app, options);

    CLI11_PARSE(app, argc, argv);

    std::optional<std::string> error_to_report;
    int exit_code = 0;
    try
    {
        exit_code = run_pyembed(ctx, app, options);
    }
    catch (const std::exception& e)
    {
        error_to_report = e.what();
    }

    if (error_to_report)
    {
        LOG_CRITICAL << "pyembed failed: " << error_to_report.value();
        return 1;
    }

    return exit_code;
}
