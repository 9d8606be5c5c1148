// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CLI_PYEMBED_HPP
#define PYEMBED_CLI_PYEMBED_HPP

#include <CLI/CLI.hpp>

#include "pyembed/core/context.hpp"

#include "common_options.hpp"

void
set_pyembed_command(CLI::App* com, CliOptions& options);

/**
 * Build the runtime described by the parsed command line.
 *
 * Returns the exit code of the program, failures are reported to the user.
 */
int
run_pyembed(pyembed::Context& ctx, const CLI::App& app, const CliOptions& options);

#endif
