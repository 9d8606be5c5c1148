// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CLI_COMMON_OPTIONS_HPP
#define PYEMBED_CLI_COMMON_OPTIONS_HPP

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "pyembed/api/configuration.hpp"
#include "pyembed/core/context.hpp"

/**
 * Raw values of the command line, before validation.
 */
struct CliOptions
{
    pyembed::fs::path prefix;
    pyembed::fs::path requirements;

    std::string python_version;
    std::string python;
    std::string arch;
    std::string base_url;
    std::string get_pip_url;
    bool no_site = false;
    bool no_bootstrap_pip = false;
    bool copy_host_libs = false;

    std::string ssl_verify;
    std::string proxy;

    std::vector<pyembed::fs::path> rc_files;
    bool no_rc = false;
    bool no_env = false;

    int verbose = 0;
    pyembed::log_level log_level = pyembed::log_level::warn;
    bool quiet = false;
};

void
init_rc_options(CLI::App* subcom, CliOptions& options);

void
init_general_options(CLI::App* subcom, CliOptions& options);

void
init_distribution_options(CLI::App* subcom, CliOptions& options);

void
init_install_options(CLI::App* subcom, CliOptions& options);

void
init_network_options(CLI::App* subcom, CliOptions& options);

/**
 * Configuration values given on the command line, only options that were used are set.
 */
auto
cli_configuration_values(const CLI::App& app, const CliOptions& options)
    -> pyembed::expected_t<pyembed::ConfigurationValues>;

/**
 * Set the context from the configuration sources and the command line.
 */
auto
load_cli_configuration(pyembed::Context& ctx, const CLI::App& app, const CliOptions& options)
    -> pyembed::expected_t<void>;

#endif
