// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <map>

#include <fmt/format.h>

#include "pyembed/specs/embed_archive.hpp"
#include "pyembed/specs/python_version.hpp"

#include "common_options.hpp"


using namespace pyembed;  // NOLINT(build/namespaces)

void
init_rc_options(CLI::App* subcom, CliOptions& options)
{
    std::string cli_group = "Configuration options";

    subcom
        ->add_option(
            "--rc-file",
            options.rc_files,
            "Paths to the configuration files to use, after the default ones"
        )
        ->option_text("FILE1 FILE2...")
        ->group(cli_group);

    subcom->add_flag("--no-rc", options.no_rc, "Disable the use of configuration files")
        ->group(cli_group);

    subcom->add_flag("--no-env", options.no_env, "Disable the use of environment variables")
        ->group(cli_group);
}

void
init_general_options(CLI::App* subcom, CliOptions& options)
{
    init_rc_options(subcom, options);

    std::string cli_group = "Global options";

    subcom
        ->add_flag(
            "-v,--verbose",
            options.verbose,
            "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
        )
        ->multi_option_policy(CLI::MultiOptionPolicy::Sum)
        ->group(cli_group);

    std::map<std::string, log_level> le_map = { { "critical", log_level::critical },
                                                { "error", log_level::err },
                                                { "warning", log_level::warn },
                                                { "info", log_level::info },
                                                { "debug", log_level::debug },
                                                { "trace", log_level::trace },
                                                { "off", log_level::off } };
    subcom
        ->add_option("--log-level", options.log_level, "Log level, overrides the verbosity")
        ->group(cli_group)
        ->transform(CLI::CheckedTransformer(le_map, CLI::ignore_case));

    subcom->add_flag("-q,--quiet", options.quiet, "Do not print the progress of the steps")
        ->group(cli_group);
}

void
init_distribution_options(CLI::App* subcom, CliOptions& options)
{
    std::string cli_group = "Distribution options";

    subcom
        ->add_option(
            "--python-version",
            options.python_version,
            "Version of the distribution, the interpreter is not queried when set"
        )
        ->option_text("X.Y.Z")
        ->group(cli_group);

    subcom
        ->add_option("--python", options.python, "Interpreter queried for the version (default: python)")
        ->option_text("EXE")
        ->group(cli_group);

    subcom->add_option("--arch", options.arch, "Architecture of the distribution (default: amd64)")
        ->check(CLI::IsMember({ "amd64", "win32", "arm64" }, CLI::ignore_case))
        ->group(cli_group);

    subcom
        ->add_option(
            "--base-url",
            options.base_url,
            fmt::format("Host of the distributions (default: {})", specs::default_embed_base_url)
        )
        ->option_text("URL")
        ->group(cli_group);
}

void
init_install_options(CLI::App* subcom, CliOptions& options)
{
    std::string cli_group = "Install options";

    subcom->add_option("--get-pip-url", options.get_pip_url, "Location of get-pip.py")
        ->option_text("URL")
        ->group(cli_group);

    subcom->add_flag("--no-site", options.no_site, "Do not enable 'import site' in the distribution")
        ->group(cli_group);

    subcom
        ->add_flag(
            "--no-bootstrap-pip",
            options.no_bootstrap_pip,
            "Do not install pip with get-pip.py when missing"
        )
        ->group(cli_group);

    subcom
        ->add_flag(
            "--copy-host-libs",
            options.copy_host_libs,
            "Copy the libs directory of the matching PythonXY installation in PATH"
        )
        ->group(cli_group);
}

void
init_network_options(CLI::App* subcom, CliOptions& options)
{
    std::string cli_group = "Network options";

    subcom
        ->add_option(
            "--ssl-verify",
            options.ssl_verify,
            "Verify SSL certificates for HTTPS requests, '<false>' to disable, or a CA bundle path"
        )
        ->group(cli_group);

    subcom->add_option("--proxy", options.proxy, "Proxy used for all transfers")
        ->option_text("URL")
        ->group(cli_group);
}

auto
cli_configuration_values(const CLI::App& app, const CliOptions& options)
    -> expected_t<ConfigurationValues>
{
    ConfigurationValues values;

    if (app.count("--python-version") > 0)
    {
        auto version = specs::PythonVersion::parse(options.python_version);
        if (!version)
        {
            return make_unexpected(version.error().what(), pyembed_error_code::incorrect_usage);
        }
        values.python_version = version.value();
    }
    if (app.count("--python") > 0)
    {
        values.python = options.python;
    }
    if (app.count("--arch") > 0)
    {
        auto arch = specs::parse_embed_arch(options.arch);
        if (!arch)
        {
            return make_unexpected(arch.error().what(), pyembed_error_code::incorrect_usage);
        }
        values.arch = arch.value();
    }
    if (app.count("--base-url") > 0)
    {
        values.base_url = options.base_url;
    }
    if (app.count("--get-pip-url") > 0)
    {
        values.get_pip_url = options.get_pip_url;
    }
    if (options.no_site)
    {
        values.enable_site = false;
    }
    if (options.no_bootstrap_pip)
    {
        values.bootstrap_pip = false;
    }
    if (options.copy_host_libs)
    {
        values.copy_host_libs = true;
    }
    if (app.count("--ssl-verify") > 0)
    {
        values.ssl_verify = options.ssl_verify;
    }
    if (app.count("--proxy") > 0)
    {
        values.proxy = options.proxy;
    }
    if (app.count("--log-level") > 0)
    {
        values.logging_level = options.log_level;
    }
    return values;
}

auto
load_cli_configuration(Context& ctx, const CLI::App& app, const CliOptions& options)
    -> expected_t<void>
{
    ctx.src_params.no_rc = options.no_rc;
    ctx.src_params.no_env = options.no_env;
    ctx.src_params.rc_files = options.rc_files;
    ctx.output_params.quiet = options.quiet;

    auto cli_values = cli_configuration_values(app, options);
    if (!cli_values)
    {
        return forward_error(cli_values);
    }

    if (auto res = load_configuration(ctx, cli_values.value()); !res)
    {
        return res;
    }

    // An explicit log level wins over the verbosity flags
    if (options.verbose > 0 && !cli_values->logging_level.has_value())
    {
        ctx.set_verbosity(options.verbose);
    }
    return {};
}
