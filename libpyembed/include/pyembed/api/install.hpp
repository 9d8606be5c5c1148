// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_API_INSTALL_HPP
#define PYEMBED_API_INSTALL_HPP

#include <string>
#include <string_view>
#include <vector>

#include "pyembed/core/error_handling.hpp"
#include "pyembed/fs/filesystem.hpp"

namespace pyembed
{
    class Context;
    struct InstallParams;

    using command_args = std::vector<std::string>;

    /**
     * The package manager command installing a requirements file in the distribution.
     *
     * ``<prefix>/<installer_path> install -r <requirements> [pip_args...]``
     * Fails with ``install_failed`` if the installer is not in the distribution.
     */
    [[nodiscard]] auto get_pip_install_command(
        const InstallParams& params,
        const fs::path& prefix,
        const fs::path& requirements
    ) -> expected_t<command_args>;

    /**
     * Install pip in the distribution with ``get-pip.py`` unless the installer is already there.
     *
     * The script is downloaded in ``download_dir``.
     */
    auto bootstrap_pip(const Context& ctx, const fs::path& prefix, const fs::path& download_dir)
        -> expected_t<void>;

    /**
     * Install the requirements file in the distribution.
     *
     * The output of the installer is forwarded to the terminal. The requirements file
     * is not checked, the installer reports on its absence.
     * Returns the command that was run.
     */
    auto install_requirements(const Context& ctx, const fs::path& prefix, const fs::path& requirements)
        -> expected_t<command_args>;

    namespace detail
    {
        /**
         * Run a command of the distribution, with its directories in front of ``PATH``.
         *
         * Any failure to run, or exit status different from zero, is an ``install_failed``
         * error mentioning ``what``.
         */
        auto run_in_prefix(const fs::path& prefix, const command_args& command, std::string_view what)
            -> expected_t<void>;
    }
}

#endif
