// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_API_CREATE_HPP
#define PYEMBED_API_CREATE_HPP

#include <string>

#include "pyembed/api/install.hpp"
#include "pyembed/core/error_handling.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/python_version.hpp"

namespace pyembed
{
    class Context;

    struct CreateResult
    {
        specs::PythonVersion version;
        std::string archive_url;
        /** Package manager of the distribution. */
        fs::path installer;
        /** Command that installed the requirements. */
        command_args command;
    };

    /**
     * Build a portable Python runtime in ``prefix`` and install ``requirements`` in it.
     *
     * The steps run in order and the first failure is returned:
     * version resolution, download of the embeddable distribution, extraction in ``prefix``,
     * preparation of the runtime (site import, host libs, pip), installation.
     * An existing ``prefix`` is populated in place.
     */
    auto create_embedded_environment(
        const Context& ctx,
        const fs::path& prefix,
        const fs::path& requirements
    ) -> expected_t<CreateResult>;
}

#endif
