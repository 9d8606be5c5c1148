// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_PYTHON_PROBE_HPP
#define PYEMBED_CORE_PYTHON_PROBE_HPP

#include <string_view>

#include "pyembed/core/error_handling.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/python_version.hpp"

namespace pyembed
{
    class Context;

    /**
     * Find the interpreter executable from its name.
     *
     * A name with a directory component is taken as a path and only checked for existence,
     * otherwise the executable search path is used.
     */
    [[nodiscard]] auto resolve_interpreter(std::string_view name) -> expected_t<fs::path>;

    /**
     * Run ``<interpreter> --version`` and find the version triple in its output.
     *
     * Both output streams are searched since old interpreters print their version on stderr.
     */
    [[nodiscard]] auto query_python_version(const fs::path& interpreter)
        -> expected_t<specs::PythonVersion>;

    /**
     * The version of the distribution to build.
     *
     * The version set in the context is used as is, otherwise the configured interpreter
     * is queried.
     */
    [[nodiscard]] auto resolve_python_version(const Context& ctx)
        -> expected_t<specs::PythonVersion>;
}

#endif
