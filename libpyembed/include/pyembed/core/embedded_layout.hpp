// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_EMBEDDED_LAYOUT_HPP
#define PYEMBED_CORE_EMBEDDED_LAYOUT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "pyembed/core/error_handling.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/python_version.hpp"

namespace pyembed
{
    /** Interpreter of an extracted embeddable distribution. */
    [[nodiscard]] auto python_executable(const fs::path& prefix) -> fs::path;

    /** Directories added in front of ``PATH`` for processes run from the distribution. */
    [[nodiscard]] auto prefix_path_dirs(const fs::path& prefix) -> std::vector<fs::path>;

    /**
     * Value of ``PATH`` for processes run from the distribution.
     *
     * The prefix and its ``Scripts`` directory come first, followed by ``current_path``
     * if not empty.
     */
    [[nodiscard]] auto prefix_path_env(const fs::path& prefix, std::string_view current_path)
        -> std::string;

    /**
     * Uncomment ``import site`` in the ``._pth`` file of the distribution.
     *
     * Without it, the embedded interpreter ignores ``Lib/site-packages``.
     * A distribution without ``._pth`` file is left untouched with a warning.
     */
    auto enable_site_import(const fs::path& prefix, const specs::PythonVersion& version)
        -> expected_t<void>;

    /**
     * Find the ``libs`` directory of a host installation ``PythonXY`` listed in ``PATH``.
     */
    [[nodiscard]] auto find_host_libs_dir(const specs::PythonVersion& version)
        -> expected_t<fs::path>;

    /**
     * Same as @ref find_host_libs_dir with an explicit list of directories.
     */
    [[nodiscard]] auto
    find_host_libs_dir(const specs::PythonVersion& version, const std::vector<fs::path>& search_paths)
        -> expected_t<fs::path>;

    /**
     * Copy ``libs_dir`` to ``<prefix>/libs``, files already present are kept.
     */
    auto copy_host_libs(const fs::path& libs_dir, const fs::path& prefix) -> expected_t<void>;
}

#endif
