// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_PACKAGE_HANDLING_HPP
#define PYEMBED_CORE_PACKAGE_HANDLING_HPP

#include "pyembed/core/error_handling.hpp"
#include "pyembed/fs/filesystem.hpp"

namespace pyembed
{
    /**
     * Extract a zip or tar archive into ``destination``.
     *
     * The destination and its parents are created if needed, existing files at the same
     * paths are overwritten and other files are left untouched.
     * Entries escaping the destination (``..``, absolute paths, symlinks) are refused.
     *
     * Errors are reported with ``pyembed_error_code::extraction_failed``, in which case the
     * destination may be partially populated.
     */
    auto extract_archive(const fs::path& file, const fs::path& destination) -> expected_t<void>;
}

#endif
