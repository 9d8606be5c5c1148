// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_FS_FILESYSTEM_HPP
#define PYEMBED_FS_FILESYSTEM_HPP

#include <filesystem>
#include <string>

namespace pyembed
{
    namespace fs = std::filesystem;
}

namespace pyembed::util
{
    /**
     * Return the path as an UTF-8 encoded string, whatever the native encoding is.
     */
    [[nodiscard]] inline auto path_to_utf8(const fs::path& path) -> std::string
    {
        const auto u8 = path.u8string();
        return { u8.cbegin(), u8.cend() };
    }
}
#endif
