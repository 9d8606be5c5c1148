// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_UTIL_HPP
#define PYEMBED_CORE_UTIL_HPP

#include <fstream>
#include <ios>
#include <string>
#include <string_view>

#include "pyembed/fs/filesystem.hpp"

namespace pyembed
{
    std::string
    read_contents(const fs::path& path, std::ios::openmode mode = std::ios::in | std::ios::binary);

    std::ofstream
    open_ofstream(const fs::path& path, std::ios::openmode mode = std::ios::out | std::ios::binary);

    /**
     * Replaces the password of `user:password@` credentials found in `str` by stars.
     */
    std::string hide_secrets(std::string_view str);

    // Returns true if the temporary directories will persist after destruction.
    bool must_persist_temporary_directories();

    // Sets if the temporary directories will persist after destruction.
    // Returns the previous value.
    bool set_persist_temporary_directories(bool will_persist);

    class non_copyable_base
    {
    public:

        non_copyable_base() = default;
        non_copyable_base(const non_copyable_base&) = delete;
        non_copyable_base& operator=(const non_copyable_base&) = delete;
    };

    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        const fs::path& path() const;

    private:

        fs::path m_path;
    };
}

#endif
