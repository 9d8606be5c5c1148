// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pyembed/version.hpp"

namespace pyembed
{
    std::string version()
    {
        return LIBPYEMBED_VERSION_STRING;
    }

    std::array<int, 3> version_arr()
    {
        return { LIBPYEMBED_VERSION_MAJOR, LIBPYEMBED_VERSION_MINOR, LIBPYEMBED_VERSION_PATCH };
    }
}
