// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBPYEMBED_VERSION_HPP
#define LIBPYEMBED_VERSION_HPP

#include <array>
#include <string>

#define LIBPYEMBED_VERSION_MAJOR 0
#define LIBPYEMBED_VERSION_MINOR 1
#define LIBPYEMBED_VERSION_PATCH 0

#define LIBPYEMBED_VERSION_STRING "0.1.0"
#define LIBPYEMBED_VERSION                                                                         \
    (LIBPYEMBED_VERSION_MAJOR * 10000 + LIBPYEMBED_VERSION_MINOR * 100 + LIBPYEMBED_VERSION_PATCH)

namespace pyembed
{
    std::string version();

    std::array<int, 3> version_arr();
}

#endif
