// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_UTIL_OS_HPP
#define PYEMBED_CORE_UTIL_OS_HPP

#include <iosfwd>

namespace pyembed
{
    bool is_atty(const std::ostream& stream);
}

#endif
