// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pyembed/download/request.hpp"

namespace pyembed::download
{
    Request::Request(std::string_view lname, std::string_view lurl, fs::path lfilename)
        : name(lname)
        , url(lurl)
        , filename(std::move(lfilename))
    {
    }
}
