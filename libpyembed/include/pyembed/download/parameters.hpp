// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_DOWNLOAD_PARAMETERS_HPP
#define PYEMBED_DOWNLOAD_PARAMETERS_HPP

#include <string>

namespace pyembed::download
{
    struct RemoteFetchParams
    {
        // ssl_verify can be either an empty string (regular SSL verification),
        // the string "<false>" to indicate no SSL verification, or a path to
        // a directory with cert files, or a cert file.
        std::string ssl_verify = "";
        bool ssl_no_revoke = false;

        std::string user_agent = "";

        double connect_timeout_secs = 10.;

        // Empty means libcurl's default (environment variables such as `https_proxy`).
        std::string proxy = "";
    };

    struct Options
    {
        /// Forward libcurl's verbose transfer information to the `libcurl` logger.
        bool verbose = false;
    };
}
#endif
