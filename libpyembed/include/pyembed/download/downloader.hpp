// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_DOWNLOAD_DOWNLOADER_HPP
#define PYEMBED_DOWNLOAD_DOWNLOADER_HPP

#include <string>

#include <tl/expected.hpp>

#include "pyembed/download/parameters.hpp"
#include "pyembed/download/request.hpp"

namespace pyembed::download
{
    /**
     * Performs a single blocking transfer of ``request.url`` into ``request.filename``.
     *
     * Redirections are followed. A transport error or an HTTP status rejected by
     * ``is_http_status_ok`` is an error, in which case the partially written file is removed.
     * There is no retry.
     */
    Result download(const Request& request, const RemoteFetchParams& params, Options options = {});

    /**
     * Whether a finished transfer with this status produced the requested file.
     *
     * Only 2xx codes are successful. ``file://`` transfers report a status of 0.
     */
    bool is_http_status_ok(int http_status);

    /// @returns The value sent as ``User-Agent`` header.
    std::string user_agent(const RemoteFetchParams& params);
}

#endif
