// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_DOWNLOAD_REQUEST_HPP
#define PYEMBED_DOWNLOAD_REQUEST_HPP

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "pyembed/fs/filesystem.hpp"

namespace pyembed::download
{
    /*******************************
     * Download results structures *
     *******************************/

    struct TransferData
    {
        int http_status = 0;
        std::string effective_url = "";
        std::size_t downloaded_size = 0;
        std::size_t average_speed_Bps = 0;
    };

    struct Success
    {
        fs::path filename = {};
        TransferData transfer = {};
    };

    struct Error
    {
        std::string message = "";
        std::optional<TransferData> transfer = std::nullopt;
    };

    using Result = tl::expected<Success, Error>;

    /******************************
     * Download request structure *
     ******************************/

    struct Request
    {
        /// Human readable name of what is downloaded, used in logs.
        std::string name;
        std::string url;
        /// Created or truncated, removed if the transfer fails.
        fs::path filename;

        Request(std::string_view lname, std::string_view lurl, fs::path lfilename);
    };
}

#endif
