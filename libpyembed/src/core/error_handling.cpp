// Copyright (c) 2022, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pyembed/core/error_handling.hpp"

namespace pyembed
{
    auto step_name(pyembed_error_code ec) noexcept -> std::string_view
    {
        switch (ec)
        {
            case pyembed_error_code::incorrect_usage:
                return "Configuration";
            case pyembed_error_code::interpreter_not_found:
            case pyembed_error_code::unparseable_version:
                return "Version probe";
            case pyembed_error_code::download_failed:
                return "Download";
            case pyembed_error_code::extraction_failed:
                return "Extraction";
            case pyembed_error_code::copy_libs_failed:
                return "Host libs copy";
            case pyembed_error_code::install_failed:
                return "Install";
            case pyembed_error_code::internal_failure:
            case pyembed_error_code::unknown:
            default:
                return "pyembed";
        }
    }

    pyembed_error::pyembed_error(const std::string& msg, pyembed_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    pyembed_error::pyembed_error(const char* msg, pyembed_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    pyembed_error_code pyembed_error::error_code() const noexcept
    {
        return m_error_code;
    }

    tl::unexpected<pyembed_error> make_unexpected(const char* msg, pyembed_error_code ec)
    {
        return tl::make_unexpected(pyembed_error(msg, ec));
    }

    tl::unexpected<pyembed_error> make_unexpected(const std::string& msg, pyembed_error_code ec)
    {
        return tl::make_unexpected(pyembed_error(msg, ec));
    }
}
