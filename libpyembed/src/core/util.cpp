// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef _WIN32
#include <stdlib.h>
#include <unistd.h>
#else
#include <io.h>
#endif

#include <atomic>
#include <cerrno>
#include <cstring>
#include <regex>
#include <stdexcept>
#include <system_error>

#include "pyembed/core/logging.hpp"
#include "pyembed/core/util.hpp"

namespace pyembed
{
    namespace
    {
        std::atomic<bool> persist_temporary_directories{ false };

        const std::regex& http_basicauth_regex()
        {
            static const std::regex http_basicauth_regex{ "(://|^)([^\\s:/@]+):([^\\s@]+)@" };
            return http_basicauth_regex;
        }
    }

    std::string read_contents(const fs::path& file_path, std::ios::openmode mode)
    {
        std::ifstream in(file_path, std::ios::in | mode);

        if (in)
        {
            std::string contents;
            in.seekg(0, std::ios::end);
            contents.resize(static_cast<std::size_t>(in.tellg()));
            in.seekg(0, std::ios::beg);
            in.read(contents.data(), static_cast<std::streamsize>(contents.size()));
            in.close();
            return contents;
        }
        else
        {
            throw std::system_error(
                errno,
                std::system_category(),
                "failed to open " + util::path_to_utf8(file_path)
            );
        }
    }

    std::ofstream open_ofstream(const fs::path& path, std::ios::openmode mode)
    {
        std::ofstream outfile(path, mode);

        if (!outfile.good())
        {
            LOG_ERROR << "Error opening for writing " << util::path_to_utf8(path) << ": " << std::strerror(errno);
        }

        return outfile;
    }

    std::string hide_secrets(std::string_view str)
    {
        return std::regex_replace(std::string(str), http_basicauth_regex(), "$1$2:*****@");
    }

    bool must_persist_temporary_directories()
    {
        return persist_temporary_directories;
    }

    bool set_persist_temporary_directories(bool will_persist)
    {
        return persist_temporary_directories.exchange(will_persist);
    }

    TemporaryDirectory::TemporaryDirectory()
    {
        bool success = false;
#ifndef _WIN32
        std::string template_path = (fs::temp_directory_path() / "pyembedXXXXXX").string();
        char* pth = mkdtemp(template_path.data());
        success = (pth != nullptr);
#else
        std::string template_path = (fs::temp_directory_path() / "pyembedXXXXXX").string();
        // include \0 terminator
        if (_mktemp_s(template_path.data(), template_path.size() + 1) == 0)
        {
            success = fs::create_directory(template_path);
        }
#endif
        if (!success)
        {
            throw std::runtime_error("Could not create temporary directory!");
        }
        else
        {
            m_path = template_path;
        }
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        if (!must_persist_temporary_directories())
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
            if (ec)
            {
                LOG_WARNING << "Could not remove temporary directory " << util::path_to_utf8(m_path) << ": "
                            << ec.message();
            }
        }
    }

    const fs::path& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
