// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBPYEMBEDTESTS_HPP
#define LIBPYEMBEDTESTS_HPP

#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <atomic>
#include <mutex>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include <archive.h>
#include <archive_entry.h>

#include "pyembed/core/context.hpp"
#include "pyembed/core/output.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/embed_archive.hpp"
#include "pyembed/specs/python_version.hpp"
#include "pyembed/util/build.hpp"
#include "pyembed/util/environment.hpp"
#include "pyembed/util/string.hpp"

namespace pyembedtests
{
    struct Singletons
    {
        pyembed::Context context{ {
            /* .enable_logging = */ true,
        } };
        pyembed::Console console{ context };
    };

    inline Singletons& singletons()
    {
        static Singletons singletons;
        return singletons;
    }

    // Provides the context object to use in all tests needing it.
    // Note that this context is setup to handle logging.
    inline pyembed::Context& context()
    {
        return singletons().context;
    }

    class EnvironmentCleaner
    {
    public:

        EnvironmentCleaner();

        template <typename... Func>
        EnvironmentCleaner(Func&&... cleaner);

        ~EnvironmentCleaner();

    private:

        pyembed::util::environment_map m_env;
    };

    class CleanPyembedEnv
    {
    public:

        void operator()(const pyembed::util::environment_map& env);
    };

    /** An entry of an archive made by @ref make_archive. */
    struct ArchiveEntry
    {
        std::string path;
        std::string contents;
        bool executable = false;
    };

    /** Write a file, creating its parent directories. */
    void write_file(const pyembed::fs::path& path, std::string_view contents);

    [[nodiscard]] auto read_file(const pyembed::fs::path& path) -> std::string;

    /** Write an executable POSIX shell script. */
    void write_script(const pyembed::fs::path& path, std::string_view body);

    /** Write a zip archive (or a tar archive if the extension is ``.tar``). */
    void make_archive(const pyembed::fs::path& archive, const std::vector<ArchiveEntry>& entries);

    [[nodiscard]] auto file_url(const pyembed::fs::path& path) -> std::string;

#ifndef _WIN32
    /**
     * A loopback HTTP server answering every request with the same status and body.
     *
     * Requests are served on a background thread until destruction.
     */
    class HttpServer
    {
    public:

        HttpServer(int status, std::string body);
        ~HttpServer();

        HttpServer(const HttpServer&) = delete;
        HttpServer& operator=(const HttpServer&) = delete;

        [[nodiscard]] auto url() const -> std::string;
        /** Request lines received so far, e.g. ``GET /x HTTP/1.1``. */
        [[nodiscard]] auto requests() const -> std::vector<std::string>;

    private:

        void serve();
        void answer(int connection);

        std::string m_response;
        std::vector<std::string> m_requests;
        mutable std::mutex m_mutex;
        std::atomic<bool> m_stop{ false };
        int m_socket = -1;
        int m_port = 0;
        std::thread m_thread;
    };
#endif

    /**
     * Publish an embeddable distribution below ``root`` like python.org does.
     *
     * @returns the base URL of the host.
     */
    auto publish_distribution(
        const pyembed::fs::path& root,
        const pyembed::specs::PythonVersion& version,
        pyembed::specs::EmbedArch arch,
        const std::vector<ArchiveEntry>& entries
    ) -> std::string;

    /******************************************
     *  Implementation of EnvironmentCleaner  *
     ******************************************/

    inline EnvironmentCleaner::EnvironmentCleaner()
        : m_env(pyembed::util::get_env_map())
    {
    }

    template <typename... Func>
    EnvironmentCleaner::EnvironmentCleaner(Func&&... cleaner)
        : EnvironmentCleaner()
    {
        ((cleaner(const_cast<const pyembed::util::environment_map&>(m_env))), ...);
    }

    inline EnvironmentCleaner::~EnvironmentCleaner()
    {
        pyembed::util::set_env_map(m_env);
    }

    /***************************************
     *  Implementation of CleanPyembedEnv  *
     ***************************************/

    inline void CleanPyembedEnv::operator()(const pyembed::util::environment_map& env)
    {
        for (const auto& [key, val] : env)
        {
            if (pyembed::util::starts_with(key, "PYEMBED_"))
            {
                pyembed::util::unset_env(key);
            }
        }
    }

    /****************************
     *  Implementation of files  *
     ****************************/

    inline void write_file(const pyembed::fs::path& path, std::string_view contents)
    {
        if (path.has_parent_path())
        {
            pyembed::fs::create_directories(path.parent_path());
        }
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        out << contents;
        if (!out)
        {
            throw std::runtime_error("Could not write " + path.string());
        }
    }

    inline auto read_file(const pyembed::fs::path& path) -> std::string
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    }

    inline void write_script(const pyembed::fs::path& path, std::string_view body)
    {
        write_file(path, pyembed::util::concat("#!/bin/sh\n", body, "\n"));
        pyembed::fs::permissions(
            path,
            pyembed::fs::perms::owner_exec | pyembed::fs::perms::group_exec
                | pyembed::fs::perms::others_exec,
            pyembed::fs::perm_options::add
        );
    }

    inline void
    make_archive(const pyembed::fs::path& archive, const std::vector<ArchiveEntry>& entries)
    {
        const auto deleter = [](struct archive* a) { archive_write_free(a); };
        auto a = std::unique_ptr<struct archive, decltype(deleter)>(archive_write_new(), deleter);
        if (archive.extension() == ".tar")
        {
            archive_write_set_format_pax_restricted(a.get());
        }
        else
        {
            archive_write_set_format_zip(a.get());
        }
        if (archive_write_open_filename(a.get(), archive.string().c_str()) != ARCHIVE_OK)
        {
            throw std::runtime_error(archive_error_string(a.get()));
        }

        for (const auto& e : entries)
        {
            archive_entry* entry = archive_entry_new();
            archive_entry_set_pathname(entry, e.path.c_str());
            archive_entry_set_size(entry, static_cast<la_int64_t>(e.contents.size()));
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, e.executable ? 0755 : 0644);
            archive_write_header(a.get(), entry);
            archive_write_data(a.get(), e.contents.data(), e.contents.size());
            archive_entry_free(entry);
        }
        archive_write_close(a.get());
    }

    inline auto file_url(const pyembed::fs::path& path) -> std::string
    {
        const auto abs = pyembed::fs::absolute(path).generic_string();
        if (pyembed::util::on_win)
        {
            return "file:///" + abs;
        }
        return "file://" + abs;
    }

#ifndef _WIN32
    /*********************************
     *  Implementation of HttpServer  *
     *********************************/

    inline HttpServer::HttpServer(int status, std::string body)
    {
        const char* reason = status == 200   ? "OK"
                             : status == 404 ? "Not Found"
                             : status == 500 ? "Internal Server Error"
                                             : "Status";
        m_response = pyembed::util::concat(
            "HTTP/1.1 ",
            std::to_string(status),
            " ",
            reason,
            "\r\nContent-Type: application/octet-stream\r\nContent-Length: ",
            std::to_string(body.size()),
            "\r\nConnection: close\r\n\r\n",
            body
        );

        m_socket = ::socket(AF_INET, SOCK_STREAM, 0);
        if (m_socket < 0)
        {
            throw std::runtime_error("Could not create a socket");
        }
        sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(m_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0
            || ::listen(m_socket, 8) != 0
            || ::getsockname(m_socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        {
            ::close(m_socket);
            throw std::runtime_error("Could not listen on the loopback interface");
        }
        m_port = ntohs(addr.sin_port);
        m_thread = std::thread([this] { serve(); });
    }

    inline HttpServer::~HttpServer()
    {
        m_stop = true;
        m_thread.join();
        ::close(m_socket);
    }

    inline auto HttpServer::url() const -> std::string
    {
        return "http://127.0.0.1:" + std::to_string(m_port);
    }

    inline auto HttpServer::requests() const -> std::vector<std::string>
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    inline void HttpServer::serve()
    {
        while (!m_stop)
        {
            pollfd pfd = { m_socket, POLLIN, 0 };
            if (::poll(&pfd, 1, 50) <= 0)
            {
                continue;
            }
            const int connection = ::accept(m_socket, nullptr, nullptr);
            if (connection < 0)
            {
                continue;
            }
            answer(connection);
            ::close(connection);
        }
    }

    inline void HttpServer::answer(int connection)
    {
        std::string request;
        char buffer[1024];
        while (request.find("\r\n\r\n") == std::string::npos)
        {
            const auto n = ::recv(connection, buffer, sizeof(buffer), 0);
            if (n <= 0)
            {
                return;
            }
            request.append(buffer, static_cast<std::size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request.substr(0, request.find("\r\n")));
        }
        std::string_view out = m_response;
        while (!out.empty())
        {
            const auto n = ::send(connection, out.data(), out.size(), MSG_NOSIGNAL);
            if (n <= 0)
            {
                return;
            }
            out.remove_prefix(static_cast<std::size_t>(n));
        }
    }
#endif

    inline auto publish_distribution(
        const pyembed::fs::path& root,
        const pyembed::specs::PythonVersion& version,
        pyembed::specs::EmbedArch arch,
        const std::vector<ArchiveEntry>& entries
    ) -> std::string
    {
        const auto dir = root / version.to_string();
        pyembed::fs::create_directories(dir);
        make_archive(dir / pyembed::specs::embed_archive_filename(version, arch), entries);
        return file_url(root);
    }
}

#endif
