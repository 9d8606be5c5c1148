// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.


#ifdef _WIN32

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>
#include <Shlobj.h>
#include <Windows.h>

#include "pyembed/util/environment.hpp"
#include "pyembed/util/string.hpp"

namespace pyembed::util
{
    namespace
    {
        // Calls to getenv_s kinds of functions are not thread-safe.
        std::mutex env_mutex = {};
    }

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        std::scoped_lock ready_to_execute{ env_mutex };

        char* value = nullptr;
        std::size_t size = 0;
        const auto error_code = ::_dupenv_s(&value, &size, key.c_str());
        if (error_code != 0)
        {
            throw std::runtime_error(fmt::format(
                R"(Failed to acquire environment variable "{}" : errcode = {})",
                key,
                error_code
            ));
        }
        if (value == nullptr)
        {
            return {};
        }
        auto out = std::string(value);
        std::free(value);
        return { std::move(out) };
    }

    void set_env(const std::string& key, const std::string& value)
    {
        std::scoped_lock ready_to_execute{ env_mutex };

        const auto res = ::_putenv_s(key.c_str(), value.c_str());
        if (res != 0)
        {
            throw std::runtime_error(fmt::format(
                R"(Could not set environment variable "{}" to "{}" : {})",
                key,
                value,
                ::GetLastError()
            ));
        }
    }

    void unset_env(const std::string& key)
    {
        set_env(key, "");
    }

    auto get_env_map() -> environment_map
    {
        std::scoped_lock ready_to_execute{ env_mutex };

        auto env = environment_map();
        for (char** it = _environ; it != nullptr && *it != nullptr; ++it)
        {
            const auto expr = std::string_view(*it);
            const auto pos = expr.find('=');
            // Skip hidden drive variables such as "=C:"
            if (pos == 0)
            {
                continue;
            }
            env.emplace(expr.substr(0, pos), (pos != expr.npos) ? std::string(expr.substr(pos + 1)) : "");
        }
        return env;
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = get_env("USERPROFILE").value_or(""); !maybe_home.empty())
        {
            return maybe_home;
        }
        wchar_t* localAppData = nullptr;
        const auto hres = ::SHGetKnownFolderPath(FOLDERID_Profile, KF_FLAG_DONT_VERIFY, nullptr, &localAppData);
        if (hres != S_OK)
        {
            ::CoTaskMemFree(localAppData);
            throw std::runtime_error("User profile directory not found.");
        }
        auto home = fs::path(localAppData);
        ::CoTaskMemFree(localAppData);
        return home.string();
    }

    auto user_config_dir() -> std::string
    {
        if (auto maybe_dir = get_env("XDG_CONFIG_HOME").value_or(""); !maybe_dir.empty())
        {
            return maybe_dir;
        }
        if (auto maybe_dir = get_env("APPDATA").value_or(""); !maybe_dir.empty())
        {
            return maybe_dir;
        }
        return (fs::path(user_home_dir()) / "AppData" / "Roaming").string();
    }

    auto which_system(std::string_view) -> fs::path
    {
        return "";
    }

    constexpr auto exec_extension() -> std::string_view
    {
        return ".exe";
    };
}

#else  // #ifdef _WIN32

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <pwd.h>
#include <unistd.h>

#include "pyembed/util/environment.hpp"

extern "C"
{
    extern char** environ;  // Unix defined
}

namespace pyembed::util
{
    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        if (const char* val = std::getenv(key.c_str()))
        {
            return val;
        }
        return {};
    }

    void set_env(const std::string& key, const std::string& value)
    {
        const auto result = ::setenv(key.c_str(), value.c_str(), 1);
        if (result != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}" to "{}")", key, value)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        const auto res = ::unsetenv(key.c_str());
        if (res != 0)
        {
            throw std::runtime_error(fmt::format(R"(Could not unset environment variable "{}")", key));
        }
    }

    auto get_env_map() -> environment_map
    {
        auto env = environment_map();
        for (std::size_t i = 0; environ[i]; ++i)
        {
            const auto expr = std::string_view(environ[i]);
            const auto pos = expr.find('=');
            env.emplace(expr.substr(0, pos), (pos != expr.npos) ? std::string(expr.substr(pos + 1)) : "");
        }
        return env;
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = get_env("HOME").value_or(""); !maybe_home.empty())
        {
            return maybe_home;
        }
        if (const auto* user = ::getpwuid(::getuid()))
        {
            if (const char* maybe_home = user->pw_dir)
            {
                return maybe_home;
            }
        }
        throw std::runtime_error("HOME not set.");
    }

    auto user_config_dir() -> std::string
    {
        if (auto maybe_dir = get_env("XDG_CONFIG_HOME").value_or(""); !maybe_dir.empty())
        {
            return maybe_dir;
        }
        return (fs::path(user_home_dir()) / ".config").string();
    }

    auto which_system(std::string_view exe) -> fs::path
    {
        const auto n = ::confstr(_CS_PATH, nullptr, static_cast<std::size_t>(0));
        auto pathbuf = std::vector<char>(n, '\0');
        ::confstr(_CS_PATH, pathbuf.data(), n);
        // Drop the terminating null character
        return which_in(exe, std::string_view(pathbuf.data(), n > 0 ? n - 1 : 0));
    }

    constexpr auto exec_extension() -> std::string_view
    {
        return "";
    };
}

#endif  // #ifdef _WIN32

#include "pyembed/util/environment.hpp"
#include "pyembed/util/string.hpp"

namespace pyembed::util
{
    void update_env_map(const environment_map& env)
    {
        for (const auto& [name, val] : env)
        {
            set_env(name, val);
        }
    }

    void set_env_map(const environment_map& env)
    {
        for (const auto& [name, val] : get_env_map())
        {
            unset_env(name);
        }
        update_env_map(env);
    }

    namespace
    {
        auto which_in_one_impl(const fs::path& exe, const fs::path& dir, const fs::path& extension)
            -> fs::path
        {
            std::error_code _ec;  // ignore
            if (dir.empty() || !fs::exists(dir, _ec) || !fs::is_directory(dir, _ec))
            {
                return "";  // Not found
            }

            const auto strip_ext = [&extension](const fs::path& p)
            {
                if (p.extension() == extension)
                {
                    return p.stem();
                }
                return p.filename();
            };

            const auto exe_striped = strip_ext(exe);
            for (const auto& entry : fs::directory_iterator(dir, _ec))
            {
                if (auto p = entry.path(); strip_ext(p) == exe_striped && !entry.is_directory(_ec))
                {
                    return p;
                }
            }
            return "";  // Not found
        }

        auto which_in_split_impl(
            const fs::path& exe,
            std::string_view paths,
            const fs::path& extension,
            char pathsep
        ) -> fs::path
        {
            auto elem = std::string_view();
            auto rest = std::optional<std::string_view>(paths);
            while (rest.has_value())
            {
                std::tie(elem, rest) = util::split_once(rest.value(), pathsep);
                if (auto p = which_in_one_impl(exe, elem, extension); !p.empty())
                {
                    return p;
                };
            }
            return "";
        }
    }

    auto which(std::string_view exe) -> fs::path
    {
        if (auto paths = get_env("PATH"))
        {
            if (auto p = which_in(exe, paths.value()); !p.empty())
            {
                return p;
            }
        }
        return which_system(exe);
    }

    namespace detail
    {
        auto which_in_one(const fs::path& exe, const fs::path& dir) -> fs::path
        {
            return which_in_one_impl(exe, dir, exec_extension());
        }

        auto which_in_split(const fs::path& exe, std::string_view paths) -> fs::path
        {
            return which_in_split_impl(exe, paths, exec_extension(), util::pathsep());
        }
    }
}
