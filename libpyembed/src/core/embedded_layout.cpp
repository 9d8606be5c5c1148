// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "pyembed/core/embedded_layout.hpp"
#include "pyembed/core/logging.hpp"
#include "pyembed/core/util.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/embed_archive.hpp"
#include "pyembed/util/build.hpp"
#include "pyembed/util/environment.hpp"
#include "pyembed/util/string.hpp"

namespace pyembed
{
    auto python_executable(const fs::path& prefix) -> fs::path
    {
        return prefix / "python.exe";
    }

    auto prefix_path_dirs(const fs::path& prefix) -> std::vector<fs::path>
    {
        return { prefix, prefix / "Scripts" };
    }

    auto prefix_path_env(const fs::path& prefix, std::string_view current_path) -> std::string
    {
        std::vector<std::string> entries;
        for (const auto& dir : prefix_path_dirs(prefix))
        {
            entries.push_back(util::path_to_utf8(dir));
        }
        if (!current_path.empty())
        {
            entries.emplace_back(current_path);
        }
        return util::join(std::string(1, util::pathsep()), entries);
    }

    /*****************
     * ._pth editing *
     *****************/

    auto enable_site_import(const fs::path& prefix, const specs::PythonVersion& version)
        -> expected_t<void>
    {
        const auto pth_path = prefix / specs::pth_filename(version);
        std::error_code ec;
        if (!fs::exists(pth_path, ec))
        {
            LOG_WARNING << "No " << util::path_to_utf8(pth_path.filename()) << " in " << util::path_to_utf8(prefix)
                        << ", site import left unchanged";
            return {};
        }

        std::string contents;
        try
        {
            contents = read_contents(pth_path);
        }
        catch (const std::system_error& e)
        {
            return make_unexpected(
                fmt::format("Could not read {}: {}", util::path_to_utf8(pth_path), e.what()),
                pyembed_error_code::extraction_failed
            );
        }

        const auto original = contents;
        util::replace_all(contents, "#import site", "import site");
        if (contents == original)
        {
            LOG_DEBUG << "Site import already enabled in " << util::path_to_utf8(pth_path);
            return {};
        }

        std::ofstream out = open_ofstream(pth_path);
        out << contents;
        out.close();
        if (out.fail())
        {
            return make_unexpected(
                fmt::format("Could not write {}", util::path_to_utf8(pth_path)),
                pyembed_error_code::extraction_failed
            );
        }
        LOG_INFO << "Enabled site import in " << util::path_to_utf8(pth_path);
        return {};
    }

    /*************
     * Host libs *
     *************/

    namespace
    {
        auto same_dir_name(const std::string& lhs, const std::string& rhs) -> bool
        {
            if (util::on_win)
            {
                return util::to_lower(lhs) == util::to_lower(rhs);
            }
            return lhs == rhs;
        }
    }

    auto find_host_libs_dir(const specs::PythonVersion& version) -> expected_t<fs::path>
    {
        std::vector<fs::path> search_paths;
        for (const auto& entry : util::split(util::get_env("PATH").value_or(""), util::pathsep()))
        {
            if (!entry.empty())
            {
                search_paths.emplace_back(entry);
            }
        }
        return find_host_libs_dir(version, search_paths);
    }

    auto
    find_host_libs_dir(const specs::PythonVersion& version, const std::vector<fs::path>& search_paths)
        -> expected_t<fs::path>
    {
        const auto target = util::concat("Python", version.short_name());
        for (const auto& dir : search_paths)
        {
            // "C:\Python311\" has an empty filename
            const auto name = util::path_to_utf8((dir.has_filename() ? dir : dir.parent_path()).filename());
            if (!same_dir_name(name, target))
            {
                continue;
            }
            const auto libs = dir / "libs";
            std::error_code ec;
            if (fs::is_directory(libs, ec))
            {
                LOG_DEBUG << "Found host libs directory " << util::path_to_utf8(libs);
                return libs;
            }
        }
        return make_unexpected(
            fmt::format("Could not find any {}/libs in PATH", target),
            pyembed_error_code::copy_libs_failed
        );
    }

    auto copy_host_libs(const fs::path& libs_dir, const fs::path& prefix) -> expected_t<void>
    {
        const auto dest = prefix / "libs";
        LOG_INFO << "Copying " << util::path_to_utf8(libs_dir) << " to " << util::path_to_utf8(dest);

        std::error_code ec;
        fs::create_directories(dest, ec);
        if (!ec)
        {
            fs::copy(
                libs_dir,
                dest,
                fs::copy_options::recursive | fs::copy_options::skip_existing,
                ec
            );
        }
        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not copy {} to {}: {}", util::path_to_utf8(libs_dir), util::path_to_utf8(dest), ec.message()),
                pyembed_error_code::copy_libs_failed
            );
        }
        return {};
    }
}
