// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>

#include <fmt/color.h>
#include <fmt/format.h>

#include "pyembed/api/create.hpp"
#include "pyembed/core/context.hpp"
#include "pyembed/core/embedded_layout.hpp"
#include "pyembed/core/logging.hpp"
#include "pyembed/core/output.hpp"
#include "pyembed/core/package_handling.hpp"
#include "pyembed/core/python_probe.hpp"
#include "pyembed/core/util.hpp"
#include "pyembed/download/downloader.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/embed_archive.hpp"

namespace pyembed
{
    namespace
    {
        auto make_temporary_directory() -> expected_t<std::unique_ptr<TemporaryDirectory>>
        {
            try
            {
                return std::make_unique<TemporaryDirectory>();
            }
            catch (const std::exception& e)
            {
                return make_unexpected(e.what(), pyembed_error_code::internal_failure);
            }
        }

        auto download_archive(const Context& ctx, const std::string& url, const fs::path& dest)
            -> expected_t<void>
        {
            Console::stream() << fmt::format(ctx.graphics_params.palette.external, "Downloading {}", url);

            auto result = download::download(
                download::Request("embeddable distribution", url, dest),
                ctx.remote_fetch_params,
                ctx.download_options()
            );
            if (!result)
            {
                return make_unexpected(result.error().message, pyembed_error_code::download_failed);
            }
            LOG_INFO << "Downloaded " << result->transfer.downloaded_size << " bytes from "
                     << result->transfer.effective_url;
            return {};
        }

        auto prepare_runtime(
            const Context& ctx,
            const fs::path& prefix,
            const specs::PythonVersion& version,
            const fs::path& download_dir
        ) -> expected_t<void>
        {
            const auto& params = ctx.install_params;
            if (params.enable_site)
            {
                if (auto res = enable_site_import(prefix, version); !res)
                {
                    return res;
                }
            }

            if (params.copy_host_libs)
            {
                Console::stream() << "Copying host libs";
                auto res = find_host_libs_dir(version).and_then(
                    [&](const fs::path& libs_dir) { return copy_host_libs(libs_dir, prefix); }
                );
                if (!res)
                {
                    return res;
                }
            }

            if (params.bootstrap_pip)
            {
                return bootstrap_pip(ctx, prefix, download_dir);
            }
            return {};
        }
    }

    auto create_embedded_environment(
        const Context& ctx,
        const fs::path& prefix,
        const fs::path& requirements
    ) -> expected_t<CreateResult>
    {
        const auto& palette = ctx.graphics_params.palette;

        Console::stream() << "Resolving Python version";
        auto version = resolve_python_version(ctx);
        if (!version)
        {
            return forward_error(version);
        }
        Console::stream() << fmt::format(palette.success, "Using Python {}", version.value());

        auto tmp = make_temporary_directory();
        if (!tmp)
        {
            return forward_error(tmp);
        }
        const fs::path download_dir = tmp.value()->path();

        const auto arch = ctx.distribution_params.arch;
        const auto url = specs::embed_archive_url(
            ctx.distribution_params.base_url,
            version.value(),
            arch
        );
        const auto archive = download_dir / specs::embed_archive_filename(version.value(), arch);
        if (auto res = download_archive(ctx, url, archive); !res)
        {
            return forward_error(res);
        }

        Console::stream() << fmt::format(palette.external, "Extracting into {}", util::path_to_utf8(prefix));
        if (auto res = extract_archive(archive, prefix); !res)
        {
            return forward_error(res);
        }

        if (auto res = prepare_runtime(ctx, prefix, version.value(), download_dir); !res)
        {
            return forward_error(res);
        }

        auto command = install_requirements(ctx, prefix, requirements);
        if (!command)
        {
            return forward_error(command);
        }

        Console::stream() << fmt::format(palette.success, "Done");
        return CreateResult{
            .version = version.value(),
            .archive_url = url,
            .installer = prefix / ctx.install_params.installer_path,
            .command = std::move(command).value(),
        };
    }
}
