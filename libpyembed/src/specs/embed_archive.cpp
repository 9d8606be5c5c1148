// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "pyembed/specs/embed_archive.hpp"
#include "pyembed/util/string.hpp"

namespace pyembed::specs
{
    auto parse_embed_arch(std::string_view str) -> expected_parse_t<EmbedArch>
    {
        const auto name = util::to_lower(util::strip(str));
        for (const auto arch : known_embed_archs())
        {
            if (name == arch_name(arch))
            {
                return { arch };
            }
        }
        return make_unexpected_parse(fmt::format(
            R"(Unknown embeddable architecture "{}", expected one of amd64, win32, arm64.)",
            str
        ));
    }

    auto embed_archive_filename(const PythonVersion& version, EmbedArch arch) -> std::string
    {
        return fmt::format("python-{}-embed-{}.zip", version, arch_name(arch));
    }

    auto embed_archive_url(std::string_view base_url, const PythonVersion& version, EmbedArch arch)
        -> std::string
    {
        return fmt::format(
            "{}/{}/{}",
            util::rstrip(base_url, '/'),
            version,
            embed_archive_filename(version, arch)
        );
    }

    auto pth_filename(const PythonVersion& version) -> std::string
    {
        return fmt::format("python{}._pth", version.short_name());
    }
}
