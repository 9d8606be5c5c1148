// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pyembed/specs/embed_archive.hpp"

using namespace pyembed::specs;

namespace
{
    TEST_CASE("parse_embed_arch", "[pyembed::specs]")
    {
        REQUIRE(parse_embed_arch("amd64") == EmbedArch::amd64);
        REQUIRE(parse_embed_arch("win32") == EmbedArch::win32);
        REQUIRE(parse_embed_arch("arm64") == EmbedArch::arm64);
        REQUIRE(parse_embed_arch(" AMD64 ") == EmbedArch::amd64);
        REQUIRE_FALSE(parse_embed_arch("x86_64").has_value());
        REQUIRE_FALSE(parse_embed_arch("").has_value());

        for (auto arch : known_embed_archs())
        {
            REQUIRE(parse_embed_arch(arch_name(arch)) == arch);
        }
    }

    TEST_CASE("embed_archive_url", "[pyembed::specs]")
    {
        const auto v = PythonVersion(3, 11, 4);

        SECTION("Default host")
        {
            REQUIRE(
                embed_archive_url(default_embed_base_url, v, EmbedArch::amd64)
                == "https://www.python.org/ftp/python/3.11.4/python-3.11.4-embed-amd64.zip"
            );
        }

        SECTION("Architectures")
        {
            REQUIRE(embed_archive_filename(v, EmbedArch::win32) == "python-3.11.4-embed-win32.zip");
            REQUIRE(embed_archive_filename(v, EmbedArch::arm64) == "python-3.11.4-embed-arm64.zip");
        }

        SECTION("Trailing slashes")
        {
            REQUIRE(
                embed_archive_url("https://mirror.example.org/python//", v, EmbedArch::amd64)
                == "https://mirror.example.org/python/3.11.4/python-3.11.4-embed-amd64.zip"
            );
        }

        SECTION("Deterministic")
        {
            REQUIRE(
                embed_archive_url("file:///srv/python", PythonVersion(3, 9, 7), EmbedArch::amd64)
                == embed_archive_url("file:///srv/python", PythonVersion(3, 9, 7), EmbedArch::amd64)
            );
        }
    }

    TEST_CASE("pth_filename", "[pyembed::specs]")
    {
        REQUIRE(pth_filename(PythonVersion(3, 11, 4)) == "python311._pth");
        REQUIRE(pth_filename(PythonVersion(3, 9, 7)) == "python39._pth");
    }
}
