// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pyembed/core/util.hpp"
#include "pyembed/util/cfile.hpp"

#include "pyembedtests.hpp"

using namespace pyembed;

namespace
{
    TEST_CASE("CFile", "[pyembed::util]")
    {
        const auto tmp = TemporaryDirectory();
        const auto path = tmp.path() / "file.txt";

        SECTION("Write and close")
        {
            auto file = util::CFile::try_open(path, "wb");
            REQUIRE(file.has_value());
            REQUIRE(file->is_open());
            REQUIRE(std::fputs("hello", file->raw()) >= 0);
            REQUIRE(file->try_close().has_value());
            REQUIRE_FALSE(file->is_open());
            REQUIRE(pyembedtests::read_file(path) == "hello");
        }

        SECTION("Closed by destructor")
        {
            {
                auto file = util::CFile::try_open(path, "wb");
                REQUIRE(file.has_value());
                std::fputs("bye", file->raw());
            }
            REQUIRE(pyembedtests::read_file(path) == "bye");
        }

        SECTION("Missing directory")
        {
            auto file = util::CFile::try_open(tmp.path() / "missing" / "file.txt", "wb");
            REQUIRE_FALSE(file.has_value());
            REQUIRE(file.error());

            std::error_code ec;
            auto other = util::CFile::try_open(tmp.path() / "missing" / "file.txt", "rb", ec);
            REQUIRE(ec);
            REQUIRE_FALSE(other.is_open());
        }
    }
}
