// Copyright (c) 2022, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>

#include <catch2/catch_all.hpp>

#include "pyembed/core/error_handling.hpp"

namespace pyembed
{
    namespace
    {
        auto half(int value) -> expected_t<int>
        {
            if (value % 2 != 0)
            {
                return make_unexpected("odd value", pyembed_error_code::incorrect_usage);
            }
            return value / 2;
        }

        auto quarter(int value) -> expected_t<int>
        {
            auto res = half(value);
            if (!res)
            {
                return forward_error(res);
            }
            return half(res.value());
        }

        TEST_CASE("pyembed_error", "[pyembed::core]")
        {
            const auto error = pyembed_error("no such file", pyembed_error_code::download_failed);
            REQUIRE(error.error_code() == pyembed_error_code::download_failed);
            REQUIRE(std::string(error.what()) == "no such file");

            const std::runtime_error& base = error;
            REQUIRE(std::string(base.what()) == "no such file");
        }

        TEST_CASE("step_name", "[pyembed::core]")
        {
            REQUIRE(step_name(pyembed_error_code::interpreter_not_found) == "Version probe");
            REQUIRE(step_name(pyembed_error_code::unparseable_version) == "Version probe");
            REQUIRE(step_name(pyembed_error_code::download_failed) == "Download");
            REQUIRE(step_name(pyembed_error_code::extraction_failed) == "Extraction");
            REQUIRE(step_name(pyembed_error_code::copy_libs_failed) == "Host libs copy");
            REQUIRE(step_name(pyembed_error_code::install_failed) == "Install");
            REQUIRE(step_name(pyembed_error_code::incorrect_usage) == "Configuration");
        }

        TEST_CASE("forward_error", "[pyembed::core]")
        {
            REQUIRE(quarter(8) == 2);

            const auto odd = quarter(6);
            REQUIRE_FALSE(odd.has_value());
            REQUIRE(odd.error().error_code() == pyembed_error_code::incorrect_usage);
            REQUIRE(std::string(odd.error().what()) == "odd value");
        }

        TEST_CASE("extract", "[pyembed::core]")
        {
            auto good = half(4);
            REQUIRE(extract(good) == 2);
            REQUIRE(extract(half(10)) == 5);

            auto bad = half(3);
            REQUIRE_THROWS_AS(extract(bad), pyembed_error);
            try
            {
                extract(bad);
            }
            catch (const pyembed_error& e)
            {
                REQUIRE(e.error_code() == pyembed_error_code::incorrect_usage);
            }
        }
    }
}
