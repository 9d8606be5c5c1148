// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pyembed/core/context.hpp"
#include "pyembed/core/python_probe.hpp"
#include "pyembed/core/util.hpp"
#include "pyembed/util/build.hpp"

#include "pyembedtests.hpp"

namespace pyembed
{
    namespace
    {
        TEST_CASE("resolve_interpreter", "[pyembed::core]")
        {
            if (util::on_win)
            {
                SKIP("Fake interpreters are POSIX shell scripts");
            }

            const auto restore = pyembedtests::EnvironmentCleaner();
            const auto tmp = TemporaryDirectory();
            const auto bin = tmp.path() / "bin";
            pyembedtests::write_script(bin / "fakepython", "echo 'Python 3.11.4'");
            util::set_env("PATH", bin.string());

            SECTION("From PATH")
            {
                auto path = resolve_interpreter("fakepython");
                REQUIRE(path.has_value());
                REQUIRE(path.value() == bin / "fakepython");
            }

            SECTION("Explicit path")
            {
                auto path = resolve_interpreter((bin / "fakepython").string());
                REQUIRE(path.value() == bin / "fakepython");
            }

            SECTION("Not found")
            {
                auto path = resolve_interpreter("no-such-python-xyz");
                REQUIRE_FALSE(path.has_value());
                REQUIRE(path.error().error_code() == pyembed_error_code::interpreter_not_found);

                auto missing = resolve_interpreter((bin / "missing").string());
                REQUIRE(missing.error().error_code() == pyembed_error_code::interpreter_not_found);

                REQUIRE_FALSE(resolve_interpreter(""));
            }
        }

        TEST_CASE("query_python_version", "[pyembed::core]")
        {
            if (util::on_win)
            {
                SKIP("Fake interpreters are POSIX shell scripts");
            }

            const auto tmp = TemporaryDirectory();
            const auto python = tmp.path() / "python";

            SECTION("Version on stdout")
            {
                pyembedtests::write_script(python, "echo 'Python 3.11.4'");
                REQUIRE(query_python_version(python) == specs::PythonVersion(3, 11, 4));
            }

            SECTION("Version on stderr")
            {
                pyembedtests::write_script(python, "echo 'Python 2.7.18' >&2");
                REQUIRE(query_python_version(python) == specs::PythonVersion(2, 7, 18));
            }

            SECTION("Surrounding noise")
            {
                pyembedtests::write_script(python, "echo 'warning: something'\necho 'Python 3.12.1+'");
                REQUIRE(query_python_version(python) == specs::PythonVersion(3, 12, 1));
            }

            SECTION("No version in the output")
            {
                pyembedtests::write_script(python, "echo 'Python'");
                auto version = query_python_version(python);
                REQUIRE_FALSE(version.has_value());
                REQUIRE(version.error().error_code() == pyembed_error_code::unparseable_version);
            }

            SECTION("Non-ASCII location")
            {
                const auto unicode_python = tmp.path() / fs::path(u8"r\u00e9pertoire") / "python";
                pyembedtests::write_script(unicode_python, "echo 'Python 3.10.11'");
                REQUIRE(query_python_version(unicode_python) == specs::PythonVersion(3, 10, 11));
            }

            SECTION("Cannot be started")
            {
                auto version = query_python_version(tmp.path() / "does-not-exist");
                REQUIRE_FALSE(version.has_value());
                REQUIRE(version.error().error_code() == pyembed_error_code::interpreter_not_found);
            }
        }

        TEST_CASE("resolve_python_version", "[pyembed::core]")
        {
            Context ctx;

            SECTION("Configured version is used without probing")
            {
                ctx.interpreter_params.python_exe = "no-such-python-xyz";
                ctx.interpreter_params.python_version = specs::PythonVersion(3, 9, 7);
                REQUIRE(resolve_python_version(ctx) == specs::PythonVersion(3, 9, 7));
            }

            SECTION("Missing interpreter")
            {
                ctx.interpreter_params.python_exe = "no-such-python-xyz";
                auto version = resolve_python_version(ctx);
                REQUIRE_FALSE(version.has_value());
                REQUIRE(version.error().error_code() == pyembed_error_code::interpreter_not_found);
            }

            SECTION("Probed interpreter")
            {
                if (util::on_win)
                {
                    SKIP("Fake interpreters are POSIX shell scripts");
                }
                const auto tmp = TemporaryDirectory();
                pyembedtests::write_script(tmp.path() / "python", "echo 'Python 3.10.12'");
                ctx.interpreter_params.python_exe = (tmp.path() / "python").string();
                REQUIRE(resolve_python_version(ctx) == specs::PythonVersion(3, 10, 12));
            }
        }
    }
}
