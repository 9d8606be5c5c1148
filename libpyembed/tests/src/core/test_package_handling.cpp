// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pyembed/core/package_handling.hpp"
#include "pyembed/core/util.hpp"

#include "pyembedtests.hpp"

namespace pyembed
{
    namespace
    {
        const std::vector<pyembedtests::ArchiveEntry> distribution_entries = {
            { "python.exe", "interpreter", true },
            { "python311._pth", "python311.zip\n.\n#import site\n" },
            { "Lib/site-packages/README.txt", "site packages" },
        };

        TEST_CASE("extract_archive", "[pyembed::core]")
        {
            const auto tmp = TemporaryDirectory();
            const auto archive = tmp.path() / "dist.zip";
            pyembedtests::make_archive(archive, distribution_entries);

            SECTION("Into a new nested directory")
            {
                const auto dest = tmp.path() / "a" / "b" / "myenv";
                REQUIRE(extract_archive(archive, dest).has_value());
                REQUIRE(pyembedtests::read_file(dest / "python.exe") == "interpreter");
                REQUIRE(pyembedtests::read_file(dest / "python311._pth") == "python311.zip\n.\n#import site\n");
                REQUIRE(pyembedtests::read_file(dest / "Lib" / "site-packages" / "README.txt") == "site packages");
            }

            SECTION("Re-extraction gives the same tree")
            {
                const auto dest = tmp.path() / "myenv";
                REQUIRE(extract_archive(archive, dest).has_value());
                REQUIRE(extract_archive(archive, dest).has_value());

                std::size_t count = 0;
                for (const auto& entry : fs::recursive_directory_iterator(dest))
                {
                    if (entry.is_regular_file())
                    {
                        ++count;
                    }
                }
                REQUIRE(count == distribution_entries.size());
            }

            SECTION("Existing files are overwritten, others are kept")
            {
                const auto dest = tmp.path() / "myenv";
                pyembedtests::write_file(dest / "python.exe", "previous interpreter");
                pyembedtests::write_file(dest / "user_file.txt", "kept");

                REQUIRE(extract_archive(archive, dest).has_value());
                REQUIRE(pyembedtests::read_file(dest / "python.exe") == "interpreter");
                REQUIRE(pyembedtests::read_file(dest / "user_file.txt") == "kept");
            }

            SECTION("Tar archives")
            {
                const auto tar = tmp.path() / "dist.tar";
                pyembedtests::make_archive(tar, distribution_entries);
                const auto dest = tmp.path() / "from_tar";
                REQUIRE(extract_archive(tar, dest).has_value());
                REQUIRE(pyembedtests::read_file(dest / "python.exe") == "interpreter");
            }

            SECTION("Working directory is restored")
            {
                const auto cwd = fs::current_path();
                REQUIRE(extract_archive(archive, tmp.path() / "myenv").has_value());
                REQUIRE(fs::current_path() == cwd);

                REQUIRE_FALSE(extract_archive(tmp.path() / "missing.zip", tmp.path() / "other"));
                REQUIRE(fs::current_path() == cwd);
            }
        }

        TEST_CASE("extract_archive failures", "[pyembed::core]")
        {
            const auto tmp = TemporaryDirectory();

            SECTION("Missing archive")
            {
                auto res = extract_archive(tmp.path() / "missing.zip", tmp.path() / "dest");
                REQUIRE_FALSE(res.has_value());
                REQUIRE(res.error().error_code() == pyembed_error_code::extraction_failed);
            }

            SECTION("Not an archive")
            {
                const auto fake = tmp.path() / "fake.zip";
                pyembedtests::write_file(fake, "<html>404 Not Found</html>");
                auto res = extract_archive(fake, tmp.path() / "dest");
                REQUIRE_FALSE(res.has_value());
                REQUIRE(res.error().error_code() == pyembed_error_code::extraction_failed);
                REQUIRE_THAT(res.error().what(), Catch::Matchers::ContainsSubstring("fake.zip"));
            }
        }
    }
}
