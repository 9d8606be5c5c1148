// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_CONTEXT_HPP
#define PYEMBED_CORE_CONTEXT_HPP

#include <optional>
#include <string>
#include <vector>

#include "pyembed/core/logging.hpp"
#include "pyembed/core/palette.hpp"
#include "pyembed/download/parameters.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/embed_archive.hpp"
#include "pyembed/specs/python_version.hpp"
#include "pyembed/version.hpp"

namespace pyembed
{
    struct ContextOptions
    {
        bool enable_logging = false;
    };

    /** Which interpreter to probe, or the version to use without probing. */
    struct InterpreterParams
    {
        std::string python_exe{ "python" };
        std::optional<specs::PythonVersion> python_version;
    };

    /** Where the embeddable distribution and the pip bootstrap script are fetched from. */
    struct DistributionParams
    {
        std::string base_url{ specs::default_embed_base_url };
        specs::EmbedArch arch{ specs::EmbedArch::amd64 };
        std::string get_pip_url{ "https://bootstrap.pypa.io/get-pip.py" };
    };

    struct InstallParams
    {
        /** Location of the package manager, relative to the destination. */
        fs::path installer_path{ fs::path("Scripts") / "pip.exe" };
        bool enable_site{ true };
        bool bootstrap_pip{ true };
        bool copy_host_libs{ false };
        /** Extra arguments appended to ``pip install -r <requirements>``. */
        std::vector<std::string> pip_args;
    };

    class Context
    {
    public:

        struct OutputParams
        {
            int verbosity{ 0 };
            log_level logging_level{ log_level::warn };

            bool quiet{ false };

            std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
        };

        struct GraphicsParams
        {
            Palette palette;
        };

        struct SrcParams
        {
            bool no_rc{ false };
            bool no_env{ false };
            std::vector<fs::path> rc_files;
        };

        OutputParams output_params;
        GraphicsParams graphics_params;
        SrcParams src_params;
        InterpreterParams interpreter_params;
        DistributionParams distribution_params;
        InstallParams install_params;

        download::RemoteFetchParams remote_fetch_params = {
            .ssl_verify = { "" },
            .ssl_no_revoke = false,
            .user_agent = { "pyembed/" LIBPYEMBED_VERSION_STRING },
            .connect_timeout_secs = 10.,
            .proxy = { "" },
        };

        download::Options download_options() const
        {
            return {
                .verbose = this->output_params.logging_level <= log_level::debug,
            };
        }

        void set_verbosity(int lvl);
        void set_log_level(log_level level);

        Context(const ContextOptions& options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

    private:

        bool m_logging_enabled = false;

        // Registers the spdlog log handler in the logging system.
        // This function must be called only for one Context in the lifetime of the program.
        void enable_logging();
    };
}

#endif
