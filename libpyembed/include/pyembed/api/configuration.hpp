// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_API_CONFIGURATION_HPP
#define PYEMBED_API_CONFIGURATION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "pyembed/core/error_handling.hpp"
#include "pyembed/core/logging.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/specs/embed_archive.hpp"
#include "pyembed/specs/python_version.hpp"

namespace pyembed
{
    class Context;

    /**
     * The settings given by one configuration source.
     *
     * Unset values leave the context untouched when applied.
     */
    struct ConfigurationValues
    {
        std::optional<std::string> python;
        std::optional<specs::PythonVersion> python_version;
        std::optional<specs::EmbedArch> arch;
        std::optional<std::string> base_url;
        std::optional<std::string> get_pip_url;
        std::optional<fs::path> installer_path;
        std::optional<bool> enable_site;
        std::optional<bool> bootstrap_pip;
        std::optional<bool> copy_host_libs;
        std::optional<std::vector<std::string>> pip_args;
        std::optional<std::string> ssl_verify;
        std::optional<bool> ssl_no_revoke;
        std::optional<std::string> proxy;
        std::optional<double> connect_timeout_secs;
        std::optional<log_level> logging_level;

        /** Values set in ``other`` replace the ones set here. */
        void merge(const ConfigurationValues& other);

        /** Write the values that are set in the context. */
        void apply(Context& ctx) const;
    };

    /** Names of the keys accepted in configuration files. */
    [[nodiscard]] auto configuration_keys() -> const std::vector<std::string>&;

    /**
     * The configuration files loaded when none is given explicitly, lowest precedence first.
     */
    [[nodiscard]] auto default_rc_files() -> std::vector<fs::path>;

    /**
     * Read the values of a YAML mapping.
     *
     * ``source`` names the origin of the node in error messages.
     * Unknown keys are reported as warnings, invalid values as ``incorrect_usage`` errors.
     */
    [[nodiscard]] auto values_from_yaml(const YAML::Node& node, std::string_view source)
        -> expected_t<ConfigurationValues>;

    /**
     * Read a configuration file, environment variables in values are expanded.
     */
    [[nodiscard]] auto load_rc_file(const fs::path& file) -> expected_t<ConfigurationValues>;

    /**
     * Read the ``PYEMBED_*`` environment variables.
     */
    [[nodiscard]] auto values_from_env() -> expected_t<ConfigurationValues>;

    /**
     * Configure the context from all sources.
     *
     * From lowest to highest precedence: the values already in the context, the
     * configuration files (unless ``src_params.no_rc``), the environment (unless
     * ``src_params.no_env``) and ``cli_values``.
     * Missing default configuration files are ignored, a missing file from
     * ``src_params.rc_files`` is an error.
     */
    auto load_configuration(Context& ctx, const ConfigurationValues& cli_values) -> expected_t<void>;

    namespace detail
    {
        /** Replace ``$VAR`` and ``${VAR}`` by the value of defined environment variables. */
        [[nodiscard]] auto expandvars(std::string s) -> std::string;
    }
}

namespace YAML
{
    template <>
    struct convert<pyembed::specs::PythonVersion>
    {
        static Node encode(const pyembed::specs::PythonVersion& rhs)
        {
            return Node(rhs.to_string());
        }

        static bool decode(const Node& node, pyembed::specs::PythonVersion& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }

            auto version = pyembed::specs::PythonVersion::parse(node.Scalar());
            if (!version)
            {
                return false;
            }
            rhs = version.value();
            return true;
        }
    };

    template <>
    struct convert<pyembed::specs::EmbedArch>
    {
        static Node encode(const pyembed::specs::EmbedArch& rhs)
        {
            return Node(std::string(pyembed::specs::arch_name(rhs)));
        }

        static bool decode(const Node& node, pyembed::specs::EmbedArch& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }

            auto arch = pyembed::specs::parse_embed_arch(node.Scalar());
            if (!arch)
            {
                return false;
            }
            rhs = arch.value();
            return true;
        }
    };

    template <>
    struct convert<pyembed::log_level>
    {
        static Node encode(const pyembed::log_level& rhs)
        {
            return Node(pyembed::name_of(rhs));
        }

        static bool decode(const Node& node, pyembed::log_level& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }

            auto level = pyembed::log_level_from_name(node.Scalar());
            if (!level)
            {
                return false;
            }
            rhs = level.value();
            return true;
        }
    };

    template <>
    struct convert<pyembed::fs::path>
    {
        static Node encode(const pyembed::fs::path& rhs)
        {
            return Node(rhs.string());
        }

        static bool decode(const Node& node, pyembed::fs::path& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }

            rhs = pyembed::fs::path(node.as<std::string>());
            return true;
        }
    };
}

#endif
