// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <regex>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "pyembed/api/configuration.hpp"
#include "pyembed/core/context.hpp"
#include "pyembed/core/util.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/util/environment.hpp"
#include "pyembed/util/string.hpp"

namespace pyembed
{
    /***********************
     * ConfigurationValues *
     ***********************/

    namespace
    {
        template <typename T>
        void merge_value(std::optional<T>& into, const std::optional<T>& from)
        {
            if (from.has_value())
            {
                into = from;
            }
        }

        template <typename T>
        void apply_value(const std::optional<T>& from, T& into)
        {
            if (from.has_value())
            {
                into = from.value();
            }
        }
    }

    void ConfigurationValues::merge(const ConfigurationValues& other)
    {
        merge_value(python, other.python);
        merge_value(python_version, other.python_version);
        merge_value(arch, other.arch);
        merge_value(base_url, other.base_url);
        merge_value(get_pip_url, other.get_pip_url);
        merge_value(installer_path, other.installer_path);
        merge_value(enable_site, other.enable_site);
        merge_value(bootstrap_pip, other.bootstrap_pip);
        merge_value(copy_host_libs, other.copy_host_libs);
        merge_value(pip_args, other.pip_args);
        merge_value(ssl_verify, other.ssl_verify);
        merge_value(ssl_no_revoke, other.ssl_no_revoke);
        merge_value(proxy, other.proxy);
        merge_value(connect_timeout_secs, other.connect_timeout_secs);
        merge_value(logging_level, other.logging_level);
    }

    void ConfigurationValues::apply(Context& ctx) const
    {
        apply_value(python, ctx.interpreter_params.python_exe);
        if (python_version.has_value())
        {
            ctx.interpreter_params.python_version = python_version;
        }

        apply_value(arch, ctx.distribution_params.arch);
        apply_value(base_url, ctx.distribution_params.base_url);
        apply_value(get_pip_url, ctx.distribution_params.get_pip_url);

        apply_value(installer_path, ctx.install_params.installer_path);
        apply_value(enable_site, ctx.install_params.enable_site);
        apply_value(bootstrap_pip, ctx.install_params.bootstrap_pip);
        apply_value(copy_host_libs, ctx.install_params.copy_host_libs);
        apply_value(pip_args, ctx.install_params.pip_args);

        apply_value(ssl_verify, ctx.remote_fetch_params.ssl_verify);
        apply_value(ssl_no_revoke, ctx.remote_fetch_params.ssl_no_revoke);
        apply_value(proxy, ctx.remote_fetch_params.proxy);
        apply_value(connect_timeout_secs, ctx.remote_fetch_params.connect_timeout_secs);

        if (logging_level.has_value())
        {
            ctx.set_log_level(logging_level.value());
        }
    }

    /*********
     * Files *
     *********/

    auto configuration_keys() -> const std::vector<std::string>&
    {
        static const std::vector<std::string> keys = {
            "python",        "python_version",  "arch",           "base_url",
            "get_pip_url",   "installer_path",  "enable_site",    "bootstrap_pip",
            "copy_host_libs", "pip_args",       "ssl_verify",     "ssl_no_revoke",
            "proxy",         "connect_timeout_secs", "log_level",
        };
        return keys;
    }

    auto default_rc_files() -> std::vector<fs::path>
    {
        return {
            fs::path(util::user_config_dir()) / "pyembed" / "pyembedrc",
            fs::path(util::user_home_dir()) / ".pyembedrc",
        };
    }

    namespace detail
    {
        auto expandvars(std::string s) -> std::string
        {
            if (s.find("$") == std::string::npos)
            {
                // Bail out early
                return s;
            }
            std::regex env_var_re(R"(\$(\{\w+\}|\w+))");
            for (auto matches = std::sregex_iterator(s.begin(), s.end(), env_var_re);
                 matches != std::sregex_iterator();
                 ++matches)
            {
                std::smatch match = *matches;
                auto var = match[0].str();
                if (util::starts_with(var, "${"))
                {
                    // strip ${ and }
                    var = var.substr(2, var.size() - 3);
                }
                else
                {
                    // strip $
                    var = var.substr(1);
                }
                auto val = util::get_env(var);
                if (val)
                {
                    s.replace(match[0].first, match[0].second, val.value());
                    // Modifying the string invalidates the iterator, start a new search.
                    return expandvars(s);
                }
            }
            return s;
        }
    }

    namespace
    {
        template <typename T>
        void read_key(
            const YAML::Node& node,
            std::string_view key,
            std::string_view source,
            std::optional<T>& out
        )
        {
            const auto value = node[std::string(key)];
            if (!value || value.IsNull())
            {
                return;
            }
            try
            {
                out = value.as<T>();
            }
            catch (const YAML::Exception& e)
            {
                throw pyembed_error(
                    fmt::format("Invalid value for '{}' in {}: {}", key, source, e.msg),
                    pyembed_error_code::incorrect_usage
                );
            }
        }
    }

    auto values_from_yaml(const YAML::Node& node, std::string_view source)
        -> expected_t<ConfigurationValues>
    {
        ConfigurationValues values;
        if (!node || node.IsNull())
        {
            return values;
        }
        if (!node.IsMap())
        {
            return make_unexpected(
                fmt::format("Configuration in {} is not a mapping", source),
                pyembed_error_code::incorrect_usage
            );
        }

        const auto& keys = configuration_keys();
        for (const auto& item : node)
        {
            const auto key = item.first.as<std::string>();
            if (std::find(keys.cbegin(), keys.cend(), key) == keys.cend())
            {
                LOG_WARNING << fmt::format("Unknown configuration key '{}' in {}", key, source);
            }
        }

        try
        {
            read_key(node, "python", source, values.python);
            read_key(node, "python_version", source, values.python_version);
            read_key(node, "arch", source, values.arch);
            read_key(node, "base_url", source, values.base_url);
            read_key(node, "get_pip_url", source, values.get_pip_url);
            read_key(node, "installer_path", source, values.installer_path);
            read_key(node, "enable_site", source, values.enable_site);
            read_key(node, "bootstrap_pip", source, values.bootstrap_pip);
            read_key(node, "copy_host_libs", source, values.copy_host_libs);
            read_key(node, "pip_args", source, values.pip_args);
            read_key(node, "ssl_verify", source, values.ssl_verify);
            read_key(node, "ssl_no_revoke", source, values.ssl_no_revoke);
            read_key(node, "proxy", source, values.proxy);
            read_key(node, "connect_timeout_secs", source, values.connect_timeout_secs);
            read_key(node, "log_level", source, values.logging_level);
        }
        catch (const pyembed_error& e)
        {
            return tl::make_unexpected(e);
        }
        return values;
    }

    auto load_rc_file(const fs::path& file) -> expected_t<ConfigurationValues>
    {
        YAML::Node config;
        try
        {
            config = YAML::Load(detail::expandvars(read_contents(file, std::ios::in)));
        }
        catch (const YAML::Exception& ex)
        {
            return make_unexpected(
                fmt::format("Error in file {}: {}", util::path_to_utf8(file), ex.what()),
                pyembed_error_code::incorrect_usage
            );
        }
        catch (const std::system_error& ex)
        {
            return make_unexpected(
                fmt::format("Could not read configuration file {}: {}", util::path_to_utf8(file), ex.what()),
                pyembed_error_code::incorrect_usage
            );
        }
        return values_from_yaml(config, util::path_to_utf8(file));
    }

    auto values_from_env() -> expected_t<ConfigurationValues>
    {
        static const std::vector<std::pair<std::string, std::string>> env_keys = {
            { "PYEMBED_PYTHON", "python" },
            { "PYEMBED_PYTHON_VERSION", "python_version" },
            { "PYEMBED_ARCH", "arch" },
            { "PYEMBED_BASE_URL", "base_url" },
            { "PYEMBED_GET_PIP_URL", "get_pip_url" },
            { "PYEMBED_SSL_VERIFY", "ssl_verify" },
            { "PYEMBED_PROXY", "proxy" },
            { "PYEMBED_LOG_LEVEL", "log_level" },
        };

        YAML::Node node(YAML::NodeType::Map);
        for (const auto& [var, key] : env_keys)
        {
            if (auto val = util::get_env(var); val.has_value())
            {
                LOG_DEBUG << "Configuration key '" << key << "' set by " << var;
                node[key] = val.value();
            }
        }
        return values_from_yaml(node, "environment variables");
    }

    auto load_configuration(Context& ctx, const ConfigurationValues& cli_values) -> expected_t<void>
    {
        ConfigurationValues values;

        if (!ctx.src_params.no_rc)
        {
            for (const auto& file : default_rc_files())
            {
                std::error_code ec;
                if (!fs::exists(file, ec))
                {
                    LOG_TRACE << "No configuration file at " << util::path_to_utf8(file);
                    continue;
                }
                LOG_DEBUG << "Loading configuration file " << util::path_to_utf8(file);
                auto file_values = load_rc_file(file);
                if (!file_values)
                {
                    return forward_error(file_values);
                }
                values.merge(file_values.value());
            }

            for (const auto& file : ctx.src_params.rc_files)
            {
                std::error_code ec;
                if (!fs::exists(file, ec))
                {
                    return make_unexpected(
                        fmt::format("Configuration file {} does not exist", util::path_to_utf8(file)),
                        pyembed_error_code::incorrect_usage
                    );
                }
                LOG_DEBUG << "Loading configuration file " << util::path_to_utf8(file);
                auto file_values = load_rc_file(file);
                if (!file_values)
                {
                    return forward_error(file_values);
                }
                values.merge(file_values.value());
            }
        }

        if (!ctx.src_params.no_env)
        {
            auto env_values = values_from_env();
            if (!env_values)
            {
                return forward_error(env_values);
            }
            values.merge(env_values.value());
        }

        values.merge(cli_values);
        values.apply(ctx);
        return {};
    }
}
