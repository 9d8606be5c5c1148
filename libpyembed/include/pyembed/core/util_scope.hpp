// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_UTIL_SCOPE_HPP
#define PYEMBED_CORE_UTIL_SCOPE_HPP

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "pyembed/core/logging.hpp"

namespace pyembed
{

    template <typename F>
    struct on_scope_exit
    {
        F func;

        explicit on_scope_exit(F&& f)
            : func(std::forward<F>(f))
        {
        }

        ~on_scope_exit()
        {
            try
            {
                func();
            }
            catch (const std::exception& ex)
            {
                LOG_ERROR << fmt::format("Scope exit error (caught and ignored): {}", ex.what());
            }
            catch (...)
            {
                LOG_ERROR << "Scope exit unknown error (caught and ignored)";
            }
        }

        // Deactivate copy & move until we implement moves
        on_scope_exit(const on_scope_exit&) = delete;
        on_scope_exit& operator=(const on_scope_exit&) = delete;
        on_scope_exit(on_scope_exit&&) = delete;
        on_scope_exit& operator=(on_scope_exit&&) = delete;
    };
}

#endif
