// Copyright (c) 2022, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_CORE_ERROR_HANDLING_HPP
#define PYEMBED_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace pyembed
{

    /***********************
     * pyembed exceptions *
     ***********************/

    enum class pyembed_error_code
    {
        unknown,
        internal_failure,
        incorrect_usage,
        interpreter_not_found,
        unparseable_version,
        download_failed,
        extraction_failed,
        copy_libs_failed,
        install_failed,
    };

    /**
     * Name of the pipeline step an error code is reported for.
     */
    [[nodiscard]] auto step_name(pyembed_error_code ec) noexcept -> std::string_view;

    class pyembed_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        pyembed_error(const std::string& msg, pyembed_error_code ec);
        pyembed_error(const char* msg, pyembed_error_code ec);

        pyembed_error_code error_code() const noexcept;

    private:

        pyembed_error_code m_error_code;
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = pyembed_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<pyembed_error> make_unexpected(const char* msg, pyembed_error_code ec);

    tl::unexpected<pyembed_error> make_unexpected(const std::string& msg, pyembed_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }

}

#endif
