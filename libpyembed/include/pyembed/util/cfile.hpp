// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYEMBED_UTIL_CFILE_HPP
#define PYEMBED_UTIL_CFILE_HPP

#include <cstdio>
#include <memory>
#include <system_error>

#include <tl/expected.hpp>

#include "pyembed/fs/filesystem.hpp"

namespace pyembed::util
{
    class CFile
    {
    public:

        /**
         * Open a file with C API.
         *
         * In case of error, set the error code @p ec.
         */
        static auto try_open(  //
            const fs::path& path,
            const char* mode,
            std::error_code& ec
        ) -> CFile;

        static auto try_open(  //
            const fs::path& path,
            const char* mode
        ) -> tl::expected<CFile, std::error_code>;

        CFile(CFile&&) = default;
        auto operator=(CFile&&) -> CFile& = default;

        /**
         * The destructor will flush and close the file descriptor.
         *
         * Like ``std::fstream``, exceptions are ignored.
         * Explicitly call @ref try_close to get the error.
         */
        ~CFile();

        void try_close(std::error_code& ec) noexcept;
        [[nodiscard]] auto try_close() noexcept -> tl::expected<void, std::error_code>;

        [[nodiscard]] auto is_open() const noexcept -> bool;

        auto raw() noexcept -> std::FILE*;

    private:

        struct FileClose
        {
            void operator()(std::FILE* ptr);
        };

        std::unique_ptr<std::FILE, FileClose> m_ptr = nullptr;

        explicit CFile(std::FILE* ptr);
    };
}
#endif
