// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>

#include "pyembed/core/logging.hpp"
#include "pyembed/core/package_handling.hpp"
#include "pyembed/core/util.hpp"
#include "pyembed/core/util_scope.hpp"
#include "pyembed/fs/filesystem.hpp"

namespace pyembed
{
    namespace
    {
        class scoped_archive_read : non_copyable_base
        {
        public:

            scoped_archive_read()
                : m_archive(archive_read_new())
            {
                if (!m_archive)
                {
                    throw std::runtime_error("Could not create libarchive read object");
                }
            }

            ~scoped_archive_read()
            {
                archive_read_free(m_archive);
            }

            operator archive*()
            {
                return m_archive;
            }

        private:

            archive* m_archive;
        };

        class scoped_archive_write : non_copyable_base
        {
        public:

            static scoped_archive_write write_disk()
            {
                return scoped_archive_write(archive_write_disk_new());
            }

            ~scoped_archive_write()
            {
                archive_write_free(m_archive);
            }

            operator archive*()
            {
                return m_archive;
            }

        private:

            explicit scoped_archive_write(archive* a)
                : m_archive(a)
            {
                if (!m_archive)
                {
                    throw std::runtime_error("Could not create libarchive write object");
                }
            }

            archive* m_archive;
        };

        auto error_string(archive* a) -> const char*
        {
            const char* err_str = archive_error_string(a);
            return err_str ? err_str : "unknown libarchive error";
        }

        int copy_data(scoped_archive_read& ar, scoped_archive_write& aw)
        {
            int r = 0;
            const void* buff = nullptr;
            std::size_t size = 0;
            la_int64_t offset = 0;

            while (true)
            {
                r = archive_read_data_block(ar, &buff, &size, &offset);
                if (r == ARCHIVE_EOF)
                {
                    return ARCHIVE_OK;
                }
                if (r < ARCHIVE_OK)
                {
                    throw std::runtime_error(error_string(ar));
                }
                r = static_cast<int>(archive_write_data_block(aw, buff, size, offset));
                if (r < ARCHIVE_OK)
                {
                    throw std::runtime_error(error_string(aw));
                }
            }
        }

        void stream_extract_archive(scoped_archive_read& a, const fs::path& destination)
        {
            const auto prev_path = fs::current_path();
            if (!fs::exists(destination))
            {
                fs::create_directories(destination);
            }
            fs::current_path(destination);
            on_scope_exit restore_cwd{ [&prev_path] { fs::current_path(prev_path); } };

            /* Select which attributes we want to restore. */
            int flags = ARCHIVE_EXTRACT_TIME;
            flags |= ARCHIVE_EXTRACT_PERM;
            flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
            flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
            flags |= ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS;
            flags |= ARCHIVE_EXTRACT_UNLINK;

            scoped_archive_write ext = scoped_archive_write::write_disk();
            archive_write_disk_set_options(ext, flags);
            archive_write_disk_set_standard_lookup(ext);

            int r;
            archive_entry* entry;
            std::size_t n_entries = 0;
            for (;;)
            {
                r = archive_read_next_header(a, &entry);
                if (r == ARCHIVE_EOF)
                {
                    break;
                }
                if (r < ARCHIVE_OK)
                {
                    throw std::runtime_error(error_string(a));
                }

                LOG_TRACE << "Extracting " << archive_entry_pathname(entry);

                r = archive_write_header(ext, entry);
                if (r < ARCHIVE_OK)
                {
                    throw std::runtime_error(error_string(ext));
                }
                else if (archive_entry_size(entry) > 0)
                {
                    copy_data(a, ext);
                }
                r = archive_write_finish_entry(ext);
                if (r == ARCHIVE_WARN)
                {
                    LOG_WARNING << "libarchive warning: " << error_string(ext);
                }
                else if (r < ARCHIVE_OK)
                {
                    throw std::runtime_error(error_string(ext));
                }
                ++n_entries;
            }
            LOG_DEBUG << "Extracted " << n_entries << " entries";
        }

        void extract_archive_impl(const fs::path& file, const fs::path& destination)
        {
            scoped_archive_read a;
            archive_read_support_format_tar(a);
            archive_read_support_format_zip(a);
            archive_read_support_filter_all(a);

#ifdef _WIN32
            const int r = archive_read_open_filename_w(a, file.wstring().c_str(), 10240);
#else
            const int r = archive_read_open_filename(a, file.string().c_str(), 10240);
#endif
            if (r != ARCHIVE_OK)
            {
                LOG_ERROR << "Error opening archive: " << error_string(a);
                throw std::runtime_error(util::path_to_utf8(file) + " : Could not open archive for reading.");
            }

            stream_extract_archive(a, destination);
        }
    }

    auto extract_archive(const fs::path& file, const fs::path& destination) -> expected_t<void>
    {
        LOG_INFO << "Extracting " << util::path_to_utf8(file) << " to " << util::path_to_utf8(destination);

        // The working directory is changed during extraction, relative paths must not
        // be resolved against the destination.
        std::error_code ec;
        const auto abs_file = fs::absolute(file, ec);
        const auto abs_destination = ec ? destination : fs::absolute(destination, ec);
        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not resolve extraction paths: {}", ec.message()),
                pyembed_error_code::extraction_failed
            );
        }

        try
        {
            extract_archive_impl(abs_file, abs_destination);
        }
        catch (const std::exception& e)
        {
            return make_unexpected(
                fmt::format("Could not extract {} into {}: {}", util::path_to_utf8(file), util::path_to_utf8(destination), e.what()),
                pyembed_error_code::extraction_failed
            );
        }
        return {};
    }
}
