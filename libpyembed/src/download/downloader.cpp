// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdio>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include "pyembed/core/logging.hpp"
#include "pyembed/core/util.hpp"
#include "pyembed/download/downloader.hpp"
#include "pyembed/fs/filesystem.hpp"
#include "pyembed/util/cfile.hpp"
#include "pyembed/util/string.hpp"

#include "curl.hpp"

namespace pyembed::download
{
    namespace
    {
        struct CURLSetup
        {
            CURLSetup()
            {
                if (curl_global_init(CURL_GLOBAL_ALL) != 0)
                {
                    throw std::runtime_error("failed to initialize curl");
                }
            }

            ~CURLSetup()
            {
                curl_global_cleanup();
            }
        };

        void ensure_curl_initialized()
        {
            static CURLSetup curl_setup;
        }

        int
        curl_debug_to_logs(CURL* /* handle */, curl_infotype type, char* data, size_t size, void* /* userptr */)
        {
            auto log = hide_secrets(util::rstrip(std::string_view(data, size)));
            auto emit = [](std::string message)
            {
                logging::log({
                    .message = std::move(message),
                    .level = log_level::debug,
                    .source = log_source::libcurl,
                });
            };
            switch (type)
            {
                case CURLINFO_TEXT:
                    emit(fmt::format("* {}", log));
                    break;
                case CURLINFO_HEADER_OUT:
                    emit(fmt::format("> {}", log));
                    break;
                case CURLINFO_HEADER_IN:
                    emit(fmt::format("< {}", log));
                    break;
                default:
                    break;
            }
            return 0;
        }

        auto open_download_file(const fs::path& filename) -> util::CFile
        {
            auto file = util::CFile::try_open(filename, "wb");
            if (!file)
            {
                throw std::runtime_error(fmt::format(
                    "Could not open file for download {}: {}",
                    util::path_to_utf8(filename),
                    file.error().message()
                ));
            }
            return std::move(file).value();
        }

        std::string
        build_transfer_message(int http_status, const std::string& effective_url, std::size_t size)
        {
            std::stringstream ss;
            ss << "Transfer finalized, status: " << http_status << " [" << effective_url << "] "
               << size << " bytes";
            return ss.str();
        }

        /**
         * One transfer of a request into its file.
         *
         * The output file is opened before the transfer starts so that an empty body still
         * produces an (empty) file.
         */
        class DownloadAttempt
        {
        public:

            DownloadAttempt(const Request& request, const RemoteFetchParams& params, Options options);

            auto run() -> Result;

        private:

            const Request* p_request;
            CURLHandle m_handle;
            util::CFile m_file;

            static size_t curl_write_callback(char* buffer, size_t size, size_t nitems, void* self);

            size_t write_data(char* buffer, size_t size);

            void configure_handle(const RemoteFetchParams& params, Options options);
            void clean_attempt(bool erase_downloaded);

            TransferData get_transfer_data() const;
            Error build_download_error(CURLcode code) const;
            Error build_download_error(TransferData data) const;
        };

        DownloadAttempt::DownloadAttempt(
            const Request& request,
            const RemoteFetchParams& params,
            Options options
        )
            : p_request(&request)
            , m_file(open_download_file(request.filename))
        {
            configure_handle(params, options);
        }

        auto DownloadAttempt::run() -> Result
        {
            LOG_INFO << "Downloading " << p_request->name << " from "
                     << hide_secrets(p_request->url);

            const CURLcode code = m_handle.perform();
            if (!CURLHandle::is_curl_res_ok(code))
            {
                Error error = build_download_error(code);
                clean_attempt(true);
                return tl::make_unexpected(std::move(error));
            }

            TransferData data = get_transfer_data();
            if (!is_http_status_ok(data.http_status))
            {
                Error error = build_download_error(std::move(data));
                clean_attempt(true);
                return tl::make_unexpected(std::move(error));
            }

            if (auto closed = m_file.try_close(); !closed)
            {
                Error error{
                    .message = fmt::format(
                        "Could not write {}: {}",
                        util::path_to_utf8(p_request->filename),
                        closed.error().message()
                    ),
                    .transfer = std::move(data),
                };
                clean_attempt(true);
                return tl::make_unexpected(std::move(error));
            }

            LOG_INFO << build_transfer_message(
                data.http_status,
                hide_secrets(data.effective_url),
                data.downloaded_size
            );
            return Success{
                .filename = p_request->filename,
                .transfer = std::move(data),
            };
        }

        void DownloadAttempt::configure_handle(const RemoteFetchParams& params, Options options)
        {
            m_handle.configure_handle(
                p_request->url,
                params.connect_timeout_secs,
                params.ssl_no_revoke,
                params.proxy.empty() ? std::nullopt : std::make_optional(params.proxy),
                params.ssl_verify
            );

            m_handle.set_opt(CURLOPT_WRITEFUNCTION, &DownloadAttempt::curl_write_callback);
            m_handle.set_opt(CURLOPT_WRITEDATA, this);

            m_handle.set_opt(CURLOPT_VERBOSE, options.verbose);
            m_handle.set_opt(CURLOPT_DEBUGFUNCTION, curl_debug_to_logs);

            m_handle.reset_headers();
            m_handle.add_header(fmt::format("User-Agent: {}", user_agent(params)));
            m_handle.set_opt_header();
        }

        size_t DownloadAttempt::curl_write_callback(char* buffer, size_t size, size_t nitems, void* self)
        {
            return static_cast<DownloadAttempt*>(self)->write_data(buffer, size * nitems);
        }

        size_t DownloadAttempt::write_data(char* buffer, size_t size)
        {
            const auto written = std::fwrite(buffer, 1, size, m_file.raw());
            if (written != size)
            {
                LOG_ERROR << "Could not write to file " << util::path_to_utf8(p_request->filename);
                // Return a size _different_ than the expected write size to signal an error
                return size + 1;
            }
            return size;
        }

        void DownloadAttempt::clean_attempt(bool erase_downloaded)
        {
            if (m_file.is_open())
            {
                std::error_code ec;
                m_file.try_close(ec);
            }
            if (erase_downloaded)
            {
                std::error_code ec;
                fs::remove(p_request->filename, ec);
                if (ec)
                {
                    LOG_WARNING << "Could not remove partial download " << util::path_to_utf8(p_request->filename)
                                << ": " << ec.message();
                }
            }
        }

        TransferData DownloadAttempt::get_transfer_data() const
        {
            // Curl transforms file URI like file:///C/something into file://C/something.
            // There is no redirection on file URIs so the input URL is used instead.
            std::string url = util::starts_with(p_request->url, "file://")
                                  ? p_request->url
                                  : m_handle.get_curl_effective_url();
            return {
                /* .http_status = */ m_handle.get_info<int>(CURLINFO_RESPONSE_CODE).value_or(0),
                /* .effective_url = */ std::move(url),
                /* .downloaded_size = */
                m_handle.get_info<std::size_t>(CURLINFO_SIZE_DOWNLOAD_T).value_or(0),
                /* .average_speed = */
                m_handle.get_info<std::size_t>(CURLINFO_SPEED_DOWNLOAD_T).value_or(0),
            };
        }

        Error DownloadAttempt::build_download_error(CURLcode code) const
        {
            Error error;
            std::stringstream strerr;
            strerr << "Download error (" << code << ") " << CURLHandle::get_res_error(code) << " ["
                   << hide_secrets(p_request->url) << "]";
            if (const std::string_view details = m_handle.get_error_buffer(); !details.empty())
            {
                strerr << " " << details;
            }
            error.message = strerr.str();
            return error;
        }

        Error DownloadAttempt::build_download_error(TransferData data) const
        {
            Error error;
            error.message = build_transfer_message(
                data.http_status,
                hide_secrets(data.effective_url),
                data.downloaded_size
            );
            error.transfer = std::move(data);
            return error;
        }
    }

    bool is_http_status_ok(int http_status)
    {
        // Note: http_status == 0 for files
        return http_status / 100 == 2 || http_status == 0;
    }

    std::string user_agent(const RemoteFetchParams& params)
    {
        return fmt::format("{} {}", params.user_agent, curl_version());
    }

    Result download(const Request& request, const RemoteFetchParams& params, Options options)
    {
        try
        {
            ensure_curl_initialized();
            DownloadAttempt attempt(request, params, options);
            return attempt.run();
        }
        catch (const curl_error& e)
        {
            // The handle is configured once the output file is created.
            std::error_code ec;
            fs::remove(request.filename, ec);
            return tl::make_unexpected(Error{ .message = e.what() });
        }
        catch (const std::runtime_error& e)
        {
            // Curl initialization or output file creation failure
            return tl::make_unexpected(Error{ .message = e.what() });
        }
    }
}
