// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fetchr::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    invalid_range,
    invalid_config,
    unexpected_status,
    short_read,
    range_unsupported,
    segment_failed,
    transfer_failed,
    assembly_failed,
    size_mismatch,
    resolve_failed,
    engine_failed,
    cancelled,
    ssl_error,
    dns_error,
    too_many_redirects,
    invalid_filename,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "fetchr::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::invalid_config:       return "Invalid configuration";
            case DownloadErrc::unexpected_status:    return "Unexpected HTTP status";
            case DownloadErrc::short_read:           return "Response body shorter than requested range";
            case DownloadErrc::range_unsupported:    return "Server does not honor byte ranges";
            case DownloadErrc::segment_failed:       return "Segment failed after all retries";
            case DownloadErrc::transfer_failed:      return "Transfer incomplete, progress preserved for resume";
            case DownloadErrc::assembly_failed:      return "Segment assembly failed";
            case DownloadErrc::size_mismatch:        return "File size mismatch";
            case DownloadErrc::resolve_failed:       return "Could not resolve resource";
            case DownloadErrc::engine_failed:        return "External download engine failed";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::invalid_filename:     return "Filename would leave the target directory";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Outcome of a whole-resource transfer that did not produce a final file.
// Everything listed in preserved_bytes is on disk and a re-run resumes from it.
struct TransferError {
    std::error_code code;
    std::vector<std::uint32_t> failed_segments;
    std::uint64_t preserved_bytes{0};
    std::uint64_t total_bytes{0};
    std::uint32_t segment_count{0};

    TransferError() = default;
    TransferError(std::error_code ec) noexcept : code(ec) {}  // NOLINT(google-explicit-constructor)

    [[nodiscard]] std::string message() const;
};

} // namespace fetchr::core

namespace std {

template<>
struct is_error_code_enum<fetchr::core::DownloadErrc> : true_type {};

} // namespace std
