// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/error.hpp>

namespace fetchr::core {

std::string TransferError::message() const {
    std::string result = code.message();
    if (segment_count == 0) {
        return result;
    }

    result += ": ";
    if (failed_segments.empty()) {
        // Every segment was fetched; what failed came after
        result += std::to_string(preserved_bytes);
        result += " of ";
        result += std::to_string(total_bytes);
        result += " bytes in segment artifacts";
        return result;
    }
    result += std::to_string(failed_segments.size());
    result += "/";
    result += std::to_string(segment_count);
    result += " segments missing, ";
    result += std::to_string(preserved_bytes);
    result += " of ";
    result += std::to_string(total_bytes);
    result += " bytes preserved";
    if (code != DownloadErrc::range_unsupported) {
        result += ", re-run to resume";
    }
    return result;
}

} // namespace fetchr::core
