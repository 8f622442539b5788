// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                       return "NONE";

        case ErrorCode::PARSE_ERROR:                return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:             return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT:           return "PARSE_BAD_FORMAT";

        case ErrorCode::INVALID_PARAMETERS:         return "INVALID_PARAMETERS";
        case ErrorCode::AMOUNT_OVERFLOW:            return "AMOUNT_OVERFLOW";
        case ErrorCode::CONTRIBUTION_OUT_OF_BOUNDS: return "CONTRIBUTION_OUT_OF_BOUNDS";

        case ErrorCode::CAMPAIGN_NOT_FOUND:         return "CAMPAIGN_NOT_FOUND";
        case ErrorCode::CAMPAIGN_CLOSED:            return "CAMPAIGN_CLOSED";
        case ErrorCode::DEADLINE_PASSED:            return "DEADLINE_PASSED";
        case ErrorCode::REFUNDS_UNAVAILABLE:        return "REFUNDS_UNAVAILABLE";
        case ErrorCode::NO_CONTRIBUTION:            return "NO_CONTRIBUTION";
        case ErrorCode::NO_EXCESS:                  return "NO_EXCESS";

        case ErrorCode::WITHDRAWAL_LIMIT_EXCEEDED:  return "WITHDRAWAL_LIMIT_EXCEEDED";
        case ErrorCode::INTERVAL_NOT_ELAPSED:       return "INTERVAL_NOT_ELAPSED";
        case ErrorCode::INSUFFICIENT_FUNDS:         return "INSUFFICIENT_FUNDS";

        case ErrorCode::UNAUTHORIZED:               return "UNAUTHORIZED";
        case ErrorCode::PAUSED:                     return "PAUSED";

        case ErrorCode::TRANSFER_FAILED:            return "TRANSFER_FAILED";

        case ErrorCode::STORAGE_ERROR:              return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND:          return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_CORRUPT:            return "STORAGE_CORRUPT";

        case ErrorCode::CRYPTO_ERROR:               return "CRYPTO_ERROR";

        case ErrorCode::INTERNAL_ERROR:             return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line() << ']';
    }

    return oss.str();
}

} // namespace core
