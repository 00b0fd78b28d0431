#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace prerender {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Catalog
    {ErrorCode::CATALOG_EMPTY, "CATALOG_EMPTY"},
    {ErrorCode::CATALOG_SOURCE_UNREADABLE, "CATALOG_SOURCE_UNREADABLE"},
    {ErrorCode::CATALOG_NO_PLAYABLE_ENTRY, "CATALOG_NO_PLAYABLE_ENTRY"},

    // Fetch
    {ErrorCode::FETCH_NETWORK, "FETCH_NETWORK"},
    {ErrorCode::FETCH_NOT_FOUND, "FETCH_NOT_FOUND"},
    {ErrorCode::FETCH_ARCHIVE, "FETCH_ARCHIVE"},

    // Render
    {ErrorCode::RENDER_FAILED, "RENDER_FAILED"},
    {ErrorCode::RENDER_PROBE_FAILED, "RENDER_PROBE_FAILED"},
    {ErrorCode::RENDER_TRACK_REJECTED, "RENDER_TRACK_REJECTED"},

    // Storage
    {ErrorCode::STORAGE_UNAVAILABLE, "STORAGE_UNAVAILABLE"},
    {ErrorCode::EVICTION_IO, "EVICTION_IO"},
    {ErrorCode::RECOVERY_CORRUPT_FILE, "RECOVERY_CORRUPT_FILE"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},
    {ErrorCode::VALIDATION_INSTANCE_LOCKED, "VALIDATION_INSTANCE_LOCKED"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& [code, name] : kErrorCodeStrings) {
        reverse.emplace(name, code);
    }
    return reverse;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isCatalogError(code)) {
        return "catalog";
    }
    if (isFetchError(code)) {
        return "fetch";
    }
    if (isRenderError(code)) {
        return "render";
    }
    if (isStorageError(code)) {
        return "storage";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace prerender
