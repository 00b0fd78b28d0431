#ifndef PRERENDER_CORE_ERROR_CODES_H
#define PRERENDER_CORE_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace prerender {

/**
 * @brief Error codes for the pre-render daemon.
 *
 * Categories use upper 12 bits (0xF000 mask):
 * - 0x1xxx: Catalog / track selection
 * - 0x2xxx: Media fetch
 * - 0x3xxx: Render / probe
 * - 0x4xxx: Storage / eviction / recovery
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Catalog (0x1000)
    CATALOG_EMPTY = 0x1001,
    CATALOG_SOURCE_UNREADABLE = 0x1002,
    CATALOG_NO_PLAYABLE_ENTRY = 0x1003,

    // Fetch (0x2000)
    FETCH_NETWORK = 0x2001,
    FETCH_NOT_FOUND = 0x2002,
    FETCH_ARCHIVE = 0x2003,

    // Render (0x3000)
    RENDER_FAILED = 0x3001,
    RENDER_PROBE_FAILED = 0x3002,
    RENDER_TRACK_REJECTED = 0x3003,

    // Storage (0x4000)
    STORAGE_UNAVAILABLE = 0x4001,
    EVICTION_IO = 0x4002,
    RECOVERY_CORRUPT_FILE = 0x4003,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_FILE_NOT_FOUND = 0x5002,
    VALIDATION_INSTANCE_LOCKED = 0x5003,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "FETCH_NETWORK"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "fetch"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x2001")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "CATALOG_EMPTY")
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isCatalogError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isFetchError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isRenderError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isStorageError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if error only concerns the current track.
 *
 * Per-track errors are logged, the candidate is discarded and the render
 * loop goes back to selection:
 * - CATALOG_NO_PLAYABLE_ENTRY
 * - FETCH_*
 * - RENDER_*
 */
constexpr bool isPerTrackError(ErrorCode code) {
    return code == ErrorCode::CATALOG_NO_PLAYABLE_ENTRY || isFetchError(code) ||
           isRenderError(code);
}

/**
 * @brief Check if error must terminate the process.
 *
 * The supervisor restarts the daemon; nothing retries these internally.
 */
constexpr bool isFatal(ErrorCode code) {
    return code == ErrorCode::CATALOG_EMPTY || code == ErrorCode::CATALOG_SOURCE_UNREADABLE ||
           code == ErrorCode::STORAGE_UNAVAILABLE || code == ErrorCode::EVICTION_IO ||
           isValidationError(code);
}

}  // namespace prerender

#endif  // PRERENDER_CORE_ERROR_CODES_H
