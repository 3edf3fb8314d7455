#pragma once

// =============================================================================
/// @file config.hpp
/// @brief OOC Build Configuration Header
///
/// This header provides the platform check, version information and the
/// optional feature flags that the build system sets for the OOC
/// (out-of-core tabular) engine.
///
/// @section Feature Flags
///
/// Flags are defined by CMake on the `ooc` target and propagate to every
/// consumer:
/// - `OOC_HAS_ZSTD`: chunk blocks may be compressed with zstd
///
/// Runtime options (storage root, codec choice, memory budgets) are not
/// compile-time settings; they are passed as values, see
/// `ooc/core/config.hpp`.
///
/// =============================================================================

// =============================================================================
// SECTION 1: Platform
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #error "OOC requires a POSIX platform (pread, O_EXCL lock files)"
#endif

// =============================================================================
// SECTION 2: Version
// =============================================================================

#define OOC_VERSION_STRING "0.3.0"

// =============================================================================
// SECTION 3: Optional Features
// =============================================================================

/// @brief zstd block compression (set by the build when libzstd is found)
#ifndef OOC_HAS_ZSTD
    #define OOC_HAS_ZSTD 0
#endif

namespace ooc {

/// @brief Whether this build can read and write zstd-compressed chunks
inline constexpr bool kHasZstd = (OOC_HAS_ZSTD != 0);

} // namespace ooc
