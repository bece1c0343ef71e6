#pragma once

#include <cstdint>

// =============================================================================
/// @file config.hpp
/// @brief h5ds Configuration Header
///
/// Platform detection and compile-time defaults for the datastore.
///
/// @section Defaults
///
/// Every default below can be overridden from the build system with a
/// `-D` definition before this header is included:
/// - `H5DS_DEFAULT_SPLIT_SIZE`: maximum bytes per file split (8e9)
/// - `H5DS_DEFAULT_EXTENSION`: file extension scanned by the file set
/// - `H5DS_DEFAULT_LOG_LEVEL`: spdlog level name for the "h5ds" logger
/// - `H5DS_DEFAULT_ROOT`: directory opened when no root is given
///
/// =============================================================================

// =============================================================================
// SECTION 1: Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define H5DS_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define H5DS_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define H5DS_OS_LINUX
#else
    #define H5DS_OS_UNKNOWN
#endif

// =============================================================================
// SECTION 2: Version
// =============================================================================

#define H5DS_VERSION_MAJOR 1
#define H5DS_VERSION_MINOR 0
#define H5DS_VERSION_PATCH 0
#define H5DS_VERSION_STRING "1.0.0"

// =============================================================================
// SECTION 3: Datastore Defaults
// =============================================================================

#ifndef H5DS_DEFAULT_SPLIT_SIZE
    /// @brief Default split size in bytes
    #define H5DS_DEFAULT_SPLIT_SIZE 8000000000ULL
#endif

#ifndef H5DS_DEFAULT_EXTENSION
    /// @brief Default extension for file enumeration
    #define H5DS_DEFAULT_EXTENSION ".h5"
#endif

#ifndef H5DS_DEFAULT_LOG_LEVEL
    /// @brief Default logger level (spdlog level name)
    #define H5DS_DEFAULT_LOG_LEVEL "warn"
#endif

#ifndef H5DS_DEFAULT_ROOT
    /// @brief Root scanned by open_datastore() without arguments
    #define H5DS_DEFAULT_ROOT "."
#endif

#if H5DS_DEFAULT_SPLIT_SIZE == 0
    #error "h5ds Configuration Error: H5DS_DEFAULT_SPLIT_SIZE must be positive."
#endif

namespace h5ds::config {

constexpr std::uint64_t DEFAULT_SPLIT_SIZE = H5DS_DEFAULT_SPLIT_SIZE;
constexpr const char* DEFAULT_EXTENSION = H5DS_DEFAULT_EXTENSION;
constexpr const char* DEFAULT_LOG_LEVEL = H5DS_DEFAULT_LOG_LEVEL;
constexpr const char* DEFAULT_ROOT = H5DS_DEFAULT_ROOT;
constexpr std::uint32_t DEFAULT_DECIMATION = 1;

/// Environment variable consulted when the logger is first created
constexpr const char* LOG_LEVEL_ENV = "H5DS_LOG_LEVEL";

} // namespace h5ds::config
