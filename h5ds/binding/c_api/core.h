#pragma once

// =============================================================================
// FILE: h5ds/binding/c_api/core.h
// BRIEF: C ABI basics for h5ds: versions, error codes, last-error state
// =============================================================================
//
// ERROR MODEL:
//   - Every entry point returns h5ds_error_t (H5DS_OK on success)
//   - The message of the last failure is kept per thread and stays valid
//     until the next call on the same thread
//   - No entry point lets a C++ exception cross the boundary
//
// HANDLES:
//   - Opaque, created by *_create / *_read and released by *_destroy
//   - NULL is never a valid handle
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define H5DS_C_API_VERSION_MAJOR 1
#define H5DS_C_API_VERSION_MINOR 0
#define H5DS_C_API_VERSION_PATCH 0

#if defined(_MSC_VER)
    #define H5DS_C_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define H5DS_C_EXPORT __attribute__((visibility("default")))
#else
    #define H5DS_C_EXPORT
#endif

// Runtime version string, e.g. "1.0.0"
const char* h5ds_get_version(void);

// Version of the HDF5 library linked in, e.g. "1.10.8"
const char* h5ds_get_hdf5_version(void);

// =============================================================================
// Basic Types
// =============================================================================

typedef size_t h5ds_size_t;
typedef uint64_t h5ds_row_t;

typedef int h5ds_bool_t;
#define H5DS_TRUE 1
#define H5DS_FALSE 0

// =============================================================================
// Error Codes (match h5ds::ErrorCode)
// =============================================================================

typedef int32_t h5ds_error_t;

#define H5DS_OK 0

#define H5DS_ERROR_UNKNOWN 1
#define H5DS_ERROR_INTERNAL 2
#define H5DS_ERROR_OUT_OF_MEMORY 3
#define H5DS_ERROR_NULL_POINTER 4

#define H5DS_ERROR_INVALID_ARGUMENT 10
#define H5DS_ERROR_RANGE_ERROR 13

#define H5DS_ERROR_TYPE_ERROR 20
#define H5DS_ERROR_TYPE_MISMATCH 21

#define H5DS_ERROR_IO_ERROR 30
#define H5DS_ERROR_FILE_NOT_FOUND 31
#define H5DS_ERROR_READ_ERROR 33

#define H5DS_ERROR_SCHEMA 60
#define H5DS_ERROR_UNKNOWN_VARIABLE 61
#define H5DS_ERROR_DEGENERATE_VARIABLE 62
#define H5DS_ERROR_EXHAUSTED 63

// Message of the last error on this thread, or "No error"
const char* h5ds_get_last_error(void);

// Code of the last error on this thread, H5DS_OK if none
h5ds_error_t h5ds_get_last_error_code(void);

void h5ds_clear_error(void);

// =============================================================================
// Logging
// =============================================================================

// Set the "h5ds" logger level by name: trace, debug, info, warn, error,
// critical or off
h5ds_error_t h5ds_set_log_level(const char* level);

#ifdef __cplusplus
}
#endif
