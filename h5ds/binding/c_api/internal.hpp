#pragma once

// =============================================================================
// FILE: h5ds/binding/c_api/internal.hpp
// BRIEF: Internal glue between the C handles and the C++ datastore
// =============================================================================
//
// Not part of the public API. Included by the C API sources only.
// =============================================================================

#include "h5ds/binding/c_api/core.h"
#include "h5ds/binding/c_api/datastore.h"
#include "h5ds/datastore/reader.hpp"
#include "h5ds/core/macros.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace h5ds::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

void set_last_error(h5ds_error_t code, std::string_view message) noexcept;
void clear_last_error() noexcept;
H5DS_NODISCARD const char* get_last_error_message() noexcept;
H5DS_NODISCARD h5ds_error_t get_last_error_code() noexcept;

/// Map the exception in flight to an error code and record it.
/// Must be called from within a catch block.
H5DS_NODISCARD h5ds_error_t handle_exception() noexcept;

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define H5DS_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (H5DS_UNLIKELY((ptr) == nullptr)) { \
            h5ds::binding::set_last_error(H5DS_ERROR_NULL_POINTER, (msg)); \
            return H5DS_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define H5DS_C_API_CHECK(cond, code, msg) \
    do { \
        if (H5DS_UNLIKELY(!(cond))) { \
            h5ds::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define H5DS_C_API_TRY try {

#define H5DS_C_API_CATCH \
    } catch (...) { \
        return h5ds::binding::handle_exception(); \
    }

#define H5DS_C_API_RETURN_OK \
    do { \
        h5ds::binding::clear_last_error(); \
        return H5DS_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace h5ds::binding

// =============================================================================
// Opaque Handle Definitions
// =============================================================================

struct h5ds_datastore {
    std::unique_ptr<h5ds::SequentialReader> reader;
    // Warning messages kept alive for h5ds_datastore_warning()
    std::vector<std::string> warning_messages;
};

struct h5ds_block {
    h5ds::ReadResult result;
};
