// =============================================================================
// FILE: h5ds/binding/c_api/core.cpp
// BRIEF: Thread-local error state and exception translation for the C API
// =============================================================================

#include "h5ds/binding/c_api/core.h"
#include "h5ds/binding/c_api/internal.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/log.hpp"
#include "h5ds/config.hpp"

#include <hdf5.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>

namespace h5ds::binding {

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 1024;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local h5ds_error_t g_last_error_code = H5DS_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

void set_last_error(h5ds_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;
    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = H5DS_OK;
    g_last_error_message[0] = '\0';
}

const char* get_last_error_message() noexcept {
    if (H5DS_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

h5ds_error_t get_last_error_code() noexcept {
    return g_last_error_code;
}

// h5ds exceptions carry their C code; standard ones are mapped by kind.
h5ds_error_t handle_exception() noexcept {
    try {
        throw;
    }
    catch (const Exception& e) {
        const auto code = static_cast<h5ds_error_t>(e.code());
        set_last_error(code, e.what());
        return code;
    }
    catch (const std::bad_alloc&) {
        set_last_error(H5DS_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
        return H5DS_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::out_of_range& e) {
        set_last_error(H5DS_ERROR_RANGE_ERROR, e.what());
        return H5DS_ERROR_RANGE_ERROR;
    }
    catch (const std::logic_error& e) {
        set_last_error(H5DS_ERROR_INVALID_ARGUMENT, e.what());
        return H5DS_ERROR_INVALID_ARGUMENT;
    }
    catch (const std::exception& e) {
        set_last_error(H5DS_ERROR_UNKNOWN, e.what());
        return H5DS_ERROR_UNKNOWN;
    }
    catch (...) {
        set_last_error(H5DS_ERROR_UNKNOWN, "Unknown exception (not derived from std::exception)");
        return H5DS_ERROR_UNKNOWN;
    }
}

} // namespace h5ds::binding

extern "C" {

H5DS_C_EXPORT const char* h5ds_get_version(void) {
    return H5DS_VERSION_STRING;
}

H5DS_C_EXPORT const char* h5ds_get_hdf5_version(void) {
    return H5_VERSION;
}

H5DS_C_EXPORT const char* h5ds_get_last_error(void) {
    return h5ds::binding::get_last_error_message();
}

H5DS_C_EXPORT h5ds_error_t h5ds_get_last_error_code(void) {
    return h5ds::binding::get_last_error_code();
}

H5DS_C_EXPORT void h5ds_clear_error(void) {
    h5ds::binding::clear_last_error();
}

H5DS_C_EXPORT h5ds_error_t h5ds_set_log_level(const char* level) {
    H5DS_C_API_CHECK_NULL(level, "Log level is null");

    H5DS_C_API_TRY
        const auto parsed = h5ds::log::parse_level(level);
        if (!parsed) {
            throw h5ds::ValueError(std::string("Unknown log level '") + level + "'");
        }
        h5ds::log::set_level(*parsed);
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

} // extern "C"
