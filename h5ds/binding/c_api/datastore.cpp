// =============================================================================
// FILE: h5ds/binding/c_api/datastore.cpp
// BRIEF: Datastore and block handles for the C API
// =============================================================================

#include "h5ds/binding/c_api/datastore.h"
#include "h5ds/binding/c_api/internal.hpp"
#include "h5ds/datastore/reader.hpp"
#include "h5ds/core/error.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace h5ds;
using namespace h5ds::binding;

namespace {

const DataBlock::value_type& block_entry(h5ds_block_t block, h5ds_size_t index) {
    const DataBlock& data = block->result.data;
    if (index >= data.size()) {
        throw RangeError("Block variable index " + std::to_string(index) +
                         " out of range (" + std::to_string(data.size()) + ")");
    }
    return *(data.begin() + static_cast<std::ptrdiff_t>(index));
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Lifecycle
// =============================================================================

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_open(
    h5ds_datastore_t* out,
    const char* root,
    const uint64_t max_split_bytes,
    const uint32_t decimation) {

    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");
    H5DS_C_API_CHECK_NULL(root, "Root path is null");
    H5DS_C_API_CHECK(decimation >= 1, H5DS_ERROR_INVALID_ARGUMENT,
                     "Decimation must be at least 1");

    H5DS_C_API_TRY
        DatastoreOptions options;
        if (max_split_bytes > 0) {
            options.max_split_bytes = max_split_bytes;
        }
        options.decimation = decimation;

        auto handle = std::make_unique<h5ds_datastore>();
        handle->reader = open_datastore(root, std::move(options));
        for (const auto& w : handle->reader->warnings()) {
            handle->warning_messages.push_back(w.message());
        }
        *out = handle.release();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_destroy(h5ds_datastore_t* store) {
    if (store == nullptr || *store == nullptr) {
        H5DS_C_API_RETURN_OK;
    }
    delete *store;
    *store = nullptr;
    H5DS_C_API_RETURN_OK;
}

// =============================================================================
// Iteration
// =============================================================================

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_has_data(h5ds_datastore_t store, h5ds_bool_t* out) {
    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = store->reader->has_data() ? H5DS_TRUE : H5DS_FALSE;
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_read(h5ds_datastore_t store, h5ds_block_t* out) {
    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        auto block = std::make_unique<h5ds_block>();
        block->result = store->reader->read();
        *out = block.release();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_reset(h5ds_datastore_t store) {
    H5DS_C_API_CHECK_NULL(store, "Datastore is null");

    store->reader->reset();
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_progress(h5ds_datastore_t store, double* out) {
    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = store->reader->progress();
    H5DS_C_API_RETURN_OK;
}

// =============================================================================
// Variables
// =============================================================================

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_num_files(h5ds_datastore_t store, h5ds_size_t* out) {
    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = store->reader->files().size();
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_num_variables(h5ds_datastore_t store, h5ds_size_t* out) {
    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = store->reader->schema().size();
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_variable_name(
    h5ds_datastore_t store,
    const h5ds_size_t index,
    const char** out) {

    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        *out = store->reader->schema().at(index).name().c_str();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_num_warnings(h5ds_datastore_t store, h5ds_size_t* out) {
    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = store->warning_messages.size();
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_warning(
    h5ds_datastore_t store,
    const h5ds_size_t index,
    const char** out) {

    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");
    H5DS_C_API_CHECK(index < store->warning_messages.size(), H5DS_ERROR_RANGE_ERROR,
                     "Warning index out of range");

    *out = store->warning_messages[index].c_str();
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_select(
    h5ds_datastore_t store,
    const char* const* names,
    const h5ds_size_t count) {

    H5DS_C_API_CHECK_NULL(store, "Datastore is null");
    H5DS_C_API_CHECK(names != nullptr || count == 0, H5DS_ERROR_NULL_POINTER,
                     "Name array is null");

    H5DS_C_API_TRY
        std::vector<std::string> selection;
        selection.reserve(count);
        for (h5ds_size_t i = 0; i < count; ++i) {
            H5DS_CHECK_NULL(names[i], "Variable name is null");
            selection.emplace_back(names[i]);
        }
        store->reader->select_variables(selection);
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

// =============================================================================
// Blocks
// =============================================================================

H5DS_C_EXPORT h5ds_error_t h5ds_block_destroy(h5ds_block_t* block) {
    if (block == nullptr || *block == nullptr) {
        H5DS_C_API_RETURN_OK;
    }
    delete *block;
    *block = nullptr;
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_num_variables(h5ds_block_t block, h5ds_size_t* out) {
    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = block->result.data.size();
    H5DS_C_API_RETURN_OK;
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_find(
    h5ds_block_t block,
    const char* name,
    h5ds_size_t* out) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(name, "Variable name is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        const DataBlock& data = block->result.data;
        auto it = std::find_if(data.begin(), data.end(),
                               [&](const DataBlock::value_type& e) { return e.first == name; });
        if (it == data.end()) {
            throw UnknownVariableError({name});
        }
        *out = static_cast<h5ds_size_t>(it - data.begin());
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_variable_name(
    h5ds_block_t block,
    const h5ds_size_t index,
    const char** out) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        *out = block_entry(block, index).first.c_str();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_rank(
    h5ds_block_t block,
    const h5ds_size_t index,
    h5ds_size_t* out) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        *out = block_entry(block, index).second.rank();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_shape(
    h5ds_block_t block,
    const h5ds_size_t index,
    uint64_t* out) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        const Shape& shape = block_entry(block, index).second.shape();
        std::copy(shape.begin(), shape.end(), out);
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_element_size(
    h5ds_block_t block,
    const h5ds_size_t index,
    h5ds_size_t* out) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        *out = block_entry(block, index).second.element_size();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_type_name(
    h5ds_block_t block,
    const h5ds_size_t index,
    const char** out) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(out, "Output pointer is null");

    H5DS_C_API_TRY
        *out = block_entry(block, index).second.type_name().c_str();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_data(
    h5ds_block_t block,
    const h5ds_size_t index,
    const void** data,
    h5ds_size_t* nbytes) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");
    H5DS_C_API_CHECK_NULL(data, "Output data pointer is null");
    H5DS_C_API_CHECK_NULL(nbytes, "Output size pointer is null");

    H5DS_C_API_TRY
        const io::ArrayData& array = block_entry(block, index).second;
        *data = array.empty() ? nullptr : static_cast<const void*>(array.data());
        *nbytes = array.byte_size();
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

H5DS_C_EXPORT h5ds_error_t h5ds_block_window(
    h5ds_block_t block,
    const h5ds_size_t index,
    h5ds_row_t* start_row,
    h5ds_row_t* row_count,
    h5ds_bool_t* reaches_end) {

    H5DS_C_API_CHECK_NULL(block, "Block is null");

    H5DS_C_API_TRY
        const auto& windows = block->result.info.variables;
        if (index >= windows.size()) {
            throw RangeError("Block variable index " + std::to_string(index) + " out of range");
        }
        const ReadWindow& w = windows[index].window;
        if (start_row != nullptr) *start_row = w.start_row;
        if (row_count != nullptr) *row_count = w.row_count;
        if (reaches_end != nullptr) *reaches_end = w.reaches_end ? H5DS_TRUE : H5DS_FALSE;
        H5DS_C_API_RETURN_OK;
    H5DS_C_API_CATCH
}

} // extern "C"
