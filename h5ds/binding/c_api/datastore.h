#pragma once

// =============================================================================
// FILE: h5ds/binding/c_api/datastore.h
// BRIEF: C API for sequential datastore reads
// =============================================================================
//
// LIFETIME:
//   - h5ds_datastore_open() creates a datastore, h5ds_datastore_destroy()
//     releases it
//   - h5ds_datastore_read() creates a block that owns copies of the arrays
//     read; release it with h5ds_block_destroy()
//   - A block stays valid after its datastore is destroyed
//   - Strings and data pointers returned by accessors live as long as the
//     handle they come from
// =============================================================================

#include "h5ds/binding/c_api/core.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct h5ds_datastore h5ds_datastore;
typedef struct h5ds_block h5ds_block;

typedef h5ds_datastore* h5ds_datastore_t;
typedef h5ds_block* h5ds_block_t;

// =============================================================================
// Lifecycle
// =============================================================================

/// @brief Open every HDF5 file under `root` as one datastore
/// @param[out] out Datastore handle (non-null)
/// @param[in] root File or directory path (non-null)
/// @param[in] max_split_bytes Maximum bytes per split; 0 selects the default
/// @param[in] decimation Row stride (>= 1)
H5DS_C_EXPORT h5ds_error_t h5ds_datastore_open(
    h5ds_datastore_t* out,
    const char* root,
    uint64_t max_split_bytes,
    uint32_t decimation
);

/// @brief Release a datastore; sets *store to NULL. NULL is accepted.
H5DS_C_EXPORT h5ds_error_t h5ds_datastore_destroy(h5ds_datastore_t* store);

// =============================================================================
// Iteration
// =============================================================================

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_has_data(h5ds_datastore_t store, h5ds_bool_t* out);

/// @brief Read the next block
/// @return H5DS_ERROR_EXHAUSTED when no data remains
H5DS_C_EXPORT h5ds_error_t h5ds_datastore_read(h5ds_datastore_t store, h5ds_block_t* out);

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_reset(h5ds_datastore_t store);

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_progress(h5ds_datastore_t store, double* out);

// =============================================================================
// Variables
// =============================================================================

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_num_files(h5ds_datastore_t store, h5ds_size_t* out);

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_num_variables(h5ds_datastore_t store, h5ds_size_t* out);

/// @brief Name of schema variable `index`
H5DS_C_EXPORT h5ds_error_t h5ds_datastore_variable_name(
    h5ds_datastore_t store,
    h5ds_size_t index,
    const char** out
);

/// @brief Number of reconciliation warnings raised while opening
H5DS_C_EXPORT h5ds_error_t h5ds_datastore_num_warnings(h5ds_datastore_t store, h5ds_size_t* out);

H5DS_C_EXPORT h5ds_error_t h5ds_datastore_warning(
    h5ds_datastore_t store,
    h5ds_size_t index,
    const char** out
);

/// @brief Replace the selection
/// @return H5DS_ERROR_UNKNOWN_VARIABLE if any name is not in the schema; the
///         previous selection is kept
H5DS_C_EXPORT h5ds_error_t h5ds_datastore_select(
    h5ds_datastore_t store,
    const char* const* names,
    h5ds_size_t count
);

// =============================================================================
// Blocks
// =============================================================================

H5DS_C_EXPORT h5ds_error_t h5ds_block_destroy(h5ds_block_t* block);

H5DS_C_EXPORT h5ds_error_t h5ds_block_num_variables(h5ds_block_t block, h5ds_size_t* out);

/// @brief Position of variable `name` in the block
/// @return H5DS_ERROR_UNKNOWN_VARIABLE if the block does not hold it
H5DS_C_EXPORT h5ds_error_t h5ds_block_find(
    h5ds_block_t block,
    const char* name,
    h5ds_size_t* out
);

H5DS_C_EXPORT h5ds_error_t h5ds_block_variable_name(
    h5ds_block_t block,
    h5ds_size_t index,
    const char** out
);

H5DS_C_EXPORT h5ds_error_t h5ds_block_rank(
    h5ds_block_t block,
    h5ds_size_t index,
    h5ds_size_t* out
);

/// @param[out] out Array of at least `rank` entries
H5DS_C_EXPORT h5ds_error_t h5ds_block_shape(
    h5ds_block_t block,
    h5ds_size_t index,
    uint64_t* out
);

H5DS_C_EXPORT h5ds_error_t h5ds_block_element_size(
    h5ds_block_t block,
    h5ds_size_t index,
    h5ds_size_t* out
);

/// @brief Element type name, e.g. "float64"
H5DS_C_EXPORT h5ds_error_t h5ds_block_type_name(
    h5ds_block_t block,
    h5ds_size_t index,
    const char** out
);

/// @brief Row-major element bytes (NULL for an empty array)
H5DS_C_EXPORT h5ds_error_t h5ds_block_data(
    h5ds_block_t block,
    h5ds_size_t index,
    const void** data,
    h5ds_size_t* nbytes
);

/// @brief Window used for variable `index`
H5DS_C_EXPORT h5ds_error_t h5ds_block_window(
    h5ds_block_t block,
    h5ds_size_t index,
    h5ds_row_t* start_row,
    h5ds_row_t* row_count,
    h5ds_bool_t* reaches_end
);

#ifdef __cplusplus
}
#endif
