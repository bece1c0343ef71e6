#pragma once

#include "h5ds/datastore/schema.hpp"
#include "h5ds/datastore/split.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/type.hpp"
#include "h5ds/core/macros.hpp"

#include <cstdint>
#include <string>

// =============================================================================
/// @file window.hpp
/// @brief Byte range to row window translation
///
/// A split's byte range [offset, offset + length) is mapped onto the row
/// axis of a variable independently of the other variables:
///
///     start_row = floor(offset / bytes_per_row) + 1       (1-based)
///     requested = ceil(length / bytes_per_row)
///     remaining = rows - start_row + 1
///
/// If requested >= remaining the window is clamped to the remaining rows and
/// reaches the end of the variable. A start past the last row yields an
/// empty window that reaches the end.
///
/// Decimation does not enter the window arithmetic; it only sets the stride
/// used when the window is materialized.
// =============================================================================

namespace h5ds {

struct ReadWindow {
    RowIndex start_row = 1;
    std::uint64_t row_count = 0;
    std::uint32_t stride = 1;
    bool reaches_end = false;

    H5DS_NODISCARD bool empty() const noexcept { return row_count == 0; }

    /// Rows actually returned once the stride is applied.
    H5DS_NODISCARD std::uint64_t materialized_rows() const noexcept {
        return io::strided_rows(row_count, stride);
    }
};

/// @throws DegenerateVariableError if `bytes_per_row` is 0
/// @throws ValueError if `decimation` is 0
inline ReadWindow compute_window(std::uint64_t offset,
                                 std::uint64_t length,
                                 std::uint64_t bytes_per_row,
                                 std::uint64_t rows,
                                 std::uint32_t decimation,
                                 const std::string& variable) {
    if (bytes_per_row == 0) {
        throw DegenerateVariableError(variable);
    }
    H5DS_CHECK_ARG(decimation >= 1, "Decimation must be at least 1");

    ReadWindow w;
    w.stride = decimation;
    w.start_row = offset / bytes_per_row + 1;
    const std::uint64_t requested = length / bytes_per_row + (length % bytes_per_row != 0 ? 1 : 0);

    if (w.start_row > rows) {
        if (rows > 0) {
            w.start_row = rows;
        }
        w.row_count = 0;
        w.reaches_end = true;
        return w;
    }

    const std::uint64_t remaining = rows - w.start_row + 1;
    if (requested >= remaining) {
        w.row_count = remaining;
        w.reaches_end = true;
    } else {
        w.row_count = requested;
        w.reaches_end = false;
    }
    return w;
}

inline ReadWindow compute_window(const Split& split,
                                 const VariableSchema& variable,
                                 std::uint32_t decimation) {
    return compute_window(split.offset, split.length, variable.bytes_per_row(),
                          variable.rows(), decimation, variable.name());
}

} // namespace h5ds
