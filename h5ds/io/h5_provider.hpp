#pragma once

#include "h5ds/io/array.hpp"

#include <string>

// =============================================================================
// FILE: h5ds/io/h5_provider.hpp
// BRIEF: HDF5 implementations of MetadataProvider and ArrayReader
// =============================================================================

namespace h5ds::io {

/// Lists the datasets linked directly under the root group, in name order.
/// Groups, named datatypes and nested datasets are not variables.
class H5MetadataProvider final : public MetadataProvider {
public:
    FileInfo describe(const std::string& path) const override;
};

/// Hyperslab reads using the dataset's native memory type.
class H5ArrayReader final : public ArrayReader {
public:
    ArrayData read_rows(const std::string& path,
                        const std::string& locator,
                        RowIndex start_row,
                        std::uint64_t row_count,
                        const Shape& shape_tail,
                        std::uint32_t stride) const override;
};

} // namespace h5ds::io
