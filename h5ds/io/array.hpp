#pragma once

#include "h5ds/core/type.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/macros.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// =============================================================================
/// @file array.hpp
/// @brief Collaborator interfaces for array-bearing files
///
/// The datastore core never touches a file format directly. It consumes:
///
/// - MetadataProvider: describes every variable of one file (run once per
///   file while the unified schema is resolved)
/// - ArrayReader: reads a strided row range of one variable (run once per
///   selected variable per split)
///
/// Both are stateless from the caller's view; implementations open and
/// release file handles inside each call.
// =============================================================================

namespace h5ds::io {

// =============================================================================
// Element Type Names
// =============================================================================

template <typename T>
constexpr const char* element_type_name() {
    if constexpr (std::is_same_v<T, float>)              return "float32";
    else if constexpr (std::is_same_v<T, double>)        return "float64";
    else if constexpr (std::is_same_v<T, std::int8_t>)   return "int8";
    else if constexpr (std::is_same_v<T, std::int16_t>)  return "int16";
    else if constexpr (std::is_same_v<T, std::int32_t>)  return "int32";
    else if constexpr (std::is_same_v<T, std::int64_t>)  return "int64";
    else if constexpr (std::is_same_v<T, std::uint8_t>)  return "uint8";
    else if constexpr (std::is_same_v<T, std::uint16_t>) return "uint16";
    else if constexpr (std::is_same_v<T, std::uint32_t>) return "uint32";
    else if constexpr (std::is_same_v<T, std::uint64_t>) return "uint64";
    else return "";
}

// =============================================================================
// Variable Metadata (as reported by one file)
// =============================================================================

struct VariableInfo {
    std::string name;
    std::string locator;
    Shape shape;
    Shape max_shape;
    Size element_size = 0;
    std::string type_name;
    TypeClass type_class = TypeClass::Unknown;
    std::optional<Shape> chunk_shape;
    std::vector<std::string> attributes;
};

struct FileInfo {
    std::string path;
    std::vector<VariableInfo> variables;
};

class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    /// @throws Exception subclass if the file cannot be opened or parsed
    virtual FileInfo describe(const std::string& path) const = 0;
};

// =============================================================================
// ArrayData - Materialized Rows of One Variable
// =============================================================================

/// Row-major element buffer. shape[0] counts the rows actually read.
class ArrayData {
public:
    ArrayData() = default;

    ArrayData(Shape shape, Size element_size, TypeClass type_class,
              std::string type_name, std::vector<Byte> bytes)
        : _shape(std::move(shape)),
          _element_size(element_size),
          _type_class(type_class),
          _type_name(std::move(type_name)),
          _bytes(std::move(bytes))
    {
        H5DS_CHECK_ARG(_bytes.size() == num_elements() * _element_size,
                       "ArrayData: buffer size does not match shape");
    }

    /// Zero-filled buffer for the given shape.
    static ArrayData zeros(Shape shape, Size element_size, TypeClass type_class,
                           std::string type_name) {
        std::vector<Byte> bytes(shape.empty() ? 0 : shape_product(shape) * element_size);
        return ArrayData(std::move(shape), element_size, type_class,
                         std::move(type_name), std::move(bytes));
    }

    H5DS_NODISCARD const Shape& shape() const noexcept { return _shape; }
    H5DS_NODISCARD Size rank() const noexcept { return _shape.size(); }
    H5DS_NODISCARD std::uint64_t rows() const noexcept {
        return _shape.empty() ? 0 : _shape[0];
    }
    H5DS_NODISCARD std::uint64_t num_elements() const noexcept {
        return _shape.empty() ? 0 : shape_product(_shape);
    }
    H5DS_NODISCARD Size element_size() const noexcept { return _element_size; }
    H5DS_NODISCARD TypeClass type_class() const noexcept { return _type_class; }
    H5DS_NODISCARD const std::string& type_name() const noexcept { return _type_name; }
    H5DS_NODISCARD Size byte_size() const noexcept { return _bytes.size(); }
    H5DS_NODISCARD bool empty() const noexcept { return _bytes.empty(); }

    H5DS_NODISCARD std::span<const Byte> bytes() const noexcept { return _bytes; }
    H5DS_NODISCARD const Byte* data() const noexcept { return _bytes.data(); }
    H5DS_NODISCARD Byte* mutable_data() noexcept { return _bytes.data(); }

    /// @brief Typed view over the buffer.
    /// @throws TypeMismatchError if T is not the stored element type
    template <typename T>
    std::span<const T> values() const {
        constexpr const char* wanted = element_type_name<T>();
        if (sizeof(T) != _element_size || _type_name != wanted) {
            throw TypeMismatchError("ArrayData holds '" + _type_name +
                                    "', requested '" + std::string(wanted) + "'");
        }
        return {reinterpret_cast<const T*>(_bytes.data()),
                static_cast<Size>(num_elements())};
    }

private:
    Shape _shape;
    Size _element_size = 0;
    TypeClass _type_class = TypeClass::Unknown;
    std::string _type_name;
    std::vector<Byte> _bytes;
};

// =============================================================================
// ArrayReader
// =============================================================================

class ArrayReader {
public:
    virtual ~ArrayReader() = default;

    /// @brief Read rows [start_row, start_row + row_count) of one variable,
    ///        taking every `stride`-th row.
    ///
    /// @param start_row  1-based first row
    /// @param row_count  logical window size; ceil(row_count / stride) rows
    ///                   are materialized
    /// @param shape_tail non-row dimensions, always read in full
    virtual ArrayData read_rows(const std::string& path,
                                const std::string& locator,
                                RowIndex start_row,
                                std::uint64_t row_count,
                                const Shape& shape_tail,
                                std::uint32_t stride) const = 0;
};

/// Rows materialized by a strided read of `row_count` logical rows.
constexpr std::uint64_t strided_rows(std::uint64_t row_count, std::uint32_t stride) noexcept {
    return stride == 0 ? 0 : (row_count + stride - 1) / stride;
}

} // namespace h5ds::io
