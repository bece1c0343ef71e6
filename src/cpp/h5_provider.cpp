// =============================================================================
// FILE: src/cpp/h5_provider.cpp
// BRIEF: HDF5 metadata extraction and strided row reads
// =============================================================================

#include "h5ds/io/h5_provider.hpp"
#include "h5ds/io/hdf5.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/log.hpp"

#include <utility>

namespace h5ds::io {

namespace {

struct TypeDescription {
    TypeClass type_class;
    std::string name;
};

TypeDescription describe_type(const h5::Datatype& dtype) {
    const Size size = dtype.size();
    switch (dtype.type_class()) {
        case H5T_INTEGER: {
            std::string name = dtype.is_signed() ? "int" : "uint";
            return {TypeClass::Integer, name + std::to_string(size * 8)};
        }
        case H5T_FLOAT:
            return {TypeClass::Float, "float" + std::to_string(size * 8)};
        case H5T_STRING:
            return {TypeClass::String, "string"};
        case H5T_BITFIELD:
            return {TypeClass::Bitfield, "bitfield"};
        case H5T_OPAQUE:
            return {TypeClass::Opaque, "opaque"};
        case H5T_COMPOUND:
            return {TypeClass::Compound, "compound"};
        case H5T_REFERENCE:
            return {TypeClass::Reference, "reference"};
        case H5T_ENUM:
            return {TypeClass::Enum, "enum"};
        case H5T_VLEN:
            return {TypeClass::VarLen, "vlen"};
        case H5T_ARRAY:
            return {TypeClass::Array, "array"};
        default:
            return {TypeClass::Unknown, "unknown"};
    }
}

Shape to_shape(const h5::Dims& dims) {
    Shape shape;
    shape.reserve(dims.size());
    for (hsize_t d : dims) {
        shape.push_back(d == H5S_UNLIMITED ? UNLIMITED : static_cast<std::uint64_t>(d));
    }
    return shape;
}

VariableInfo describe_dataset(const h5::File& file, const std::string& name) {
    h5::Dataset dset = file.dataset(name);
    h5::Datatype dtype = dset.type();
    TypeDescription type = describe_type(dtype);

    VariableInfo info;
    info.name = name;
    info.locator = "/" + name;
    info.shape = to_shape(dset.dims());
    info.max_shape = to_shape(dset.max_dims());
    info.element_size = dtype.size();
    info.type_name = std::move(type.name);
    info.type_class = type.type_class;
    if (type.type_class == TypeClass::String && dtype.is_variable_string()) {
        info.type_class = TypeClass::VarLen;
        info.type_name = "vlen-string";
    }
    if (auto chunk = dset.chunk_dims()) {
        info.chunk_shape = to_shape(*chunk);
    }
    info.attributes = dset.attribute_names();
    return info;
}

} // anonymous namespace

// =============================================================================
// H5MetadataProvider
// =============================================================================

FileInfo H5MetadataProvider::describe(const std::string& path) const {
    h5::detail::ErrorPrintGuard quiet;
    h5::File file = h5::File::open(path);

    FileInfo result;
    result.path = path;
    for (const auto& name : file.root_datasets()) {
        result.variables.push_back(describe_dataset(file, name));
    }

    log::logger()->debug("described '{}': {} variable(s)", path, result.variables.size());
    return result;
}

// =============================================================================
// H5ArrayReader
// =============================================================================

ArrayData H5ArrayReader::read_rows(const std::string& path,
                                   const std::string& locator,
                                   RowIndex start_row,
                                   std::uint64_t row_count,
                                   const Shape& shape_tail,
                                   std::uint32_t stride) const {
    H5DS_CHECK_ARG(stride >= 1, "read_rows: stride must be positive");
    H5DS_CHECK_ARG(start_row >= 1, "read_rows: start_row is 1-based");

    h5::detail::ErrorPrintGuard quiet;
    h5::File file = h5::File::open(path);
    h5::Dataset dset = file.dataset(locator);
    h5::Datatype file_type = dset.type();

    if (file_type.type_class() == H5T_VLEN || file_type.is_variable_string()) {
        throw TypeError("Variable-length data is not supported: " + path + ":" + locator);
    }

    h5::Datatype mem_type = file_type.memory_type();
    TypeDescription type = describe_type(mem_type);
    const Size element_size = mem_type.size();

    Shape out_shape;
    out_shape.reserve(shape_tail.size() + 1);
    out_shape.push_back(strided_rows(row_count, stride));
    out_shape.insert(out_shape.end(), shape_tail.begin(), shape_tail.end());

    if (row_count == 0) {
        return ArrayData::zeros(std::move(out_shape), element_size,
                                type.type_class, std::move(type.name));
    }

    h5::Dataspace file_space = dset.space();
    const h5::Dims dims = file_space.dims();
    if (dims.size() != shape_tail.size() + 1) {
        throw RangeError("Rank mismatch reading " + path + ":" + locator +
                         ": file has rank " + std::to_string(dims.size()));
    }
    for (Size i = 0; i < shape_tail.size(); ++i) {
        if (dims[i + 1] != shape_tail[i]) {
            throw RangeError("Shape mismatch reading " + path + ":" + locator +
                             " in dimension " + std::to_string(i + 1));
        }
    }
    if (start_row - 1 + row_count > dims[0]) {
        throw RangeError("Rows " + std::to_string(start_row) + ".." +
                         std::to_string(start_row + row_count - 1) +
                         " exceed the " + std::to_string(dims[0]) +
                         " rows of " + path + ":" + locator);
    }

    h5::Dims start(dims.size(), 0);
    h5::Dims count(out_shape.begin(), out_shape.end());
    h5::Dims strides(dims.size(), 1);
    start[0] = static_cast<hsize_t>(start_row - 1);
    strides[0] = stride;

    file_space.select(start, count, strides);
    h5::Dataspace mem_space = h5::Dataspace::simple(count);

    std::vector<Byte> buffer(shape_product(out_shape) * element_size);
    if (!buffer.empty()) {
        dset.read(buffer.data(), mem_type, mem_space, file_space);
    }

    return ArrayData(std::move(out_shape), element_size, type.type_class,
                     std::move(type.name), std::move(buffer));
}

} // namespace h5ds::io
