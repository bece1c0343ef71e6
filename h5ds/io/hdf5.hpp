#pragma once

#include "h5ds/core/type.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/macros.hpp"

#include <hdf5.h>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// =============================================================================
// FILE: h5ds/io/hdf5.hpp
// BRIEF: Owning handles over the HDF5 C API
//
// Covers what the datastore needs: root-level dataset discovery, dataset
// metadata, strided hyperslab reads, and the writes test fixtures use.
// Every failing call raises IOError carrying the HDF5 error stack.
// =============================================================================

namespace h5ds::io::h5 {

using Dims = std::vector<hsize_t>;

namespace detail {

template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, float>)              return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)        return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, std::int8_t>)   return H5T_NATIVE_INT8;
    else if constexpr (std::is_same_v<T, std::int16_t>)  return H5T_NATIVE_INT16;
    else if constexpr (std::is_same_v<T, std::int32_t>)  return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, std::int64_t>)  return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, std::uint8_t>)  return H5T_NATIVE_UINT8;
    else if constexpr (std::is_same_v<T, std::uint16_t>) return H5T_NATIVE_UINT16;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return H5T_NATIVE_UINT32;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return H5T_NATIVE_UINT64;
    else {
        static_assert(sizeof(T) == 0, "no native HDF5 type for T");
    }
}

inline herr_t append_error(unsigned, const H5E_error2_t* err, void* data) {
    if (err->desc != nullptr) {
        static_cast<std::string*>(data)->append("\n  ").append(err->desc);
    }
    return 0;
}

/// Descriptions on the current error stack, outermost call first.
inline std::string error_stack_text() {
    std::string text;
    if (H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD, append_error, &text) < 0) {
        text += " (error stack unavailable)";
    }
    return text;
}

[[noreturn]] inline void raise(const std::string& context) {
    throw IOError("HDF5: " + context + error_stack_text());
}

inline void check(herr_t status, const std::string& context) {
    if (status < 0) raise(context);
}

inline hid_t checked(hid_t id, const std::string& context) {
    if (id < 0) raise(context);
    return id;
}

/// HDF5 names come back in two calls: one for the length, one to fill.
template <typename Query>
std::string read_name(Query&& query, const std::string& context) {
    const ssize_t length = query(nullptr, 0);
    if (length < 0) raise(context);
    std::string name(static_cast<Size>(length), '\0');
    if (query(name.data(), name.size() + 1) < 0) raise(context);
    return name;
}

/// Turns off the library's own stderr printing while alive.
class ErrorPrintGuard {
public:
    ErrorPrintGuard() noexcept {
        _saved = H5Eget_auto2(H5E_DEFAULT, &_func, &_data) >= 0;
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }

    ~ErrorPrintGuard() noexcept {
        if (_saved) {
            H5Eset_auto2(H5E_DEFAULT, _func, _data);
        }
    }

    ErrorPrintGuard(const ErrorPrintGuard&) = delete;
    ErrorPrintGuard& operator=(const ErrorPrintGuard&) = delete;

private:
    H5E_auto2_t _func = nullptr;
    void* _data = nullptr;
    bool _saved = false;
};

} // namespace detail

// =============================================================================
// Handle
// =============================================================================

/// Move-only owner of one identifier and the call that releases it.
class Handle {
public:
    using Closer = herr_t (*)(hid_t);

    Handle() noexcept = default;
    Handle(hid_t id, Closer closer) noexcept : _id(id), _closer(closer) {}

    ~Handle() { reset(); }

    Handle(Handle&& other) noexcept
        : _id(std::exchange(other._id, H5I_INVALID_HID)), _closer(other._closer) {}

    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            _id = std::exchange(other._id, H5I_INVALID_HID);
            _closer = other._closer;
        }
        return *this;
    }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    void reset() noexcept {
        if (_id >= 0 && _closer != nullptr) {
            _closer(_id);
        }
        _id = H5I_INVALID_HID;
    }

    H5DS_NODISCARD hid_t id() const noexcept { return _id; }
    H5DS_NODISCARD bool valid() const noexcept { return _id >= 0; }

private:
    hid_t _id = H5I_INVALID_HID;
    Closer _closer = nullptr;
};

// =============================================================================
// Dataspace
// =============================================================================

class Dataspace : public Handle {
public:
    explicit Dataspace(hid_t id) noexcept : Handle(id, H5Sclose) {}

    /// Empty `max_dims` means the extent is fixed.
    static Dataspace simple(const Dims& dims, const Dims& max_dims = {}) {
        return Dataspace(detail::checked(
            H5Screate_simple(static_cast<int>(dims.size()), dims.data(),
                             max_dims.empty() ? nullptr : max_dims.data()),
            "H5Screate_simple"));
    }

    static Dataspace scalar() {
        return Dataspace(detail::checked(H5Screate(H5S_SCALAR), "H5Screate"));
    }

    H5DS_NODISCARD Size rank() const {
        const int ndims = H5Sget_simple_extent_ndims(id());
        detail::check(ndims < 0 ? -1 : 0, "H5Sget_simple_extent_ndims");
        return static_cast<Size>(ndims);
    }

    H5DS_NODISCARD Dims dims() const { return extent(false); }
    H5DS_NODISCARD Dims max_dims() const { return extent(true); }

    /// Replace the selection with `count` elements per axis from `start`,
    /// stepping `stride` (one entry per axis).
    void select(const Dims& start, const Dims& count, const Dims& stride) {
        detail::check(H5Sselect_hyperslab(id(), H5S_SELECT_SET, start.data(),
                                          stride.data(), count.data(), nullptr),
                      "H5Sselect_hyperslab");
    }

private:
    Dims extent(bool maximum) const {
        Dims out(rank());
        if (out.empty()) return out;
        const int status = H5Sget_simple_extent_dims(id(), maximum ? nullptr : out.data(),
                                                     maximum ? out.data() : nullptr);
        detail::check(status < 0 ? -1 : 0, "H5Sget_simple_extent_dims");
        return out;
    }
};

// =============================================================================
// Datatype
// =============================================================================

class Datatype : public Handle {
public:
    /// Takes ownership of `id`.
    explicit Datatype(hid_t id) noexcept : Handle(id, H5Tclose) {}

    static Datatype copy_of(hid_t id) {
        return Datatype(detail::checked(H5Tcopy(id), "H5Tcopy"));
    }

    static Datatype variable_string() {
        Datatype type = copy_of(H5T_C_S1);
        detail::check(H5Tset_size(type.id(), H5T_VARIABLE), "H5Tset_size");
        return type;
    }

    /// Type to read this file type into. Strings and opaque blobs keep the
    /// file layout; the rest maps to the platform's native equivalent.
    H5DS_NODISCARD Datatype memory_type() const {
        const H5T_class_t cls = type_class();
        if (cls == H5T_STRING || cls == H5T_OPAQUE) {
            return copy_of(id());
        }
        return Datatype(detail::checked(H5Tget_native_type(id(), H5T_DIR_ASCEND),
                                        "H5Tget_native_type"));
    }

    H5DS_NODISCARD Size size() const {
        const size_t bytes = H5Tget_size(id());
        if (bytes == 0) detail::raise("H5Tget_size");
        return bytes;
    }

    H5DS_NODISCARD H5T_class_t type_class() const {
        const H5T_class_t cls = H5Tget_class(id());
        if (cls == H5T_NO_CLASS) detail::raise("H5Tget_class");
        return cls;
    }

    H5DS_NODISCARD bool is_signed() const { return H5Tget_sign(id()) == H5T_SGN_2; }
    H5DS_NODISCARD bool is_variable_string() const { return H5Tis_variable_str(id()) > 0; }
};

// =============================================================================
// Dataset creation properties
// =============================================================================

class CreateProps : public Handle {
public:
    CreateProps()
        : Handle(detail::checked(H5Pcreate(H5P_DATASET_CREATE), "H5Pcreate"), H5Pclose) {}

    explicit CreateProps(hid_t id) noexcept : Handle(id, H5Pclose) {}

    CreateProps& chunked(const Dims& chunk) {
        detail::check(H5Pset_chunk(id(), static_cast<int>(chunk.size()), chunk.data()),
                      "H5Pset_chunk");
        return *this;
    }

    /// Chunk extent of a rank-`rank` dataset; nullopt unless chunked.
    H5DS_NODISCARD std::optional<Dims> chunk(Size rank) const {
        if (rank == 0 || H5Pget_layout(id()) != H5D_CHUNKED) {
            return std::nullopt;
        }
        Dims out(rank);
        detail::check(H5Pget_chunk(id(), static_cast<int>(rank), out.data()) < 0 ? -1 : 0,
                      "H5Pget_chunk");
        return out;
    }
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public Handle {
public:
    explicit Dataset(hid_t id) noexcept : Handle(id, H5Dclose) {}

    static Dataset open(hid_t loc, const std::string& name) {
        return Dataset(detail::checked(H5Dopen2(loc, name.c_str(), H5P_DEFAULT),
                                       "H5Dopen: " + name));
    }

    static Dataset create(hid_t loc, const std::string& name, hid_t type,
                          const Dataspace& space, hid_t dcpl = H5P_DEFAULT) {
        return Dataset(detail::checked(
            H5Dcreate2(loc, name.c_str(), type, space.id(), H5P_DEFAULT, dcpl, H5P_DEFAULT),
            "H5Dcreate: " + name));
    }

    H5DS_NODISCARD Dataspace space() const {
        return Dataspace(detail::checked(H5Dget_space(id()), "H5Dget_space"));
    }

    H5DS_NODISCARD Datatype type() const {
        return Datatype(detail::checked(H5Dget_type(id()), "H5Dget_type"));
    }

    H5DS_NODISCARD Dims dims() const { return space().dims(); }
    H5DS_NODISCARD Dims max_dims() const { return space().max_dims(); }

    H5DS_NODISCARD std::optional<Dims> chunk_dims() const {
        CreateProps props(detail::checked(H5Dget_create_plist(id()), "H5Dget_create_plist"));
        return props.chunk(space().rank());
    }

    /// Attribute names in increasing name order.
    H5DS_NODISCARD std::vector<std::string> attribute_names() const {
#if H5_VERSION_GE(1, 12, 0)
        H5O_info2_t info;
        detail::check(H5Oget_info3(id(), &info, H5O_INFO_NUM_ATTRS), "H5Oget_info3");
#else
        H5O_info_t info;
        detail::check(H5Oget_info2(id(), &info, H5O_INFO_NUM_ATTRS), "H5Oget_info2");
#endif
        std::vector<std::string> names;
        names.reserve(static_cast<Size>(info.num_attrs));
        for (hsize_t i = 0; i < info.num_attrs; ++i) {
            names.push_back(detail::read_name(
                [&](char* buf, size_t size) {
                    return H5Aget_name_by_idx(id(), ".", H5_INDEX_NAME, H5_ITER_INC, i,
                                              buf, size, H5P_DEFAULT);
                },
                "H5Aget_name_by_idx"));
        }
        return names;
    }

    /// Scalar attribute of a native numeric type.
    template <typename T>
    void write_attr(const std::string& name, const T& value) {
        Dataspace scalar = Dataspace::scalar();
        Handle attr(detail::checked(H5Acreate2(id(), name.c_str(), detail::native_type<T>(),
                                               scalar.id(), H5P_DEFAULT, H5P_DEFAULT),
                                    "H5Acreate: " + name),
                    H5Aclose);
        detail::check(H5Awrite(attr.id(), detail::native_type<T>(), &value), "H5Awrite: " + name);
    }

    void read(void* buffer, const Datatype& mem_type,
              const Dataspace& mem_space, const Dataspace& file_space) const {
        detail::check(H5Dread(id(), mem_type.id(), mem_space.id(), file_space.id(),
                              H5P_DEFAULT, buffer),
                      "H5Dread");
    }

    /// Whole-extent write from a native buffer.
    template <typename T>
    void write(const T* values) {
        detail::check(H5Dwrite(id(), detail::native_type<T>(), H5S_ALL, H5S_ALL,
                               H5P_DEFAULT, values),
                      "H5Dwrite");
    }
};

// =============================================================================
// File
// =============================================================================

class File : public Handle {
public:
    static File open(const std::string& path) {
        return File(detail::checked(H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT),
                                    "H5Fopen: " + path));
    }

    /// Create or truncate `path`.
    static File create(const std::string& path) {
        return File(detail::checked(H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT),
                                    "H5Fcreate: " + path));
    }

    H5DS_NODISCARD Dataset dataset(const std::string& name) const {
        return Dataset::open(id(), name);
    }

    template <typename T>
    Dataset create_dataset(const std::string& name, const Dims& dims,
                           const CreateProps& props = CreateProps(),
                           const Dims& max_dims = {}) {
        Dataspace space = Dataspace::simple(dims, max_dims);
        return Dataset::create(id(), name, detail::native_type<T>(), space, props.id());
    }

    void create_group(const std::string& name) {
        Handle group(detail::checked(H5Gcreate2(id(), name.c_str(), H5P_DEFAULT,
                                                H5P_DEFAULT, H5P_DEFAULT),
                                     "H5Gcreate: " + name),
                     H5Gclose);
    }

    /// Datasets linked directly under the root group, in name order.
    H5DS_NODISCARD std::vector<std::string> root_datasets() const {
        H5G_info_t group;
        detail::check(H5Gget_info(id(), &group), "H5Gget_info");

        std::vector<std::string> names;
        for (hsize_t i = 0; i < group.nlinks; ++i) {
            std::string name = detail::read_name(
                [&](char* buf, size_t size) {
                    return H5Lget_name_by_idx(id(), ".", H5_INDEX_NAME, H5_ITER_INC, i,
                                              buf, size, H5P_DEFAULT);
                },
                "H5Lget_name_by_idx");
            if (is_dataset(name)) {
                names.push_back(std::move(name));
            }
        }
        return names;
    }

private:
    explicit File(hid_t id) noexcept : Handle(id, H5Fclose) {}

    bool is_dataset(const std::string& name) const {
#if H5_VERSION_GE(1, 12, 0)
        H5O_info2_t info;
        detail::check(H5Oget_info_by_name3(id(), name.c_str(), &info, H5O_INFO_BASIC, H5P_DEFAULT),
                      "H5Oget_info_by_name: " + name);
#else
        H5O_info_t info;
        detail::check(H5Oget_info_by_name2(id(), name.c_str(), &info, H5O_INFO_BASIC, H5P_DEFAULT),
                      "H5Oget_info_by_name: " + name);
#endif
        return info.type == H5O_TYPE_DATASET;
    }
};

} // namespace h5ds::io::h5
