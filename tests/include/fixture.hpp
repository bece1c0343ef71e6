#pragma once

// =============================================================================
// h5ds - Test Fixtures
// =============================================================================
//
// Provides:
//   - TempDir: per-test scratch directory, removed on destruction
//   - H5Writer: builds small HDF5 files through the library's own wrapper
//   - FakeMetadataProvider / FakeArrayReader: in-memory collaborators with
//     exact file sizes and a call log
//
// Fake reader values encode their coordinates: element (row r, column c)
// of a variable holds r * 100 + c (r is 1-based, c is the flat index over
// the non-row dimensions).
//
// =============================================================================

#include "h5ds/io/array.hpp"
#include "h5ds/io/file_set.hpp"
#include "h5ds/io/hdf5.hpp"
#include "h5ds/core/error.hpp"

#include <atomic>
#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace h5ds::test {

namespace fs = std::filesystem;

// =============================================================================
// TempDir
// =============================================================================

class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        path_ = fs::temp_directory_path() /
                ("h5ds-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }
    [[nodiscard]] std::string str() const { return path_.string(); }

    /// Absolute path of `name` inside the directory (parents created).
    [[nodiscard]] std::string file(const std::string& name) const {
        fs::path p = path_ / name;
        fs::create_directories(p.parent_path());
        return p.string();
    }

private:
    fs::path path_;
};

// =============================================================================
// H5Writer
// =============================================================================

class H5Writer {
public:
    explicit H5Writer(const std::string& path)
        : file_(io::h5::File::create(path)) {}

    template <typename T>
    H5Writer& dataset(const std::string& name,
                      const std::vector<hsize_t>& dims,
                      const std::vector<T>& values) {
        io::h5::Dataset dset = file_.create_dataset<T>(name, dims);
        if (!values.empty()) {
            dset.write(values.data());
        }
        return *this;
    }

    /// Chunked dataset, unlimited along the row axis.
    template <typename T>
    H5Writer& chunked(const std::string& name,
                      const std::vector<hsize_t>& dims,
                      const std::vector<hsize_t>& chunk,
                      const std::vector<T>& values) {
        io::h5::CreateProps props;
        props.chunked(chunk);
        std::vector<hsize_t> maxdims = dims;
        maxdims[0] = H5S_UNLIMITED;
        io::h5::Dataset dset = file_.create_dataset<T>(name, dims, props, maxdims);
        if (!values.empty()) {
            dset.write(values.data());
        }
        return *this;
    }

    template <typename T>
    H5Writer& attribute(const std::string& dataset, const std::string& name, const T& value) {
        io::h5::Dataset dset = file_.dataset(dataset);
        dset.write_attr(name, value);
        return *this;
    }

    /// Variable-length string dataset of `rows` empty strings.
    H5Writer& vlen_strings(const std::string& name, hsize_t rows) {
        io::h5::Datatype dtype = io::h5::Datatype::variable_string();
        io::h5::Dataspace space = io::h5::Dataspace::simple({rows});
        io::h5::Dataset::create(file_.id(), name, dtype.id(), space);
        return *this;
    }

    /// Datasets inside the group are written with dataset("group/name", ...).
    H5Writer& group(const std::string& name) {
        file_.create_group(name);
        return *this;
    }

private:
    io::h5::File file_;
};

// =============================================================================
// Fake Collaborators
// =============================================================================

inline io::VariableInfo variable(const std::string& name, Shape shape,
                                 Size element_size = 8,
                                 const std::string& type_name = "float64") {
    io::VariableInfo info;
    info.name = name;
    info.locator = "/" + name;
    info.max_shape = shape;
    info.shape = std::move(shape);
    info.element_size = element_size;
    info.type_name = type_name;
    info.type_class = type_name.rfind("float", 0) == 0 ? TypeClass::Float : TypeClass::Integer;
    return info;
}

class FakeMetadataProvider : public io::MetadataProvider {
public:
    void add(const std::string& path, std::vector<io::VariableInfo> variables) {
        files_[path] = io::FileInfo{path, std::move(variables)};
    }

    /// describe(path) throws IOError from now on.
    void corrupt(const std::string& path) { corrupt_.insert(path); }

    io::FileInfo describe(const std::string& path) const override {
        calls_.push_back(path);
        if (corrupt_.count(path) != 0) {
            throw IOError("corrupt file header: " + path);
        }
        auto it = files_.find(path);
        if (it == files_.end()) {
            throw FileNotFoundError(path);
        }
        return it->second;
    }

    [[nodiscard]] const std::vector<std::string>& calls() const noexcept { return calls_; }

private:
    std::map<std::string, io::FileInfo> files_;
    std::set<std::string> corrupt_;
    mutable std::vector<std::string> calls_;
};

struct ReadCall {
    std::string path;
    std::string locator;
    RowIndex start_row;
    std::uint64_t row_count;
    Shape shape_tail;
    std::uint32_t stride;
};

class FakeArrayReader : public io::ArrayReader {
public:
    io::ArrayData read_rows(const std::string& path,
                            const std::string& locator,
                            RowIndex start_row,
                            std::uint64_t row_count,
                            const Shape& shape_tail,
                            std::uint32_t stride) const override {
        calls_.push_back(ReadCall{path, locator, start_row, row_count, shape_tail, stride});
        if (failing_.count(locator) != 0) {
            throw ReadError("simulated read failure: " + path + ":" + locator);
        }

        const std::uint64_t rows = io::strided_rows(row_count, stride);
        const std::uint64_t cols = shape_product(shape_tail);
        std::vector<double> values;
        values.reserve(rows * cols);
        for (std::uint64_t i = 0; i < rows; ++i) {
            const RowIndex r = start_row + i * stride;
            for (std::uint64_t c = 0; c < cols; ++c) {
                values.push_back(static_cast<double>(r * 100 + c));
            }
        }

        Shape shape{rows};
        shape.insert(shape.end(), shape_tail.begin(), shape_tail.end());
        std::vector<Byte> bytes(values.size() * sizeof(double));
        if (!bytes.empty()) {
            std::memcpy(bytes.data(), values.data(), bytes.size());
        }
        return io::ArrayData(std::move(shape), sizeof(double), TypeClass::Float,
                             "float64", std::move(bytes));
    }

    /// Every read of `locator` throws ReadError from now on.
    void fail_on(const std::string& locator) { failing_.insert(locator); }
    void heal() { failing_.clear(); }

    [[nodiscard]] const std::vector<ReadCall>& calls() const noexcept { return calls_; }
    void clear_calls() { calls_.clear(); }

private:
    std::set<std::string> failing_;
    mutable std::vector<ReadCall> calls_;
};

inline std::vector<io::FileEntry> entries(
    std::initializer_list<std::pair<std::string, std::uint64_t>> files) {
    std::vector<io::FileEntry> out;
    for (const auto& f : files) {
        out.push_back(io::FileEntry{f.first, f.second});
    }
    return out;
}

} // namespace h5ds::test
