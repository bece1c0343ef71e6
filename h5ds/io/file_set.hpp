#pragma once

#include "h5ds/core/type.hpp"
#include "h5ds/core/macros.hpp"

#include <cstdint>
#include <string>
#include <vector>

// =============================================================================
/// @file file_set.hpp
/// @brief Enumeration of the files that make up one dataset
///
/// A FileSet is built once from a root path. A root naming a regular file
/// yields that file alone; a directory is scanned for files whose extension
/// matches (case-insensitive), recursively when `include_subfolders` is set.
/// Entries are sorted by path and carry their size in bytes, which the
/// split planner uses to cut byte ranges.
// =============================================================================

namespace h5ds::io {

struct FileEntry {
    std::string path;
    std::uint64_t size = 0;
};

struct FileSetOptions {
    std::vector<std::string> extensions{config::DEFAULT_EXTENSION};
    bool include_subfolders = true;
};

class FileSet {
public:
    /// @brief Enumerate files under `root`.
    /// @throws FileNotFoundError if `root` does not exist
    explicit FileSet(const std::string& root, FileSetOptions options = {});

    /// @brief Use an explicit list of files, in the given order.
    /// @throws FileNotFoundError if any path is not a regular file
    static FileSet from_paths(const std::vector<std::string>& paths);

    H5DS_NODISCARD const std::vector<FileEntry>& files() const noexcept { return _files; }
    H5DS_NODISCARD Size size() const noexcept { return _files.size(); }
    H5DS_NODISCARD bool empty() const noexcept { return _files.empty(); }
    H5DS_NODISCARD const std::string& root() const noexcept { return _root; }

    H5DS_NODISCARD std::uint64_t total_bytes() const noexcept;

private:
    FileSet() = default;

    std::string _root;
    std::vector<FileEntry> _files;
};

} // namespace h5ds::io
