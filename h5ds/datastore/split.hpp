#pragma once

#include "h5ds/io/file_set.hpp"
#include "h5ds/core/type.hpp"
#include "h5ds/core/macros.hpp"

#include <cstdint>
#include <string>
#include <vector>

// =============================================================================
/// @file split.hpp
/// @brief Byte-range splits over an ordered file list
///
/// Each file of size S is cut into ceil(S / max_split_bytes) consecutive
/// splits; all but possibly the last are exactly max_split_bytes long.
/// Splits are ordered by (file index, byte offset) and never overlap.
/// Zero-length files produce no split.
///
/// The planner keeps a cursor on the current split. Besides the plain
/// sequential walk (next/advance), the reader can:
///
/// - skip_file(): abandon the remaining splits of the current file
/// - continue_file(): step past the last planned split of a file into a
///   contiguous continuation split, for data whose logical byte size
///   exceeds the file size
///
/// Progress is reported per file: files behind the cursor / total files.
// =============================================================================

namespace h5ds {

struct Split {
    Size file_index = 0;
    std::string path;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    /// Position of this split in the walk since the last reset
    Size ordinal = 0;
    /// True when the split lies past the planned end of its file
    bool continuation = false;
};

class SplitPlanner {
public:
    /// @throws ValueError if `max_split_bytes` is 0
    SplitPlanner(std::vector<io::FileEntry> files, std::uint64_t max_split_bytes);

    H5DS_NODISCARD bool has_next() const noexcept { return _file < _files.size(); }

    /// @brief Current split without moving the cursor.
    /// @throws ExhaustedError when no split remains
    H5DS_NODISCARD const Split& current() const;

    /// @brief Return the current split and move to the next planned one.
    /// @throws ExhaustedError when no split remains
    Split next();

    /// Move to the next planned split (next file after the last one).
    void advance();

    /// Move to the first split of the next file with data.
    void skip_file();

    /// Move to the split that follows the current one in the same file,
    /// even past the file's planned end.
    void continue_file();

    /// True when the current split is the last planned split of its file
    /// (or already a continuation split).
    H5DS_NODISCARD bool at_last_planned_split() const;

    /// Rewind to the first split of the first file. Idempotent.
    void reset();

    /// Fraction of files fully behind the cursor, in [0, 1]. Empty files
    /// skipped on the way to the first split do not count, so a fresh
    /// cursor always reports 0.
    H5DS_NODISCARD double progress() const noexcept;

    /// All planned splits in order, independent of the cursor.
    H5DS_NODISCARD std::vector<Split> resolve() const;

    H5DS_NODISCARD Size splits_in_file(Size file_index) const;
    H5DS_NODISCARD Size num_splits() const;
    H5DS_NODISCARD Size num_files() const noexcept { return _files.size(); }
    H5DS_NODISCARD std::uint64_t max_split_bytes() const noexcept { return _max_split_bytes; }
    H5DS_NODISCARD const std::vector<io::FileEntry>& files() const noexcept { return _files; }

private:
    Split make_split(Size file_index, std::uint64_t offset, bool continuation) const;
    void seek_file(Size file_index);
    void require_current() const;

    std::vector<io::FileEntry> _files;
    std::uint64_t _max_split_bytes;

    Size _file = 0;
    Size _first = 0;
    Size _ordinal = 0;
    Split _current;
};

} // namespace h5ds
