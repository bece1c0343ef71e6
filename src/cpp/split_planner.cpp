// =============================================================================
// FILE: src/cpp/split_planner.cpp
// BRIEF: Split cursor over an ordered file list
// =============================================================================

#include "h5ds/datastore/split.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/log.hpp"

#include <algorithm>
#include <utility>

namespace h5ds {

SplitPlanner::SplitPlanner(std::vector<io::FileEntry> files, std::uint64_t max_split_bytes)
    : _files(std::move(files)),
      _max_split_bytes(max_split_bytes)
{
    H5DS_CHECK_ARG(max_split_bytes > 0, "SplitPlanner: max_split_bytes must be positive");
    reset();
}

Split SplitPlanner::make_split(Size file_index, std::uint64_t offset, bool continuation) const {
    H5DS_ASSERT(file_index < _files.size(), "split requested for a file past the end of the set");
    const auto& file = _files[file_index];
    std::uint64_t length = _max_split_bytes;
    if (!continuation) {
        length = std::min(_max_split_bytes, file.size - offset);
    }
    return Split{file_index, file.path, offset, length, _ordinal, continuation};
}

void SplitPlanner::seek_file(Size file_index) {
    _file = file_index;
    while (_file < _files.size() && _files[_file].size == 0) {
        log::logger()->debug("skipping empty file '{}'", _files[_file].path);
        ++_file;
    }
    if (_file < _files.size()) {
        _current = make_split(_file, 0, false);
    }
}

void SplitPlanner::require_current() const {
    if (!has_next()) {
        throw ExhaustedError("No more splits: all " + std::to_string(_files.size()) +
                             " file(s) consumed");
    }
}

const Split& SplitPlanner::current() const {
    require_current();
    return _current;
}

Split SplitPlanner::next() {
    require_current();
    Split out = _current;
    advance();
    return out;
}

void SplitPlanner::advance() {
    require_current();
    ++_ordinal;
    const std::uint64_t next_offset = _current.offset + _current.length;
    if (!_current.continuation && next_offset < _files[_file].size) {
        _current = make_split(_file, next_offset, false);
        return;
    }
    seek_file(_file + 1);
}

void SplitPlanner::skip_file() {
    require_current();
    ++_ordinal;
    seek_file(_file + 1);
}

void SplitPlanner::continue_file() {
    require_current();
    ++_ordinal;
    const std::uint64_t next_offset = _current.offset + _current.length;
    const bool continuation = next_offset >= _files[_file].size;
    _current = make_split(_file, next_offset, continuation);
    if (continuation) {
        log::logger()->debug("continuing '{}' past its planned end at byte {}",
                             _current.path, next_offset);
    }
}

bool SplitPlanner::at_last_planned_split() const {
    require_current();
    return _current.continuation ||
           _current.offset + _current.length >= _files[_file].size;
}

void SplitPlanner::reset() {
    _ordinal = 0;
    seek_file(0);
    _first = _file;
}

double SplitPlanner::progress() const noexcept {
    if (!has_next()) {
        return 1.0;
    }
    if (_file == _first) {
        return 0.0;
    }
    return static_cast<double>(_file) / static_cast<double>(_files.size());
}

Size SplitPlanner::splits_in_file(Size file_index) const {
    if (file_index >= _files.size()) {
        throw RangeError("File index " + std::to_string(file_index) + " out of range");
    }
    const std::uint64_t size = _files[file_index].size;
    return static_cast<Size>((size + _max_split_bytes - 1) / _max_split_bytes);
}

Size SplitPlanner::num_splits() const {
    Size total = 0;
    for (Size i = 0; i < _files.size(); ++i) {
        total += splits_in_file(i);
    }
    return total;
}

std::vector<Split> SplitPlanner::resolve() const {
    std::vector<Split> out;
    out.reserve(num_splits());
    Size ordinal = 0;
    for (Size i = 0; i < _files.size(); ++i) {
        for (std::uint64_t offset = 0; offset < _files[i].size; offset += _max_split_bytes) {
            const std::uint64_t length = std::min(_max_split_bytes, _files[i].size - offset);
            out.push_back(Split{i, _files[i].path, offset, length, ordinal++, false});
        }
    }
    return out;
}

} // namespace h5ds
