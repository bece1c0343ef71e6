// =============================================================================
// FILE: src/cpp/sequential_reader.cpp
// BRIEF: Split-driven read loop over the unified schema
// =============================================================================

#include "h5ds/datastore/reader.hpp"
#include "h5ds/io/h5_provider.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/log.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace h5ds {

// =============================================================================
// DataBlock / WindowInfo
// =============================================================================

void DataBlock::insert(std::string name, io::ArrayData array) {
    H5DS_CHECK_ARG(!contains(name), "DataBlock already holds variable '" + name + "'");
    _entries.emplace_back(std::move(name), std::move(array));
}

bool DataBlock::contains(const std::string& name) const noexcept {
    return std::any_of(_entries.begin(), _entries.end(),
                       [&](const value_type& e) { return e.first == name; });
}

const io::ArrayData& DataBlock::at(const std::string& name) const {
    for (const auto& e : _entries) {
        if (e.first == name) {
            return e.second;
        }
    }
    throw UnknownVariableError({name});
}

std::vector<std::string> DataBlock::names() const {
    std::vector<std::string> out;
    out.reserve(_entries.size());
    for (const auto& e : _entries) {
        out.push_back(e.first);
    }
    return out;
}

bool WindowInfo::reaches_end() const noexcept {
    return std::all_of(variables.begin(), variables.end(),
                       [](const VariableWindow& vw) { return vw.window.reaches_end; });
}

// =============================================================================
// SequentialReader
// =============================================================================

SequentialReader::SequentialReader(std::vector<io::FileEntry> files,
                                   const io::MetadataProvider& provider,
                                   std::shared_ptr<const io::ArrayReader> reader,
                                   DatastoreOptions options)
    : _planner(files, options.max_split_bytes),
      _reader(std::move(reader)),
      _decimation(options.decimation)
{
    H5DS_CHECK_ARG(_reader != nullptr, "SequentialReader: array reader is null");
    H5DS_CHECK_ARG(_decimation >= 1, "SequentialReader: decimation must be at least 1");

    SchemaResolution resolution = SchemaResolver(provider).resolve(files);
    _schema = std::move(resolution.schema);
    _warnings = std::move(resolution.warnings);

    select_all();
    log::logger()->debug("planned {} split(s) over {} file(s), max {} bytes per split",
                         _planner.num_splits(), _planner.num_files(),
                         _planner.max_split_bytes());
}

void SequentialReader::select_all() {
    _selected.resize(_schema.size());
    for (Size i = 0; i < _selected.size(); ++i) {
        _selected[i] = i;
    }
}

void SequentialReader::select_variables(const std::vector<std::string>& names) {
    std::vector<std::string> unknown;
    std::vector<Size> selection;
    selection.reserve(names.size());
    std::unordered_set<std::string> seen;
    std::optional<std::string> duplicate;

    for (const auto& name : names) {
        auto index = _schema.index_of(name);
        if (!index) {
            unknown.push_back(name);
            continue;
        }
        if (!seen.insert(name).second) {
            if (!duplicate) duplicate = name;
            continue;
        }
        selection.push_back(*index);
    }

    // Unknown names take precedence over duplicates
    if (!unknown.empty()) {
        throw UnknownVariableError(std::move(unknown));
    }
    if (duplicate) {
        throw ValueError("Variable '" + *duplicate + "' selected more than once");
    }
    _selected = std::move(selection);
}

std::vector<std::string> SequentialReader::selected_variable_names() const {
    std::vector<std::string> out;
    out.reserve(_selected.size());
    for (Size i : _selected) {
        out.push_back(_schema.at(i).name());
    }
    return out;
}

WindowInfo SequentialReader::peek() const {
    WindowInfo info{_planner.current(), {}};
    info.variables.reserve(_selected.size());
    for (Size i : _selected) {
        const VariableSchema& variable = _schema.at(i);
        info.variables.push_back(VariableWindow{variable, compute_window(info.split, variable, _decimation)});
    }
    return info;
}

io::ArrayData SequentialReader::read_window(const Split& split, const VariableWindow& vw) const {
    const VariableSchema& v = vw.variable;
    if (vw.window.empty()) {
        Shape shape = v.shape_tail();
        shape.insert(shape.begin(), std::uint64_t{0});
        return io::ArrayData::zeros(std::move(shape), v.element_size(), v.type_class(), v.type_name());
    }
    return _reader->read_rows(split.path, v.locator(), vw.window.start_row,
                              vw.window.row_count, v.shape_tail(), vw.window.stride);
}

void SequentialReader::commit(const WindowInfo& info) {
    if (info.reaches_end()) {
        _planner.skip_file();
    } else if (_planner.at_last_planned_split()) {
        _planner.continue_file();
    } else {
        _planner.advance();
    }
}

ReadResult SequentialReader::read() {
    if (!has_data()) {
        throw ExhaustedError();
    }

    ReadResult result{DataBlock{}, peek()};
    const Split& split = result.info.split;
    for (const auto& vw : result.info.variables) {
        log::logger()->debug("read '{}' split {} [{}, +{}): rows {}..+{} stride {}",
                             split.path, split.ordinal, split.offset, split.length,
                             vw.window.start_row, vw.window.row_count, vw.window.stride);
        result.data.insert(vw.variable.name(), read_window(split, vw));
    }

    commit(result.info);
    return result;
}

void SequentialReader::reset() {
    _planner.reset();
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<SequentialReader> open_datastore(const std::string& root,
                                                 DatastoreOptions options) {
    io::FileSet files(root, io::FileSetOptions{options.extensions, options.include_subfolders});
    io::H5MetadataProvider provider;
    return std::make_unique<SequentialReader>(files.files(), provider,
                                              std::make_shared<io::H5ArrayReader>(),
                                              std::move(options));
}

} // namespace h5ds
