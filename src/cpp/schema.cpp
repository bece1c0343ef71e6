// =============================================================================
// FILE: src/cpp/schema.cpp
// BRIEF: Schema reconciliation across files
// =============================================================================

#include "h5ds/datastore/schema.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/log.hpp"

#include <unordered_set>
#include <utility>

namespace h5ds {

// =============================================================================
// VariableSchema
// =============================================================================

VariableSchema::VariableSchema(io::VariableInfo info)
    : _info(std::move(info)),
      _bytes_per_row(compute_bytes_per_row(_info.shape, _info.element_size))
{}

std::uint64_t VariableSchema::compute_bytes_per_row(const Shape& shape, Size element_size) noexcept {
    if (shape.empty()) {
        return 0;
    }
    return shape_product(shape, 1) * element_size;
}

// =============================================================================
// UnifiedSchema
// =============================================================================

UnifiedSchema::UnifiedSchema(std::vector<VariableSchema> variables)
    : _variables(std::move(variables))
{
    _index.reserve(_variables.size());
    for (Size i = 0; i < _variables.size(); ++i) {
        const bool inserted = _index.emplace(_variables[i].name(), i).second;
        H5DS_CHECK_ARG(inserted, "Duplicate variable name '" + _variables[i].name() + "'");
    }
}

const VariableSchema& UnifiedSchema::at(Size index) const {
    if (index >= _variables.size()) {
        throw RangeError("Variable index " + std::to_string(index) +
                         " out of range (" + std::to_string(_variables.size()) + ")");
    }
    return _variables[index];
}

const VariableSchema& UnifiedSchema::at(const std::string& name) const {
    auto it = _index.find(name);
    if (it == _index.end()) {
        throw UnknownVariableError({name});
    }
    return _variables[it->second];
}

std::optional<Size> UnifiedSchema::index_of(const std::string& name) const {
    auto it = _index.find(name);
    if (it == _index.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> UnifiedSchema::names() const {
    std::vector<std::string> out;
    out.reserve(_variables.size());
    for (const auto& v : _variables) {
        out.push_back(v.name());
    }
    return out;
}

// =============================================================================
// SchemaWarning
// =============================================================================

std::string SchemaWarning::message() const {
    std::string joined;
    for (Size i = 0; i < variables.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += variables[i];
    }
    return "The following variables: " + joined + " were not found in file '" + file + "'";
}

// =============================================================================
// SchemaResolver
// =============================================================================

io::FileInfo SchemaResolver::describe(const std::string& path) const {
    try {
        return _provider.describe(path);
    } catch (const Exception& e) {
        throw SchemaError("Cannot read metadata of '" + path + "': " + e.message());
    }
}

SchemaResolution SchemaResolver::resolve(const std::vector<io::FileEntry>& files) const {
    if (files.empty()) {
        throw SchemaError("No files found: cannot establish a baseline schema");
    }

    io::FileInfo baseline = describe(files.front().path);

    std::vector<bool> keep(baseline.variables.size(), true);
    std::vector<SchemaWarning> warnings;

    for (Size f = 1; f < files.size(); ++f) {
        io::FileInfo info = describe(files[f].path);

        std::unordered_set<std::string> present;
        present.reserve(info.variables.size());
        for (const auto& v : info.variables) {
            present.insert(v.name);
        }

        SchemaWarning warning{files[f].path, {}};
        for (Size i = 0; i < baseline.variables.size(); ++i) {
            if (present.count(baseline.variables[i].name) == 0) {
                keep[i] = false;
                warning.variables.push_back(baseline.variables[i].name);
            }
        }

        if (!warning.variables.empty()) {
            log::logger()->warn("{}", warning.message());
            warnings.push_back(std::move(warning));
        }
    }

    std::vector<VariableSchema> retained;
    retained.reserve(baseline.variables.size());
    for (Size i = 0; i < baseline.variables.size(); ++i) {
        if (keep[i]) {
            retained.emplace_back(std::move(baseline.variables[i]));
        }
    }

    SchemaResolution result{UnifiedSchema(std::move(retained)), std::move(warnings)};
    log::logger()->info("resolved schema over {} file(s): {} variable(s), {} warning(s)",
                        files.size(), result.schema.size(), result.warnings.size());
    return result;
}

} // namespace h5ds
