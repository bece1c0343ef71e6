#pragma once

#include "h5ds/io/array.hpp"
#include "h5ds/io/file_set.hpp"
#include "h5ds/core/type.hpp"
#include "h5ds/core/macros.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// =============================================================================
/// @file schema.hpp
/// @brief Unified variable schema across a file set
///
/// ## Reconciliation
///
/// The first file is the baseline: its variables, in the order the file
/// reports them, form the candidate schema. Every later file is checked for
/// presence of each baseline name. A baseline variable missing from any
/// file is dropped, and each offending file produces one SchemaWarning
/// naming the variables it lacks. Drops are applied once, after all files
/// have been scanned.
///
/// Only presence is reconciled. Shape, type and layout of a retained
/// variable come from the first file; later files are assumed to agree.
///
/// ## Bytes Per Row
///
/// bytes_per_row = element_size * product(shape[1:]). A rank-0 variable or
/// one with a zero-sized non-row dimension has bytes_per_row == 0 and is
/// rejected when a row window is requested for it.
// =============================================================================

namespace h5ds {

// =============================================================================
// VariableSchema
// =============================================================================

class VariableSchema {
public:
    explicit VariableSchema(io::VariableInfo info);

    H5DS_NODISCARD const std::string& name() const noexcept { return _info.name; }
    H5DS_NODISCARD const std::string& locator() const noexcept { return _info.locator; }
    H5DS_NODISCARD const Shape& shape() const noexcept { return _info.shape; }
    H5DS_NODISCARD const Shape& max_shape() const noexcept { return _info.max_shape; }
    H5DS_NODISCARD Size element_size() const noexcept { return _info.element_size; }
    H5DS_NODISCARD const std::string& type_name() const noexcept { return _info.type_name; }
    H5DS_NODISCARD TypeClass type_class() const noexcept { return _info.type_class; }
    H5DS_NODISCARD const std::optional<Shape>& chunk_shape() const noexcept { return _info.chunk_shape; }
    H5DS_NODISCARD const std::vector<std::string>& attributes() const noexcept { return _info.attributes; }
    H5DS_NODISCARD const io::VariableInfo& info() const noexcept { return _info; }

    H5DS_NODISCARD Size rank() const noexcept { return _info.shape.size(); }

    /// Extent of the row axis; 0 for a rank-0 variable.
    H5DS_NODISCARD std::uint64_t rows() const noexcept {
        return _info.shape.empty() ? 0 : _info.shape[0];
    }

    /// Non-row dimensions.
    H5DS_NODISCARD Shape shape_tail() const {
        return _info.shape.empty() ? Shape{} : Shape(_info.shape.begin() + 1, _info.shape.end());
    }

    H5DS_NODISCARD std::uint64_t bytes_per_row() const noexcept { return _bytes_per_row; }
    H5DS_NODISCARD bool degenerate() const noexcept { return _bytes_per_row == 0; }

    static std::uint64_t compute_bytes_per_row(const Shape& shape, Size element_size) noexcept;

private:
    io::VariableInfo _info;
    std::uint64_t _bytes_per_row;
};

// =============================================================================
// UnifiedSchema
// =============================================================================

/// Ordered, name-indexed set of variables. Immutable once resolved.
class UnifiedSchema {
public:
    using const_iterator = std::vector<VariableSchema>::const_iterator;

    UnifiedSchema() = default;
    explicit UnifiedSchema(std::vector<VariableSchema> variables);

    H5DS_NODISCARD Size size() const noexcept { return _variables.size(); }
    H5DS_NODISCARD bool empty() const noexcept { return _variables.empty(); }

    H5DS_NODISCARD const VariableSchema& at(Size index) const;
    H5DS_NODISCARD const VariableSchema& at(const std::string& name) const;

    H5DS_NODISCARD std::optional<Size> index_of(const std::string& name) const;
    H5DS_NODISCARD bool contains(const std::string& name) const {
        return _index.find(name) != _index.end();
    }

    H5DS_NODISCARD std::vector<std::string> names() const;

    const_iterator begin() const noexcept { return _variables.begin(); }
    const_iterator end() const noexcept { return _variables.end(); }

private:
    std::vector<VariableSchema> _variables;
    std::unordered_map<std::string, Size> _index;
};

// =============================================================================
// SchemaResolver
// =============================================================================

/// Non-fatal reconciliation event: `file` lacks `variables` from the baseline.
struct SchemaWarning {
    std::string file;
    std::vector<std::string> variables;

    H5DS_NODISCARD std::string message() const;
};

struct SchemaResolution {
    UnifiedSchema schema;
    std::vector<SchemaWarning> warnings;
};

class SchemaResolver {
public:
    explicit SchemaResolver(const io::MetadataProvider& provider) noexcept
        : _provider(provider) {}

    /// @throws SchemaError if `files` is empty or a file cannot be described
    SchemaResolution resolve(const std::vector<io::FileEntry>& files) const;

private:
    io::FileInfo describe(const std::string& path) const;

    const io::MetadataProvider& _provider;
};

} // namespace h5ds
