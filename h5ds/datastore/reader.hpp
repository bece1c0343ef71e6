#pragma once

#include "h5ds/datastore/schema.hpp"
#include "h5ds/datastore/split.hpp"
#include "h5ds/datastore/window.hpp"
#include "h5ds/io/array.hpp"
#include "h5ds/io/file_set.hpp"
#include "h5ds/core/type.hpp"
#include "h5ds/core/macros.hpp"
#include "h5ds/config.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
/// @file reader.hpp
/// @brief Sequential, bounded-memory iteration over a file set
///
/// ## Read Cycle
///
/// read() takes the current split without moving the cursor, computes one
/// ReadWindow per selected variable, asks the ArrayReader for each window,
/// and only then commits the cursor:
///
/// 1. every window reaches the end of its variable: skip the rest of the
///    file (the next read starts on the next file)
/// 2. the split was the last planned split of its file: continue the file
///    with a contiguous split past its planned end
/// 3. otherwise: move to the next planned split
///
/// A failing read (collaborator error, degenerate variable) leaves the
/// cursor where it was.
///
/// ## Selection
///
/// All schema variables are selected initially, in schema order.
/// select_variables() validates the whole list before touching the current
/// selection and never moves the cursor.
// =============================================================================

namespace h5ds {

// =============================================================================
// Read Results
// =============================================================================

/// Arrays of one read keyed by variable name, in selection order.
class DataBlock {
public:
    using value_type = std::pair<std::string, io::ArrayData>;
    using const_iterator = std::vector<value_type>::const_iterator;

    /// @throws ValueError if `name` is already present
    void insert(std::string name, io::ArrayData array);

    H5DS_NODISCARD bool contains(const std::string& name) const noexcept;

    /// @throws UnknownVariableError if `name` is not in the block
    H5DS_NODISCARD const io::ArrayData& at(const std::string& name) const;

    H5DS_NODISCARD Size size() const noexcept { return _entries.size(); }
    H5DS_NODISCARD bool empty() const noexcept { return _entries.empty(); }
    H5DS_NODISCARD std::vector<std::string> names() const;

    const_iterator begin() const noexcept { return _entries.begin(); }
    const_iterator end() const noexcept { return _entries.end(); }

private:
    std::vector<value_type> _entries;
};

struct VariableWindow {
    VariableSchema variable;
    ReadWindow window;
};

struct WindowInfo {
    Split split;
    std::vector<VariableWindow> variables;

    /// True when every window reaches the end of its variable (vacuously
    /// true for an empty selection).
    H5DS_NODISCARD bool reaches_end() const noexcept;
};

struct ReadResult {
    DataBlock data;
    WindowInfo info;
};

// =============================================================================
// Options
// =============================================================================

struct DatastoreOptions {
    std::uint64_t max_split_bytes = config::DEFAULT_SPLIT_SIZE;
    std::uint32_t decimation = config::DEFAULT_DECIMATION;
    std::vector<std::string> extensions{config::DEFAULT_EXTENSION};
    bool include_subfolders = true;
};

// =============================================================================
// Datastore Interface
// =============================================================================

class Datastore {
public:
    virtual ~Datastore() = default;

    H5DS_NODISCARD virtual bool has_data() const = 0;

    /// @throws ExhaustedError when has_data() is false
    virtual ReadResult read() = 0;

    virtual void reset() = 0;

    H5DS_NODISCARD virtual double progress() const = 0;
};

// =============================================================================
// SequentialReader
// =============================================================================

class SequentialReader final : public Datastore {
public:
    /// @brief Resolve the schema over `files` and plan their splits.
    ///
    /// `provider` is used during construction only; `reader` is kept for
    /// every later read().
    ///
    /// @throws SchemaError if no baseline schema can be established
    /// @throws ValueError on invalid options or a null reader
    SequentialReader(std::vector<io::FileEntry> files,
                     const io::MetadataProvider& provider,
                     std::shared_ptr<const io::ArrayReader> reader,
                     DatastoreOptions options = {});

    H5DS_NODISCARD bool has_data() const override { return _planner.has_next(); }
    ReadResult read() override;
    void reset() override;
    H5DS_NODISCARD double progress() const override { return _planner.progress(); }

    /// @brief Windows the next read() would use, without reading.
    /// @throws ExhaustedError when has_data() is false
    H5DS_NODISCARD WindowInfo peek() const;

    /// @throws UnknownVariableError listing every name not in the schema
    /// @throws ValueError if a name is repeated
    void select_variables(const std::vector<std::string>& names);

    /// Restore the initial selection (every schema variable).
    void select_all();

    H5DS_NODISCARD std::vector<std::string> variable_names() const { return _schema.names(); }
    H5DS_NODISCARD std::vector<std::string> selected_variable_names() const;

    H5DS_NODISCARD const UnifiedSchema& schema() const noexcept { return _schema; }
    H5DS_NODISCARD const std::vector<SchemaWarning>& warnings() const noexcept { return _warnings; }
    H5DS_NODISCARD const std::vector<io::FileEntry>& files() const noexcept { return _planner.files(); }
    H5DS_NODISCARD std::uint32_t decimation() const noexcept { return _decimation; }
    H5DS_NODISCARD const SplitPlanner& split_planner() const noexcept { return _planner; }

private:
    io::ArrayData read_window(const Split& split, const VariableWindow& vw) const;
    void commit(const WindowInfo& info);

    UnifiedSchema _schema;
    std::vector<SchemaWarning> _warnings;
    SplitPlanner _planner;
    std::shared_ptr<const io::ArrayReader> _reader;
    std::uint32_t _decimation;
    std::vector<Size> _selected;
};

/// @brief Open every matching HDF5 file under `root` as one datastore.
///
/// `root` defaults to the working directory.
/// @throws FileNotFoundError if `root` does not exist
/// @throws SchemaError if no file matches or the first file has no schema
std::unique_ptr<SequentialReader> open_datastore(const std::string& root = config::DEFAULT_ROOT,
                                                 DatastoreOptions options = {});

} // namespace h5ds
