// =============================================================================
// h5ds - HDF5 Integration Tests
// =============================================================================
//
// End-to-end reads over real HDF5 files written into a temp directory.
// Every block is checked against the Eigen matrix that generated the file.
//
// Coverage:
//   - open_datastore over one and several files, default root
//   - Byte splits smaller than a file, decimated reads
//   - Integer and 1-D datasets
//   - H5MetadataProvider: chunking, max shape, attributes, nested groups
//   - H5ArrayReader: bounds and rank checks, variable-length rejection
//   - Error paths: missing root, empty directory, unreadable file
//
// =============================================================================

#include "test.hpp"

#include "h5ds/datastore/reader.hpp"
#include "h5ds/io/h5_provider.hpp"

#include <filesystem>
#include <fstream>
#include <map>

using namespace h5ds;
using namespace h5ds::test;

namespace {

/// Switches the working directory for the lifetime of the object.
class WorkingDirectory {
public:
    explicit WorkingDirectory(const std::filesystem::path& dir)
        : previous_(std::filesystem::current_path()) {
        std::filesystem::current_path(dir);
    }
    ~WorkingDirectory() {
        std::error_code ec;
        std::filesystem::current_path(previous_, ec);
    }
    WorkingDirectory(const WorkingDirectory&) = delete;
    WorkingDirectory& operator=(const WorkingDirectory&) = delete;

private:
    std::filesystem::path previous_;
};

std::vector<hsize_t> dims_of(const RowMatrixd& m) {
    return {static_cast<hsize_t>(m.rows()), static_cast<hsize_t>(m.cols())};
}

std::string filename(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

/// Write `count` files part_<i>.h5 with Data1 (random) and Data2 (iota).
std::map<std::string, std::pair<RowMatrixd, RowMatrixd>>
write_parts(const TempDir& dir, int count, Eigen::Index rows, Eigen::Index cols) {
    std::map<std::string, std::pair<RowMatrixd, RowMatrixd>> out;
    for (int i = 0; i < count; ++i) {
        const std::string name = "part_" + std::to_string(i) + ".h5";
        RowMatrixd d1 = random_matrix(rows, cols, 100 + static_cast<unsigned>(i));
        RowMatrixd d2 = iota_matrix<double>(rows, cols);
        H5Writer(dir.file(name))
            .dataset<double>("Data1", dims_of(d1), to_buffer(d1))
            .dataset<double>("Data2", dims_of(d2), to_buffer(d2));
        out.emplace(name, std::make_pair(std::move(d1), std::move(d2)));
    }
    return out;
}

} // namespace

H5DS_TEST_BEGIN

// =============================================================================
// Whole-File Reads
// =============================================================================

H5DS_TEST_UNIT(h5_single_file_single_block) {
    TempDir dir;
    RowMatrixd m = random_matrix(1000, 3);
    H5Writer(dir.file("a.h5")).dataset<double>("Data1", {1000, 3}, to_buffer(m));

    auto store = open_datastore(dir.str());
    H5DS_ASSERT_EQ(store->files().size(), 1u);
    H5DS_ASSERT_EQ(store->variable_names(), (std::vector<std::string>{"Data1"}));
    H5DS_ASSERT_TRUE(store->has_data());

    ReadResult r = store->read();
    H5DS_ASSERT_TRUE(r.info.reaches_end());
    H5DS_ASSERT_TRUE(matrices_equal(as_matrix<double>(r.data.at("Data1")), m));
    H5DS_ASSERT_FALSE(store->has_data());
    H5DS_ASSERT_NEAR(store->progress(), 1.0, 0.0);
}

H5DS_TEST_UNIT(h5_root_may_name_a_file) {
    TempDir dir;
    RowMatrixd m = random_matrix(50, 2);
    const std::string path = dir.file("only.h5");
    H5Writer(path).dataset<double>("x", {50, 2}, to_buffer(m));
    H5Writer(dir.file("other.h5")).dataset<double>("y", {50, 2}, to_buffer(m));

    auto store = open_datastore(path);
    H5DS_ASSERT_EQ(store->files().size(), 1u);
    H5DS_ASSERT_EQ(store->variable_names(), (std::vector<std::string>{"x"}));
}

H5DS_TEST_UNIT(h5_default_root_is_working_directory) {
    TempDir dir;
    RowMatrixd m = random_matrix(20, 2);
    H5Writer(dir.file("a.h5")).dataset<double>("cwd", {20, 2}, to_buffer(m));

    WorkingDirectory cwd(dir.path());
    auto store = open_datastore();
    H5DS_ASSERT_EQ(store->files().size(), 1u);
    H5DS_ASSERT_EQ(store->variable_names(), (std::vector<std::string>{"cwd"}));
    ReadResult r = store->read();
    H5DS_ASSERT_TRUE(matrices_equal(as_matrix<double>(r.data.at("cwd")), m));
}

H5DS_TEST_UNIT(h5_variables_listed_in_name_order) {
    TempDir dir;
    std::vector<double> v(10, 1.0);
    H5Writer(dir.file("a.h5"))
        .dataset<double>("zeta", {10}, v)
        .dataset<double>("Alpha", {10}, v)
        .dataset<double>("beta", {10}, v);
    auto store = open_datastore(dir.str());
    H5DS_ASSERT_EQ(store->variable_names(), (std::vector<std::string>{"Alpha", "beta", "zeta"}));
}

// =============================================================================
// Split Reads Against the Oracle
// =============================================================================

H5DS_TEST_UNIT(h5_small_splits_match_oracle) {
    TempDir dir;
    auto parts = write_parts(dir, 3, 200, 4);

    DatastoreOptions opts;
    opts.max_split_bytes = 1024;
    auto store = open_datastore(dir.str(), opts);
    H5DS_ASSERT_EQ(store->files().size(), 3u);

    std::map<std::string, std::vector<bool>> covered;
    Size blocks = 0;
    double last_progress = 0.0;
    while (store->has_data()) {
        ReadResult r = store->read();
        ++blocks;
        const auto& expected = parts.at(filename(r.info.split.path));
        for (const auto& vw : r.info.variables) {
            const RowMatrixd& source = vw.variable.name() == "Data1" ? expected.first
                                                                     : expected.second;
            RowMatrixd want = select_rows(source, vw.window.start_row, vw.window.row_count);
            H5DS_ASSERT_TRUE(matrices_equal(as_matrix<double>(r.data.at(vw.variable.name())), want));

            auto& rows = covered[filename(r.info.split.path) + ":" + vw.variable.name()];
            rows.resize(201, false);
            for (RowIndex k = 0; k < vw.window.row_count; ++k) {
                rows[vw.window.start_row + k] = true;
            }
        }
        H5DS_ASSERT_GE(store->progress(), last_progress);
        last_progress = store->progress();
    }

    // 1024-byte splits over 32-byte rows: at least 7 blocks per file
    H5DS_ASSERT_GE(blocks, 21u);
    H5DS_ASSERT_EQ(covered.size(), 6u);
    for (const auto& [key, rows] : covered) {
        for (Size k = 1; k <= 200; ++k) {
            H5DS_ASSERT_MSG(rows[k], key + " missed row " + std::to_string(k));
        }
    }
    H5DS_ASSERT_NEAR(store->progress(), 1.0, 0.0);
}

H5DS_TEST_UNIT(h5_decimated_hyperslab) {
    TempDir dir;
    RowMatrixd m = random_matrix(100, 5, 7);
    H5Writer(dir.file("a.h5")).dataset<double>("Data1", {100, 5}, to_buffer(m));

    DatastoreOptions opts;
    opts.max_split_bytes = 400;   // 10 rows of 40 bytes
    opts.decimation = 3;
    auto store = open_datastore(dir.str(), opts);

    ReadResult first = store->read();
    const ReadWindow& w = first.info.variables[0].window;
    H5DS_ASSERT_EQ(w.start_row, 1u);
    H5DS_ASSERT_EQ(w.row_count, 10u);
    H5DS_ASSERT_EQ(first.data.at("Data1").rows(), 4u);
    H5DS_ASSERT_TRUE(matrices_equal(as_matrix<double>(first.data.at("Data1")),
                                    select_rows(m, 1, 10, 3)));

    ReadResult second = store->read();
    H5DS_ASSERT_TRUE(matrices_equal(as_matrix<double>(second.data.at("Data1")),
                                    select_rows(m, 11, 10, 3)));
}

H5DS_TEST_UNIT(h5_reset_rereads_identical_data) {
    TempDir dir;
    write_parts(dir, 2, 64, 2);
    DatastoreOptions opts;
    opts.max_split_bytes = 256;
    auto store = open_datastore(dir.str(), opts);

    std::vector<RowMatrixd> first;
    while (store->has_data()) {
        first.emplace_back(as_matrix<double>(store->read().data.at("Data1")));
    }
    store->reset();
    Size i = 0;
    while (store->has_data()) {
        RowMatrixd again = as_matrix<double>(store->read().data.at("Data1"));
        H5DS_ASSERT_TRUE(i < first.size());
        H5DS_ASSERT_TRUE(matrices_equal(again, first[i]));
        ++i;
    }
    H5DS_ASSERT_EQ(i, first.size());
}

// =============================================================================
// Element Types
// =============================================================================

H5DS_TEST_UNIT(h5_integer_dataset) {
    TempDir dir;
    RowMatrix<std::int32_t> m = iota_matrix<std::int32_t>(30, 4);
    H5Writer(dir.file("a.h5")).dataset<std::int32_t>("ints", {30, 4}, to_buffer(m));

    auto store = open_datastore(dir.str());
    const VariableSchema& v = store->schema().at("ints");
    H5DS_ASSERT_STR_EQ(v.type_name(), "int32");
    H5DS_ASSERT_EQ(v.type_class(), TypeClass::Integer);
    H5DS_ASSERT_EQ(v.bytes_per_row(), 16u);

    ReadResult r = store->read();
    const io::ArrayData& a = r.data.at("ints");
    H5DS_ASSERT_STR_EQ(a.type_name(), "int32");
    H5DS_ASSERT_TRUE(matrices_equal(as_matrix<std::int32_t>(a), m));
    H5DS_ASSERT_THROWS((void)a.values<double>(), TypeMismatchError);
}

H5DS_TEST_UNIT(h5_one_dimensional_dataset) {
    TempDir dir;
    std::vector<std::uint16_t> values(40);
    for (Size i = 0; i < values.size(); ++i) values[i] = static_cast<std::uint16_t>(i * 3);
    H5Writer(dir.file("a.h5")).dataset<std::uint16_t>("series", {40}, values);

    DatastoreOptions opts;
    opts.max_split_bytes = 20;   // 10 rows of 2 bytes
    auto store = open_datastore(dir.str(), opts);

    ReadResult r = store->read();
    const io::ArrayData& a = r.data.at("series");
    H5DS_ASSERT_EQ(a.shape(), (Shape{10}));
    auto got = a.values<std::uint16_t>();
    H5DS_ASSERT_EQ(got[0], 0);
    H5DS_ASSERT_EQ(got[9], 27);
}

// =============================================================================
// Metadata
// =============================================================================

H5DS_TEST_UNIT(h5_metadata_chunking_and_attributes) {
    TempDir dir;
    const std::string path = dir.file("a.h5");
    RowMatrixd m = random_matrix(100, 3);
    H5Writer(path)
        .chunked<double>("grow", {100, 3}, {25, 3}, to_buffer(m))
        .dataset<double>("fixed", {100, 3}, to_buffer(m))
        .attribute<double>("grow", "scale", 0.5)
        .attribute<std::int32_t>("grow", "channel", 2);

    io::FileInfo info = io::H5MetadataProvider().describe(path);
    H5DS_ASSERT_EQ(info.variables.size(), 2u);

    const io::VariableInfo& fixed = info.variables[0];
    const io::VariableInfo& grow = info.variables[1];
    H5DS_ASSERT_STR_EQ(fixed.name, "fixed");
    H5DS_ASSERT_STR_EQ(fixed.locator, "/fixed");
    H5DS_ASSERT_FALSE(fixed.chunk_shape.has_value());
    H5DS_ASSERT_EQ(fixed.max_shape, (Shape{100, 3}));
    H5DS_ASSERT_TRUE(fixed.attributes.empty());

    H5DS_ASSERT_STR_EQ(grow.name, "grow");
    H5DS_ASSERT_TRUE(grow.chunk_shape.has_value());
    H5DS_ASSERT_EQ(*grow.chunk_shape, (Shape{25, 3}));
    H5DS_ASSERT_EQ(grow.shape, (Shape{100, 3}));
    H5DS_ASSERT_EQ(grow.max_shape, (Shape{UNLIMITED, 3}));
    H5DS_ASSERT_EQ(grow.attributes, (std::vector<std::string>{"channel", "scale"}));
    H5DS_ASSERT_EQ(grow.element_size, 8u);
    H5DS_ASSERT_STR_EQ(grow.type_name, "float64");
}

H5DS_TEST_UNIT(h5_chunked_dataset_reads) {
    TempDir dir;
    RowMatrixd m = random_matrix(100, 3, 11);
    H5Writer(dir.file("a.h5")).chunked<double>("grow", {100, 3}, {16, 3}, to_buffer(m));

    DatastoreOptions opts;
    opts.max_split_bytes = 480;   // 20 rows
    auto store = open_datastore(dir.str(), opts);
    ReadResult r = store->read();
    (void)r;
    ReadResult r2 = store->read();
    H5DS_ASSERT_TRUE(matrices_equal(as_matrix<double>(r2.data.at("grow")), select_rows(m, 21, 20)));
}

H5DS_TEST_UNIT(h5_nested_datasets_are_not_variables) {
    TempDir dir;
    const std::string path = dir.file("a.h5");
    std::vector<double> v(8, 2.0);
    H5Writer(path)
        .dataset<double>("top", {8}, v)
        .group("grp")
        .dataset<double>("grp/inner", {8}, v);

    io::FileInfo info = io::H5MetadataProvider().describe(path);
    H5DS_ASSERT_EQ(info.variables.size(), 1u);
    H5DS_ASSERT_STR_EQ(info.variables[0].name, "top");
}

H5DS_TEST_UNIT(h5_missing_variable_dropped_across_files) {
    TempDir dir;
    std::vector<double> v(20, 1.0);
    H5Writer(dir.file("f1.h5")).dataset<double>("A", {10, 2}, v).dataset<double>("B", {10, 2}, v);
    H5Writer(dir.file("f2.h5")).dataset<double>("A", {10, 2}, v);

    auto store = open_datastore(dir.str());
    H5DS_ASSERT_EQ(store->variable_names(), (std::vector<std::string>{"A"}));
    H5DS_ASSERT_EQ(store->warnings().size(), 1u);
    H5DS_ASSERT_STR_CONTAINS(store->warnings()[0].file, "f2.h5");
    H5DS_ASSERT_EQ(store->warnings()[0].variables, (std::vector<std::string>{"B"}));
}

// =============================================================================
// Reader Errors
// =============================================================================

H5DS_TEST_UNIT(h5_variable_length_strings_rejected_at_read) {
    TempDir dir;
    std::vector<double> v(16, 0.0);
    H5Writer(dir.file("a.h5"))
        .dataset<double>("values", {16}, v)
        .vlen_strings("labels", 16);

    auto store = open_datastore(dir.str());
    const VariableSchema& labels = store->schema().at("labels");
    H5DS_ASSERT_EQ(labels.type_class(), TypeClass::VarLen);

    H5DS_ASSERT_THROWS((void)store->read(), TypeError);
    H5DS_ASSERT_NEAR(store->progress(), 0.0, 0.0);

    store->select_variables({"values"});
    ReadResult r = store->read();
    H5DS_ASSERT_EQ(r.data.at("values").rows(), 16u);
}

H5DS_TEST_UNIT(h5_reader_bounds_checks) {
    TempDir dir;
    const std::string path = dir.file("a.h5");
    std::vector<double> v(30, 0.0);
    H5Writer(path).dataset<double>("x", {10, 3}, v);

    io::H5ArrayReader reader;
    H5DS_ASSERT_THROWS((void)reader.read_rows(path, "/x", 9, 5, {3}, 1), RangeError);
    H5DS_ASSERT_THROWS((void)reader.read_rows(path, "/x", 1, 5, {4}, 1), RangeError);
    H5DS_ASSERT_THROWS((void)reader.read_rows(path, "/x", 1, 5, {3, 1}, 1), RangeError);
    H5DS_ASSERT_THROWS((void)reader.read_rows(path, "/x", 0, 5, {3}, 1), ValueError);
    H5DS_ASSERT_THROWS((void)reader.read_rows(path, "/nope", 1, 5, {3}, 1), IOError);
    H5DS_ASSERT_THROWS((void)reader.read_rows(dir.file("gone.h5"), "/x", 1, 5, {3}, 1), IOError);

    io::ArrayData none = reader.read_rows(path, "/x", 4, 0, {3}, 1);
    H5DS_ASSERT_EQ(none.shape(), (Shape{0, 3}));
    H5DS_ASSERT_TRUE(none.empty());
}

// =============================================================================
// Open Errors
// =============================================================================

H5DS_TEST_UNIT(h5_missing_root) {
    TempDir dir;
    H5DS_ASSERT_THROWS((void)open_datastore(dir.str() + "/does-not-exist"), FileNotFoundError);
}

H5DS_TEST_UNIT(h5_empty_directory) {
    TempDir dir;
    H5DS_ASSERT_THROWS((void)open_datastore(dir.str()), SchemaError);
}

H5DS_TEST_UNIT(h5_unreadable_baseline) {
    TempDir dir;
    {
        std::ofstream out(dir.file("broken.h5"));
        out << "this is not an HDF5 file";
    }
    bool caught = false;
    try {
        (void)open_datastore(dir.str());
    } catch (const SchemaError& e) {
        caught = true;
        H5DS_ASSERT_STR_CONTAINS(e.message(), "broken.h5");
    }
    H5DS_ASSERT_TRUE(caught);
}

H5DS_TEST_END

H5DS_TEST_MAIN()
