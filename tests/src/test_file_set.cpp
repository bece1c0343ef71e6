// =============================================================================
// h5ds - File Set Tests
// =============================================================================
//
// Coverage for h5ds/io/file_set.hpp:
//   - Directory scan with extension filter
//   - Recursive and flat enumeration
//   - Sorting, sizes, single-file roots
//   - from_paths
//   - Dangling links skipped without raising
//
// =============================================================================

#include "test.hpp"

#include "h5ds/io/file_set.hpp"

#include <fstream>

using namespace h5ds;
using namespace h5ds::test;

namespace {

void touch(const std::string& path, std::size_t bytes) {
    std::ofstream out(path, std::ios::binary);
    out << std::string(bytes, 'x');
}

std::vector<std::string> names_under(const TempDir& dir, const io::FileSet& set) {
    std::vector<std::string> out;
    for (const auto& f : set.files()) {
        out.push_back(std::filesystem::relative(f.path, dir.path()).generic_string());
    }
    return out;
}

} // namespace

H5DS_TEST_BEGIN

// =============================================================================
// Directory Scan
// =============================================================================

H5DS_TEST_UNIT(fileset_filters_by_extension) {
    TempDir dir;
    touch(dir.file("b.h5"), 10);
    touch(dir.file("a.h5"), 20);
    touch(dir.file("notes.txt"), 5);
    touch(dir.file("c.h5.bak"), 5);

    io::FileSet set(dir.str());
    H5DS_ASSERT_EQ(names_under(dir, set), (std::vector<std::string>{"a.h5", "b.h5"}));
    H5DS_ASSERT_EQ(set.files()[0].size, 20u);
    H5DS_ASSERT_EQ(set.total_bytes(), 30u);
    H5DS_ASSERT_STR_EQ(set.root(), dir.str());
}

H5DS_TEST_UNIT(fileset_extension_case_insensitive) {
    TempDir dir;
    touch(dir.file("upper.H5"), 1);
    touch(dir.file("lower.h5"), 1);

    io::FileSet set(dir.str());
    H5DS_ASSERT_EQ(set.size(), 2u);

    io::FileSet custom(dir.str(), io::FileSetOptions{{"H5"}, true});
    H5DS_ASSERT_EQ(custom.size(), 2u);
}

H5DS_TEST_UNIT(fileset_multiple_extensions) {
    TempDir dir;
    touch(dir.file("a.h5"), 1);
    touch(dir.file("b.hdf5"), 1);
    touch(dir.file("c.nc"), 1);

    io::FileSet set(dir.str(), io::FileSetOptions{{".h5", ".hdf5"}, true});
    H5DS_ASSERT_EQ(names_under(dir, set), (std::vector<std::string>{"a.h5", "b.hdf5"}));
}

H5DS_TEST_UNIT(fileset_recurses_into_subfolders) {
    TempDir dir;
    touch(dir.file("top.h5"), 1);
    touch(dir.file("sub/inner.h5"), 1);
    touch(dir.file("sub/deeper/leaf.h5"), 1);

    io::FileSet all(dir.str());
    H5DS_ASSERT_EQ(names_under(dir, all),
                   (std::vector<std::string>{"sub/deeper/leaf.h5", "sub/inner.h5", "top.h5"}));

    io::FileSet flat(dir.str(), io::FileSetOptions{{".h5"}, false});
    H5DS_ASSERT_EQ(names_under(dir, flat), (std::vector<std::string>{"top.h5"}));
}

H5DS_TEST_UNIT(fileset_keeps_empty_files) {
    TempDir dir;
    touch(dir.file("empty.h5"), 0);
    io::FileSet set(dir.str());
    H5DS_ASSERT_EQ(set.size(), 1u);
    H5DS_ASSERT_EQ(set.files()[0].size, 0u);
}

H5DS_TEST_UNIT(fileset_skips_dangling_links) {
    TempDir dir;
    touch(dir.file("real.h5"), 8);
    std::filesystem::create_symlink(dir.file("gone.h5"), dir.file("dangling.h5"));
    touch(dir.file("sub/inner.h5"), 2);
    std::filesystem::create_directory_symlink(dir.file("nowhere"), dir.file("sub/loop"));

    io::FileSet set(dir.str());
    H5DS_ASSERT_EQ(names_under(dir, set), (std::vector<std::string>{"real.h5", "sub/inner.h5"}));
}

H5DS_TEST_UNIT(fileset_empty_directory) {
    TempDir dir;
    io::FileSet set(dir.str());
    H5DS_ASSERT_TRUE(set.empty());
    H5DS_ASSERT_EQ(set.total_bytes(), 0u);
}

// =============================================================================
// Roots
// =============================================================================

H5DS_TEST_UNIT(fileset_single_file_root) {
    TempDir dir;
    const std::string path = dir.file("data.bin");
    touch(path, 42);
    touch(dir.file("other.h5"), 1);

    // An explicit file is taken regardless of its extension
    io::FileSet set(path);
    H5DS_ASSERT_EQ(set.size(), 1u);
    H5DS_ASSERT_STR_EQ(set.files()[0].path, path);
    H5DS_ASSERT_EQ(set.files()[0].size, 42u);
}

H5DS_TEST_UNIT(fileset_missing_root) {
    TempDir dir;
    H5DS_ASSERT_THROWS(io::FileSet(dir.str() + "/missing"), FileNotFoundError);
}

H5DS_TEST_UNIT(fileset_from_paths_keeps_order) {
    TempDir dir;
    const std::string b = dir.file("b.h5");
    const std::string a = dir.file("a.h5");
    touch(b, 3);
    touch(a, 4);

    io::FileSet set = io::FileSet::from_paths({b, a});
    H5DS_ASSERT_EQ(set.size(), 2u);
    H5DS_ASSERT_STR_EQ(set.files()[0].path, b);
    H5DS_ASSERT_EQ(set.files()[1].size, 4u);

    H5DS_ASSERT_THROWS((void)io::FileSet::from_paths({a, dir.file("nope.h5")}), FileNotFoundError);
}

H5DS_TEST_END

H5DS_TEST_MAIN()
