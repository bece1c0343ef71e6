// =============================================================================
// FILE: src/cpp/file_set.cpp
// BRIEF: Directory scan for dataset files
// =============================================================================

#include "h5ds/io/file_set.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace h5ds::io {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool extension_matches(const fs::path& path, const std::vector<std::string>& extensions) {
    if (extensions.empty()) return true;
    const std::string ext = to_lower(path.extension().string());
    for (const auto& wanted : extensions) {
        std::string w = to_lower(wanted);
        if (!w.empty() && w.front() != '.') {
            w.insert(w.begin(), '.');
        }
        if (ext == w) return true;
    }
    return false;
}

FileEntry make_entry(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw IOError("Cannot stat '" + path.string() + "': " + ec.message());
    }
    return FileEntry{path.string(), static_cast<std::uint64_t>(size)};
}

template <typename Iterator>
void collect(const fs::path& root, const std::vector<std::string>& extensions,
             std::vector<FileEntry>& out) {
    std::error_code ec;
    Iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw IOError("Cannot list '" + root.string() + "': " + ec.message());
    }
    const Iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw IOError("Cannot list '" + root.string() + "': " + ec.message());
        }
        const fs::directory_entry& entry = *it;
        // A dangling link reports not_found and is skipped
        const fs::file_status status = entry.status(ec);
        if (ec && status.type() != fs::file_type::not_found) {
            throw IOError("Cannot stat '" + entry.path().string() + "': " + ec.message());
        }
        ec.clear();
        if (!fs::is_regular_file(status)) continue;
        if (!extension_matches(entry.path(), extensions)) continue;
        out.push_back(make_entry(entry.path()));
    }
    if (ec) {
        throw IOError("Cannot list '" + root.string() + "': " + ec.message());
    }
}

} // anonymous namespace

FileSet::FileSet(const std::string& root, FileSetOptions options)
    : _root(root)
{
    const fs::path root_path(root);
    if (!fs::exists(root_path)) {
        throw FileNotFoundError(root);
    }

    if (fs::is_regular_file(root_path)) {
        _files.push_back(make_entry(root_path));
    } else if (options.include_subfolders) {
        collect<fs::recursive_directory_iterator>(root_path, options.extensions, _files);
    } else {
        collect<fs::directory_iterator>(root_path, options.extensions, _files);
    }

    std::sort(_files.begin(), _files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });

    log::logger()->debug("file set '{}': {} file(s), {} byte(s)",
                         _root, _files.size(), total_bytes());
}

FileSet FileSet::from_paths(const std::vector<std::string>& paths) {
    FileSet set;
    set._files.reserve(paths.size());
    for (const auto& p : paths) {
        if (!fs::is_regular_file(p)) {
            throw FileNotFoundError(p);
        }
        set._files.push_back(make_entry(p));
    }
    return set;
}

std::uint64_t FileSet::total_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& f : _files) {
        total += f.size;
    }
    return total;
}

} // namespace h5ds::io
