#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <functional>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace platform {

namespace {

// Iterate regular-file entries. The visitor returns true to stop early.
void for_each_file(const std::string& bytes,
                   const std::function<bool(struct archive*, const std::string&)>& visit) {
    std::unique_ptr<struct archive, decltype(&archive_read_free)> reader(archive_read_new(),
                                                                        archive_read_free);
    struct archive* a = reader.get();
    if (!a) throw std::runtime_error("Failed to create archive reader");

    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);

    auto error_of = [a] {
        const char* err = archive_error_string(a);
        return std::string(err ? err : "unknown");
    };

    if (archive_read_open_memory(a, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to open archive: " + error_of());
    }

    struct archive_entry* entry;
    int rc;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        if (archive_entry_filetype(entry) != AE_IFREG) continue;
        const char* path = archive_entry_pathname(entry);
        if (visit(a, path ? path : "")) break;
    }

    if (rc != ARCHIVE_OK && rc != ARCHIVE_EOF) {
        throw std::runtime_error("Failed to read archive: " + error_of());
    }
}

std::string read_data(struct archive* a) {
    std::string out;
    char buf[65536];
    la_ssize_t n;
    while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    if (n < 0) {
        const char* err = archive_error_string(a);
        throw std::runtime_error(std::string("Failed to read archive member: ") +
                                 (err ? err : "unknown"));
    }
    return out;
}

bool name_matches(const std::string& path, const std::string& name) {
    if (path == name) return true;
    return path.size() > name.size() &&
           path.compare(path.size() - name.size() - 1, std::string::npos, "/" + name) == 0;
}

} // namespace

std::optional<std::string> read_first_file(const std::string& archive_bytes) {
    std::optional<std::string> result;
    for_each_file(archive_bytes, [&](struct archive* a, const std::string&) {
        result = read_data(a);
        return true;
    });
    return result;
}

std::optional<std::string> read_member(const std::string& archive_bytes,
                                       const std::string& name) {
    std::optional<std::string> result;
    for_each_file(archive_bytes, [&](struct archive* a, const std::string& path) {
        if (!name_matches(path, name)) return false;
        result = read_data(a);
        return true;
    });
    return result;
}

std::vector<std::string> list_members(const std::string& archive_bytes) {
    std::vector<std::string> names;
    for_each_file(archive_bytes, [&](struct archive*, const std::string& path) {
        names.push_back(path);
        return false;
    });
    return names;
}

std::vector<fs::path> extract_all(const std::string& archive_bytes, const fs::path& dest_dir) {
    std::vector<fs::path> written;
    fs::create_directories(dest_dir);
    for_each_file(archive_bytes, [&](struct archive* a, const std::string& path) {
        fs::path rel = fs::path(path).lexically_normal();
        if (rel.empty() || rel.is_absolute() || *rel.begin() == "..") return false;

        fs::path out_path = dest_dir / rel;
        fs::create_directories(out_path.parent_path());
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Cannot write " + out_path.string());
        out << read_data(a);
        written.push_back(out_path);
        return false;
    });
    return written;
}

} // namespace platform
