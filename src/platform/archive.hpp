#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace platform {

// All readers accept any format/filter libarchive understands (zip, tar.gz, ...)
// held in memory. Malformed input throws std::runtime_error.

// Contents of the first non-directory member, or nullopt if there is none.
std::optional<std::string> read_first_file(const std::string& archive_bytes);

// Contents of the member whose path equals `name` or ends with "/<name>".
std::optional<std::string> read_member(const std::string& archive_bytes,
                                       const std::string& name);

// Names of all non-directory members, in archive order.
std::vector<std::string> list_members(const std::string& archive_bytes);

// Extract every regular file under dest_dir. Entries that would escape
// dest_dir ("..", absolute paths) are skipped. Returns the written paths.
std::vector<std::filesystem::path> extract_all(const std::string& archive_bytes,
                                               const std::filesystem::path& dest_dir);

} // namespace platform
