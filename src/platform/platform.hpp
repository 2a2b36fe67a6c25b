#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Creates a unique temporary file path with the given prefix. The file is not created.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Write content to path via a sibling temp file and rename(2), so readers
// never observe a partially written file. Throws std::runtime_error on failure.
void atomic_write(const std::filesystem::path& path, const std::string& content);

// True if path is a regular file with an execute bit set.
bool is_executable(const std::filesystem::path& path);

} // namespace platform
