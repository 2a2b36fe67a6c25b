#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Make sure the WebSocket-to-stdio helper is present and executable at
// helper_path. If not, download the release archive from `url`, take the
// first file member whose name contains "rtunnel", install it with mode
// 0755. Presence is the only check. Throws TunnelError on any failure.
std::filesystem::path ensure_helper_binary(const std::filesystem::path& helper_path,
                                           const std::string& url,
                                           StatusCallback callback = nullptr);

// Install step alone, from archive bytes already in memory.
void install_helper_from_archive(const std::string& archive_bytes,
                                 const std::filesystem::path& helper_path);
