#include "helper_binary.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <forge/http_transport.hpp>
#include <platform/archive.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

void install_helper_from_archive(const std::string& archive_bytes,
                                 const fs::path& helper_path) {
    std::string member;
    try {
        for (const auto& name : platform::list_members(archive_bytes)) {
            if (name.find(HELPER_BINARY_NAME) != std::string::npos) {
                member = name;
                break;
            }
        }
    } catch (const std::runtime_error& e) {
        throw TunnelError(fmt::format("Failed to download {}: {}", HELPER_BINARY_NAME, e.what()));
    }
    if (member.empty()) {
        throw TunnelError(fmt::format("{} binary not found in archive", HELPER_BINARY_NAME));
    }

    auto content = platform::read_member(archive_bytes, member);
    if (!content) {
        throw TunnelError(fmt::format("{} binary not found in archive", HELPER_BINARY_NAME));
    }

    std::error_code ec;
    fs::create_directories(helper_path.parent_path(), ec);
    try {
        platform::atomic_write(helper_path, *content);
    } catch (const std::runtime_error& e) {
        throw TunnelError(fmt::format("Failed to install {}: {}", HELPER_BINARY_NAME, e.what()));
    }
    if (chmod(helper_path.c_str(), 0755) != 0) {
        throw TunnelError("Failed to make " + helper_path.string() + " executable");
    }
    bridge_log(fmt::format("helper: installed {} ({} bytes) from member {}",
                           helper_path.string(), content->size(), member));
}

fs::path ensure_helper_binary(const fs::path& helper_path, const std::string& url,
                              StatusCallback callback) {
    if (platform::is_executable(helper_path)) return helper_path;

    const std::string source = url.empty() ? DEFAULT_HELPER_URL : url;
    if (callback) callback(fmt::format("Downloading {}...", HELPER_BINARY_NAME));
    bridge_log("helper: downloading " + source);

    fs::path tmp = platform::temp_file("bridgectl_helper");
    std::string bytes;
    try {
        CurlTransport http;
        http.download_to_file(source, tmp.string(), HTTP_BYTES_TIMEOUT_SECS);
        std::ifstream in(tmp, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        bytes = ss.str();
    } catch (const std::runtime_error& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw TunnelError(fmt::format("Failed to download {}: {}", HELPER_BINARY_NAME, e.what()));
    }
    std::error_code ec;
    fs::remove(tmp, ec);

    install_helper_from_archive(bytes, helper_path);
    return helper_path;
}
