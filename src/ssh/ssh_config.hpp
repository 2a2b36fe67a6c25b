#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include "tunnel_config.hpp"

// OpenSSH client config for reaching a Bridge through the helper, so plain
// `ssh <alias>` works outside bridgectl.

// One "Host <alias>" block. alias defaults to the profile name.
std::string generate_ssh_config(const BridgeProfile& profile,
                                const std::filesystem::path& helper_path,
                                const std::string& host_alias = "");

// Blocks for every profile, separated by a blank line. "" when none.
std::string generate_all_ssh_configs(const TunnelConfig& config);

// Replace the existing block whose Host line names `host_alias` (up to the
// next Host line), or append the block. Returns true when a block was
// replaced, false when appended.
Result<bool> install_ssh_config(const std::string& block, const std::string& host_alias,
                                const std::filesystem::path& ssh_config_path);

std::filesystem::path default_ssh_config_path();
