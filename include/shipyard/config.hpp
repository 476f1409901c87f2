#pragma once

#include "shipyard/chunk_planner.hpp"
#include "shipyard/result.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shipyard {

// ============================================================================
// Pipeline Configuration
// ============================================================================

// min(2 x hardware threads, 16), never below 1
uint32_t default_upload_concurrency();

struct UploadConfig {
    uint64_t part_size = kDefaultPartSize;
    uint32_t concurrency = default_upload_concurrency();
};

Result<void> validate_upload_config(const UploadConfig& config);

struct ProcessorConfig {
    UploadConfig upload;
    std::chrono::milliseconds poll_interval{10000};
    uint32_t poll_attempts = 30;
    // Hex SHA-256 of the local content; signing falls back to the
    // binary's stored hash when unset
    std::optional<std::string> content_hash;
};

struct RetryPolicy {
    uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
};

// ============================================================================
// CLI Configuration File
// ============================================================================

struct SigningKeyPair {
    std::string signing_key_prn;
    std::string signing_key_private_path;
};

using SigningKeyPairs = std::map<std::string, SigningKeyPair>;

struct ProfileConfig {
    std::optional<std::string> api_key;
    std::optional<std::string> base_url;
    std::optional<std::string> ca_path;
    std::optional<int> api_version;
};

struct CliConfig {
    std::map<std::string, ProfileConfig> profiles;
    SigningKeyPairs signing_key_pairs;
    std::string source_path;
};

struct CliConfigParseResult {
    bool ok = false;
    std::string error;
    CliConfig config;
    std::vector<std::string> warnings;
};

// Parse config.json content
CliConfigParseResult parse_cli_config(const std::string& json_str,
                                      const std::string& source_path = "");

// Merge credentials.json ({profile: {api_key}}) into the parsed profiles
CliConfigParseResult apply_credentials(CliConfig config, const std::string& json_str);

// Explicit dir > $SHIPYARD_CONFIG_DIR > $XDG_CONFIG_HOME/shipyard > ~/.config/shipyard
std::string resolve_config_dir(const std::optional<std::string>& override_dir);

// Loads <dir>/config.json and <dir>/credentials.json. Missing files yield an
// empty config; malformed files are errors.
CliConfigParseResult load_cli_config(const std::string& config_dir);

} // namespace shipyard
