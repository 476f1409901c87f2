#include "shipyard/config.hpp"
#include "shipyard/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>

#include <nlohmann/json.hpp>

namespace shipyard {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

uint32_t default_upload_concurrency() {
    unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 1;
    return static_cast<uint32_t>(std::min(2u * hw, 16u));
}

Result<void> validate_upload_config(const UploadConfig& config) {
    auto part_size = validate_part_size(config.part_size);
    if (part_size.isErr()) {
        return part_size;
    }
    if (config.concurrency == 0) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "upload concurrency must be at least 1"));
    }
    return Result<void>::ok();
}

// ============================================================================
// Config File Parsing
// ============================================================================

CliConfigParseResult parse_cli_config(const std::string& json_str,
                                      const std::string& source_path) {
    CliConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            if (key != "profiles" && key != "signing_key_pairs" && key != "version" &&
                key != "certificate_authorities") {
                result.warnings.push_back("unknown_key:" + key);
            }
        }

        // "profiles" section
        if (j.contains("profiles")) {
            if (!j["profiles"].is_object()) {
                result.error = "profiles must be an object";
                return result;
            }
            for (auto& [name, val] : j["profiles"].items()) {
                if (!val.is_object()) {
                    result.warnings.push_back("invalid_profile:" + name);
                    continue;
                }
                ProfileConfig profile;
                profile.api_key = get_string(val, "api_key");
                profile.base_url = get_string(val, "base_url");
                profile.ca_path = get_string(val, "ca_path");
                if (val.contains("api_version")) {
                    if (val["api_version"].is_number_integer()) {
                        profile.api_version = val["api_version"].get<int>();
                    } else {
                        result.warnings.push_back("invalid_api_version:" + name);
                    }
                }
                result.config.profiles[name] = profile;
            }
        }

        // "signing_key_pairs" section
        if (j.contains("signing_key_pairs")) {
            if (!j["signing_key_pairs"].is_object()) {
                result.error = "signing_key_pairs must be an object";
                return result;
            }
            for (auto& [name, val] : j["signing_key_pairs"].items()) {
                auto prn = val.is_object() ? get_string(val, "signing_key_prn") : std::nullopt;
                auto path = val.is_object() ? get_string(val, "signing_key_private_path")
                                            : std::nullopt;
                if (!prn || !path) {
                    result.error = "signing key pair '" + name +
                                   "' needs signing_key_prn and signing_key_private_path";
                    return result;
                }
                result.config.signing_key_pairs[name] = SigningKeyPair{*prn, *path};
            }
        }

        result.ok = true;

    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

CliConfigParseResult apply_credentials(CliConfig config, const std::string& json_str) {
    CliConfigParseResult result;
    result.config = std::move(config);

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            result.error = "credentials JSON must be an object";
            return result;
        }
        for (auto& [name, val] : j.items()) {
            auto key = val.is_object() ? get_string(val, "api_key") : std::nullopt;
            if (!key) {
                result.warnings.push_back("invalid_credentials:" + name);
                continue;
            }
            result.config.profiles[name].api_key = *key;
        }
        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

std::string resolve_config_dir(const std::optional<std::string>& override_dir) {
    if (override_dir && !override_dir->empty()) {
        return *override_dir;
    }

    std::string env_dir = safe_getenv("SHIPYARD_CONFIG_DIR");
    if (!env_dir.empty()) {
        return env_dir;
    }

    std::string xdg = safe_getenv("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return xdg + "/shipyard";
    }

    std::string home = safe_getenv("HOME");
    if (!home.empty()) {
        return home + "/.config/shipyard";
    }

    std::string userprofile = safe_getenv("USERPROFILE");
    if (!userprofile.empty()) {
        return userprofile + "/.config/shipyard";
    }

    return ".shipyard";
}

CliConfigParseResult load_cli_config(const std::string& config_dir) {
    std::string config_path = config_dir + "/config.json";
    std::string credentials_path = config_dir + "/credentials.json";

    CliConfigParseResult result;
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        auto text = read_file_text(config_path);
        if (text.isErr()) {
            result.error = text.error().message();
            return result;
        }
        result = parse_cli_config(text.value(), config_path);
        if (!result.ok) {
            result.error = config_path + ": " + result.error;
            return result;
        }
    } else {
        result.ok = true;
        result.config.source_path = config_path;
    }

    if (fs::exists(credentials_path, ec)) {
        auto text = read_file_text(credentials_path);
        if (text.isErr()) {
            result.ok = false;
            result.error = text.error().message();
            return result;
        }
        auto warnings = std::move(result.warnings);
        result = apply_credentials(std::move(result.config), text.value());
        if (!result.ok) {
            result.error = credentials_path + ": " + result.error;
            return result;
        }
        result.warnings.insert(result.warnings.begin(), warnings.begin(), warnings.end());
    }

    return result;
}

} // namespace shipyard
