/**
 * shipyard CLI - Common utilities and types
 */

#pragma once

#include "shipyard/config.hpp"
#include "shipyard/http_registry.hpp"
#include "shipyard/logging.hpp"
#include "shipyard/platform.hpp"
#include "shipyard/types.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace shipyard::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string api_key;           // --api-key, $SHIPYARD_API_KEY
    std::string base_url;          // --base-url
    std::string ca_path;           // --ca-path
    int api_version = 0;           // --api-version (0: profile or default)
    std::string profile;           // --profile
    std::string config_dir;        // --config-dir
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << std::endl;
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Everything a command needs to talk to the registry.
 */
struct Session {
    CliConfig config;
    int api_version = kDefaultApiVersion;
    std::shared_ptr<HttpTransport> transport;
    std::unique_ptr<HttpRegistry> registry;
};

/**
 * Resolve options and open a registry session.
 * Priority for each setting: flag > environment > profile > default.
 */
inline Result<std::unique_ptr<Session>> open_session(const GlobalOptions& opts) {
    using R = Result<std::unique_ptr<Session>>;

    init_logging(LogOptions{opts.verbose, opts.quiet});

    std::optional<std::string> dir_override;
    if (!opts.config_dir.empty()) dir_override = opts.config_dir;
    std::string config_dir = resolve_config_dir(dir_override);

    auto loaded = load_cli_config(config_dir);
    if (!loaded.ok) {
        return R::err(Error(ErrorCode::INVALID_INPUT, loaded.error));
    }
    for (const auto& warning : loaded.warnings) {
        spdlog::warn("{}: {}", loaded.config.source_path, warning);
    }

    auto session = std::make_unique<Session>();
    session->config = std::move(loaded.config);

    ProfileConfig profile;
    std::string profile_name = opts.profile.empty() ? safe_getenv("SHIPYARD_PROFILE") : opts.profile;
    if (!profile_name.empty()) {
        auto it = session->config.profiles.find(profile_name);
        if (it == session->config.profiles.end()) {
            return R::err(Error(ErrorCode::INVALID_INPUT,
                "profile '" + profile_name + "' is not defined in " + config_dir));
        }
        profile = it->second;
    }

    HttpRegistryOptions registry_options;
    if (!opts.api_key.empty()) {
        registry_options.api_key = opts.api_key;
    } else if (profile.api_key) {
        registry_options.api_key = *profile.api_key;
    }
    if (registry_options.api_key.empty()) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            "no API key: pass --api-key, set SHIPYARD_API_KEY or configure a profile"));
    }

    std::string env_base_url = safe_getenv("SHIPYARD_BASE_URL");
    if (!opts.base_url.empty()) {
        registry_options.base_url = opts.base_url;
    } else if (!env_base_url.empty()) {
        registry_options.base_url = env_base_url;
    } else if (profile.base_url) {
        registry_options.base_url = *profile.base_url;
    }

    int api_version = opts.api_version != 0 ? opts.api_version
                                            : profile.api_version.value_or(kDefaultApiVersion);
    auto version_ok = validate_api_version(api_version);
    if (version_ok.isErr()) {
        return R::err(version_ok.error());
    }
    registry_options.api_version = api_version;
    session->api_version = api_version;

    CurlTransportOptions transport_options;
    std::string env_ca = safe_getenv("SHIPYARD_CA_PATH");
    if (!opts.ca_path.empty()) {
        transport_options.ca_bundle_path = opts.ca_path;
    } else if (!env_ca.empty()) {
        transport_options.ca_bundle_path = env_ca;
    } else if (profile.ca_path) {
        transport_options.ca_bundle_path = *profile.ca_path;
    }
    transport_options.user_agent = std::string("shipyard/") + SHIPYARD_VERSION;

    session->transport = std::make_shared<CurlTransport>(transport_options);
    session->registry = std::make_unique<HttpRegistry>(session->transport, registry_options);

    spdlog::debug("registry {} (api version {})", registry_options.base_url, api_version);
    return R::ok(std::move(session));
}

/**
 * Report a failed result and pick the exit code.
 */
inline int fail(const Error& error) {
    print_error(error.message());
    spdlog::debug("error code {}", error_code_name(error.code()));
    return 1;
}

} // namespace shipyard::cli
