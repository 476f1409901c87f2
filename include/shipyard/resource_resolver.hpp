#pragma once

#include "shipyard/config.hpp"
#include "shipyard/registry.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace shipyard {

struct GetOrCreateBinaryParams {
    std::string artifact_version_prn;
    std::string target;
    std::string hash;            // local content hash, lowercase hex
    uint64_t size = 0;           // local content size
    std::optional<std::string> id;
    std::optional<std::string> description;
    nlohmann::json custom_metadata;
};

struct GetOrCreateArtifactParams {
    std::string organization_prn;
    std::string artifact_id;
    std::string name;
    std::optional<std::string> description;
};

struct GetOrCreateArtifactVersionParams {
    std::string organization_prn;
    std::string artifact_prn;
    std::string version_id;
    std::string version;
    std::optional<std::string> description;
};

constexpr std::chrono::milliseconds kMaxRetryDelay{60 * 1000};

// base_delay doubled for every earlier retry, never above kMaxRetryDelay
std::chrono::milliseconds retry_delay(const RetryPolicy& retry, uint32_t attempt);

/**
 * Get-or-create for registry resources.
 *
 * A binary that already exists with the same hash and size is returned
 * as-is. One whose content differs is reset to uploadable and updated,
 * unless it is signed, which is an integrity conflict. Several binaries
 * for the same target and version are never resolved automatically.
 *
 * Registry calls that are rate limited are retried with exponential
 * backoff according to the retry policy.
 */
class ResourceResolver {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    explicit ResourceResolver(Registry& registry, RetryPolicy retry = {});

    Result<Binary> get_or_create_binary(const GetOrCreateBinaryParams& params);
    Result<Artifact> get_or_create_artifact(const GetOrCreateArtifactParams& params);
    Result<ArtifactVersion> get_or_create_artifact_version(
        const GetOrCreateArtifactVersionParams& params);

    void set_sleep_function(SleepFn sleep) { sleep_ = std::move(sleep); }

private:
    // Runs op, retrying while it fails with RATE_LIMITED
    template<typename T>
    Result<T> with_retry(const std::string& what, const std::function<Result<T>()>& op);

    Result<std::optional<Binary>> find_binary(const GetOrCreateBinaryParams& params);
    Result<Binary> reconcile(const Binary& existing, const GetOrCreateBinaryParams& params);

    Registry& registry_;
    RetryPolicy retry_;
    SleepFn sleep_;
};

} // namespace shipyard
