#pragma once

#include "shipyard/archive.hpp"
#include "shipyard/config.hpp"
#include "shipyard/http.hpp"
#include "shipyard/progress.hpp"
#include "shipyard/registry.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace shipyard {

struct PushOptions {
    ProcessorConfig processor;
    int api_version = kDefaultApiVersion;
    MatchPolicy match_policy = MatchPolicy::Strict;
    RetryPolicy retry;
    ProgressObserver* observer = nullptr;
};

struct PushReport {
    std::string bundle_prn;
    std::map<std::string, std::string> binary_prns;   // binary id -> PRN
    std::vector<std::string> skipped_artifacts;       // artifact ids
    std::vector<std::string> skipped_versions;        // artifact version ids
};

/**
 * Publishes a bundle archive to the registry.
 *
 * Artifacts and artifact versions are created on a best-effort basis: a
 * failure is logged and the item skipped. Binaries are required, so a
 * binary failure, or a binary whose version was skipped, aborts the push
 * before the bundle is created.
 *
 * Archive files are read twice as a stream: once to parse the manifest and
 * hash every payload, once to hand each matched payload to the binary
 * processor. Only the payload being processed is held in memory.
 */
class BundlePusher {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    BundlePusher(Registry& registry, HttpTransport& transport, PushOptions options);

    Result<PushReport> push(const std::string& archive_path);
    Result<PushReport> push(const ParsedArchive& archive);

    // Replaces the sleep used for retries and state polling
    void set_sleep_function(SleepFn sleep) { sleep_ = std::move(sleep); }

private:
    // Hands the payloads marked in wanted to visit, in archive order
    using PayloadSource = std::function<Result<void>(const std::vector<bool>& wanted,
                                                     const PayloadVisitor& visit)>;

    Result<PushReport> push_payloads(const BundleManifest& manifest,
                                     const std::vector<PayloadInfo>& payloads,
                                     const PayloadSource& source);

    Registry& registry_;
    HttpTransport& transport_;
    PushOptions options_;
    SleepFn sleep_;
};

} // namespace shipyard
