#include "shipyard/resource_resolver.hpp"
#include "shipyard/hashing.hpp"
#include "shipyard/prn.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

namespace shipyard {

std::chrono::milliseconds retry_delay(const RetryPolicy& retry, uint32_t attempt) {
    const uint64_t cap = static_cast<uint64_t>(kMaxRetryDelay.count());
    const uint64_t base = static_cast<uint64_t>(
        std::max<std::chrono::milliseconds::rep>(retry.base_delay.count(), 0));
    // 2^30 already exceeds the cap for any non-zero base
    const uint64_t factor = uint64_t{1} << std::min<uint32_t>(attempt, 30);
    if (base != 0 && factor > cap / base) {
        return kMaxRetryDelay;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
        std::min(base * factor, cap)));
}

ResourceResolver::ResourceResolver(Registry& registry, RetryPolicy retry)
    : registry_(registry),
      retry_(retry),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

template<typename T>
Result<T> ResourceResolver::with_retry(const std::string& what,
                                       const std::function<Result<T>()>& op) {
    for (uint32_t attempt = 0;; ++attempt) {
        Result<T> result = op();
        if (result.isOk() || result.error().code() != ErrorCode::RATE_LIMITED ||
            attempt >= retry_.max_retries) {
            return result;
        }
        auto delay = retry_delay(retry_, attempt);
        spdlog::debug("{} rate limited, retrying in {} ms (retry {}/{})", what,
                      delay.count(), attempt + 1, retry_.max_retries);
        sleep_(delay);
    }
}

// ============================================================================
// Binaries
// ============================================================================

Result<std::optional<Binary>> ResourceResolver::find_binary(const GetOrCreateBinaryParams& params) {
    using R = Result<std::optional<Binary>>;

    if (params.id) {
        auto builder = PrnBuilder::from_prn(params.artifact_version_prn);
        if (builder.isErr()) {
            return R::err(builder.error().withContext("artifact version PRN"));
        }
        auto prn = builder.value().binary(*params.id);
        if (prn.isErr()) {
            return R::err(prn.error().withContext("binary id"));
        }
        const std::string binary_prn = prn.value();
        return with_retry<std::optional<Binary>>("get binary " + binary_prn,
            [&]() { return registry_.get_binary(binary_prn); });
    }

    ListBinariesQuery query;
    query.artifact_version_prn = params.artifact_version_prn;
    query.target = params.target;
    auto listed = with_retry<std::vector<Binary>>("list binaries",
        [&]() { return registry_.list_binaries(query); });
    if (listed.isErr()) {
        return R::err(listed.error());
    }

    const auto& binaries = listed.value();
    if (binaries.empty()) {
        return R::ok(std::nullopt);
    }
    if (binaries.size() > 1) {
        std::string prns;
        for (const auto& b : binaries) {
            if (!prns.empty()) prns += ", ";
            prns += b.prn;
        }
        return R::err(Error(ErrorCode::AMBIGUOUS_MATCH,
            std::to_string(binaries.size()) + " binaries exist for target '" + params.target +
            "' in artifact version " + params.artifact_version_prn + " (" + prns +
            "); remove the extras or pass an explicit binary id"));
    }
    return R::ok(binaries.front());
}

Result<Binary> ResourceResolver::reconcile(const Binary& existing,
                                           const GetOrCreateBinaryParams& params) {
    bool same_hash = existing.hash && to_lower_hex(*existing.hash) == to_lower_hex(params.hash);
    bool same_size = existing.size && *existing.size == params.size;
    if (same_hash && same_size) {
        spdlog::debug("binary {} already matches local content", existing.prn);
        return Result<Binary>::ok(existing);
    }

    if (existing.state == BinaryState::Signed) {
        return Result<Binary>::err(Error(ErrorCode::INTEGRITY_CONFLICT,
            "binary " + existing.prn + " for target '" + params.target +
            "' in artifact version " + params.artifact_version_prn +
            " is signed and its hash/size differ from the local content; "
            "signed binaries are immutable, create a new binary instead"));
    }

    if (!reset_allowed(existing.state)) {
        return Result<Binary>::err(Error(ErrorCode::INTEGRITY_CONFLICT,
            "binary " + existing.prn + " for target '" + params.target +
            "' differs from the local content and cannot be reset from state " +
            (existing.state_text.empty() ? binary_state_to_string(existing.state)
                                         : existing.state_text)));
    }

    spdlog::info("binary {} differs from local content, resetting to uploadable", existing.prn);

    UpdateBinaryParams reset;
    reset.prn = existing.prn;
    reset.state = BinaryState::Uploadable;
    auto reset_result = with_retry<Binary>("reset binary " + existing.prn,
        [&]() { return registry_.update_binary(reset); });
    if (reset_result.isErr()) {
        return Result<Binary>::err(reset_result.error().withContext("resetting " + existing.prn));
    }

    UpdateBinaryParams update;
    update.prn = existing.prn;
    update.hash = params.hash;
    update.size = params.size;
    auto updated = with_retry<Binary>("update binary " + existing.prn,
        [&]() { return registry_.update_binary(update); });
    if (updated.isErr()) {
        return Result<Binary>::err(updated.error().withContext("updating " + existing.prn));
    }
    return updated;
}

Result<Binary> ResourceResolver::get_or_create_binary(const GetOrCreateBinaryParams& params) {
    using R = Result<Binary>;

    if (params.artifact_version_prn.empty() || params.target.empty()) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            "a binary needs an artifact version PRN and a target"));
    }
    std::vector<uint8_t> digest;
    if (params.hash.size() != 64 || !hex_to_bytes(params.hash, digest)) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            "binary hash must be a 64 character hex SHA-256, got '" + params.hash + "'"));
    }

    auto found = find_binary(params);
    if (found.isErr()) {
        return R::err(found.error());
    }
    if (found.value()) {
        return reconcile(*found.value(), params);
    }

    CreateBinaryParams create;
    create.artifact_version_prn = params.artifact_version_prn;
    create.id = params.id;
    create.target = params.target;
    create.hash = to_lower_hex(params.hash);
    create.size = params.size;
    create.description = params.description;
    create.custom_metadata = params.custom_metadata;

    auto created = with_retry<Binary>("create binary",
        [&]() { return registry_.create_binary(create); });
    if (created.isErr()) {
        return R::err(created.error().withContext(
            "creating binary for target '" + params.target + "'"));
    }
    spdlog::info("created binary {} for target '{}'", created.value().prn, params.target);
    return created;
}

// ============================================================================
// Artifacts and Versions
// ============================================================================

Result<Artifact> ResourceResolver::get_or_create_artifact(const GetOrCreateArtifactParams& params) {
    using R = Result<Artifact>;

    auto builder = PrnBuilder::from_prn(params.organization_prn);
    if (builder.isErr()) return R::err(builder.error());
    auto prn = builder.value().artifact(params.artifact_id);
    if (prn.isErr()) return R::err(prn.error().withContext("artifact '" + params.name + "'"));
    const std::string artifact_prn = prn.value();

    auto lookup = [&]() {
        return with_retry<std::optional<Artifact>>("get artifact " + artifact_prn,
            [&]() { return registry_.get_artifact(artifact_prn); });
    };

    auto existing = lookup();
    if (existing.isErr()) {
        return R::err(existing.error().withContext("looking up artifact '" + params.name + "'"));
    }
    if (existing.value()) {
        return R::ok(*existing.value());
    }

    CreateArtifactParams create;
    create.id = params.artifact_id;
    create.name = params.name;
    create.description = params.description;

    auto created = with_retry<Artifact>("create artifact " + params.name,
        [&]() { return registry_.create_artifact(create); });
    if (created.isOk()) {
        spdlog::info("created artifact '{}' ({})", params.name, created.value().prn);
        return created;
    }
    if (created.error().code() != ErrorCode::CONFLICT) {
        return R::err(created.error().withContext("creating artifact '" + params.name + "'"));
    }

    // Lost a creation race; the other writer's record is the one to use
    auto raced = lookup();
    if (raced.isErr()) return R::err(raced.error());
    if (!raced.value()) {
        return R::err(Error(ErrorCode::REGISTRY_ERROR,
            "artifact '" + params.name + "' reported as existing but could not be read"));
    }
    return R::ok(*raced.value());
}

Result<ArtifactVersion> ResourceResolver::get_or_create_artifact_version(
    const GetOrCreateArtifactVersionParams& params) {
    using R = Result<ArtifactVersion>;

    auto builder = PrnBuilder::from_prn(params.organization_prn);
    if (builder.isErr()) return R::err(builder.error());
    auto prn = builder.value().artifact_version(params.version_id);
    if (prn.isErr()) {
        return R::err(prn.error().withContext("artifact version '" + params.version + "'"));
    }
    const std::string version_prn = prn.value();

    auto lookup = [&]() {
        return with_retry<std::optional<ArtifactVersion>>("get artifact version " + version_prn,
            [&]() { return registry_.get_artifact_version(version_prn); });
    };

    auto existing = lookup();
    if (existing.isErr()) {
        return R::err(existing.error().withContext(
            "looking up artifact version '" + params.version + "'"));
    }
    if (existing.value()) {
        return R::ok(*existing.value());
    }

    CreateArtifactVersionParams create;
    create.artifact_prn = params.artifact_prn;
    create.id = params.version_id;
    create.version = params.version;
    create.description = params.description;

    auto created = with_retry<ArtifactVersion>("create artifact version " + params.version,
        [&]() { return registry_.create_artifact_version(create); });
    if (created.isOk()) {
        spdlog::info("created artifact version '{}' ({})", params.version, created.value().prn);
        return created;
    }
    if (created.error().code() != ErrorCode::CONFLICT) {
        return R::err(created.error().withContext(
            "creating artifact version '" + params.version + "'"));
    }

    auto raced = lookup();
    if (raced.isErr()) return R::err(raced.error());
    if (!raced.value()) {
        return R::err(Error(ErrorCode::REGISTRY_ERROR,
            "artifact version '" + params.version + "' reported as existing but could not be read"));
    }
    return R::ok(*raced.value());
}

} // namespace shipyard
