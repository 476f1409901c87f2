#include <doctest/doctest.h>
#include "shipyard/binary_processor.hpp"
#include "shipyard/resource_resolver.hpp"

#include "test_support.hpp"

using namespace shipyard;
using namespace shipyard::testing;

namespace {

struct ResolverFixture {
    FakeRegistry registry;
    ArtifactVersion version;
    ResourceResolver resolver{registry};

    ResolverFixture() {
        version = registry.add_version(registry.add_artifact("fw"), "1.0.0");
        resolver.set_sleep_function(no_sleep);
    }

    GetOrCreateBinaryParams params_for(const std::vector<uint8_t>& content,
                                       std::optional<std::string> id = std::nullopt) {
        GetOrCreateBinaryParams params;
        params.artifact_version_prn = version.prn;
        params.target = "arm";
        params.hash = sha256_hex(content);
        params.size = content.size();
        params.id = std::move(id);
        return params;
    }
};

} // namespace

TEST_CASE("get_or_create_binary creates once and then finds") {
    ResolverFixture f;
    auto content = make_content(1000);
    auto params = f.params_for(content);

    auto first = f.resolver.get_or_create_binary(params);
    REQUIRE(first.isOk());
    CHECK(first.value().state == BinaryState::Uploadable);
    CHECK(first.value().hash == std::optional<std::string>(sha256_hex(content)));

    auto second = f.resolver.get_or_create_binary(params);
    REQUIRE(second.isOk());
    CHECK(second.value().prn == first.value().prn);
    CHECK(f.registry.calls("create_binary") == 1);
    CHECK(f.registry.updates.empty());
}

TEST_CASE("a caller-chosen id is looked up by its derived PRN") {
    ResolverFixture f;
    auto content = make_content(1000);
    const std::string id = "7e0c8d4f-5a1b-4c2d-8e3f-9a0b1c2d3e4f";

    auto created = f.resolver.get_or_create_binary(f.params_for(content, id));
    REQUIRE(created.isOk());
    CHECK(created.value().prn == PrnBuilder(kOrgId).binary(id).value());

    auto found = f.resolver.get_or_create_binary(f.params_for(content, id));
    REQUIRE(found.isOk());
    CHECK(f.registry.calls("create_binary") == 1);
    CHECK(f.registry.calls("list_binaries") == 0);
}

TEST_CASE("the hash is compared case-insensitively and sent lowercase") {
    ResolverFixture f;
    auto content = make_content(1000);
    auto params = f.params_for(content);
    params.hash = to_upper_hex(params.hash);

    REQUIRE(f.resolver.get_or_create_binary(params).isOk());
    CHECK(f.registry.binary_creates.at(0).hash == sha256_hex(content));
    REQUIRE(f.resolver.get_or_create_binary(params).isOk());
    CHECK(f.registry.updates.empty());
}

TEST_CASE("a signed binary with different content is an integrity conflict") {
    ResolverFixture f;
    auto old_content = make_content(1000, 1);
    auto new_content = make_content(1000, 2);
    f.registry.add_binary(f.version, "arm", old_content, BinaryState::Signed);

    auto result = f.resolver.get_or_create_binary(f.params_for(new_content));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INTEGRITY_CONFLICT);
    CHECK(f.registry.updates.empty());
    CHECK(f.registry.calls("create_binary") == 0);
}

TEST_CASE("a destroyed binary with different content cannot be reset") {
    ResolverFixture f;
    f.registry.add_binary(f.version, "arm", make_content(10, 1), BinaryState::Destroyed);
    auto result = f.resolver.get_or_create_binary(f.params_for(make_content(10, 2)));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INTEGRITY_CONFLICT);
    CHECK(f.registry.updates.empty());
}

TEST_CASE("an unsigned binary with different content is reset and updated") {
    ResolverFixture f;
    auto old_content = make_content(1000, 1);
    auto new_content = make_content(2000, 2);
    auto existing = f.registry.add_binary(f.version, "arm", old_content, BinaryState::Signable);

    auto result = f.resolver.get_or_create_binary(f.params_for(new_content));
    REQUIRE(result.isOk());
    CHECK(result.value().prn == existing.prn);
    CHECK(result.value().state == BinaryState::Uploadable);
    CHECK(result.value().hash == std::optional<std::string>(sha256_hex(new_content)));
    CHECK(result.value().size == std::optional<uint64_t>(2000));

    REQUIRE(f.registry.updates.size() == 2);
    CHECK(f.registry.updates[0].state == std::optional<BinaryState>(BinaryState::Uploadable));
    CHECK_FALSE(f.registry.updates[0].hash.has_value());
    CHECK(f.registry.updates[1].hash == std::optional<std::string>(sha256_hex(new_content)));
    CHECK(f.registry.updates[1].size == std::optional<uint64_t>(2000));
}

TEST_CASE("a reset binary processes through to signed") {
    ResolverFixture f;
    FakeTransport transport;
    auto new_content = make_content(6 * 1024 * 1024, 2);
    f.registry.add_binary(f.version, "arm", make_content(1000, 1), BinaryState::Hashing);

    auto binary = f.resolver.get_or_create_binary(f.params_for(new_content));
    REQUIRE(binary.isOk());

    ProcessorConfig config;
    config.upload.concurrency = 2;
    config.poll_interval = std::chrono::milliseconds(1);
    BinaryProcessor processor(f.registry, transport, config,
                              {SignatureConfig::pre_computed("K1", "AA")});
    processor.set_sleep_function(no_sleep);
    auto processed = processor.process(binary.value(), &new_content);
    REQUIRE(processed.isOk());
    CHECK(processed.value().state == BinaryState::Signed);
    CHECK(transport.bytes_put() == new_content.size());
}

TEST_CASE("several binaries for one target are ambiguous") {
    ResolverFixture f;
    auto content = make_content(100);
    f.registry.add_binary(f.version, "arm", content, BinaryState::Signed);
    f.registry.add_binary(f.version, "arm", content, BinaryState::Signed);

    auto result = f.resolver.get_or_create_binary(f.params_for(content));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::AMBIGUOUS_MATCH);
    CHECK(f.registry.calls("create_binary") == 0);
}

TEST_CASE("binaries of other targets do not match") {
    ResolverFixture f;
    auto content = make_content(100);
    f.registry.add_binary(f.version, "x86_64", content, BinaryState::Signed);

    auto result = f.resolver.get_or_create_binary(f.params_for(content));
    REQUIRE(result.isOk());
    CHECK(result.value().target == "arm");
    CHECK(f.registry.binary_count() == 2);
}

TEST_CASE("malformed binary parameters are rejected before any call") {
    ResolverFixture f;
    auto params = f.params_for(make_content(10));
    params.hash = "abc";
    CHECK(f.resolver.get_or_create_binary(params).error().code() == ErrorCode::INVALID_INPUT);

    params = f.params_for(make_content(10));
    params.target.clear();
    CHECK(f.resolver.get_or_create_binary(params).isErr());

    params = f.params_for(make_content(10), std::string("not-a-uuid"));
    CHECK(f.resolver.get_or_create_binary(params).isErr());
    CHECK(f.registry.total_calls() == 0);
}

TEST_CASE("rate limited calls are retried with exponential backoff") {
    ResolverFixture f;
    std::vector<long long> delays;
    f.resolver.set_sleep_function([&delays](std::chrono::milliseconds d) {
        delays.push_back(d.count());
    });
    f.registry.fail_next("create_binary", Error(ErrorCode::RATE_LIMITED, "slow down"));
    f.registry.fail_next("create_binary", Error(ErrorCode::RATE_LIMITED, "slow down"));

    auto result = f.resolver.get_or_create_binary(f.params_for(make_content(10)));
    REQUIRE(result.isOk());
    CHECK(f.registry.calls("create_binary") == 3);
    CHECK(delays == std::vector<long long>{1000, 2000});
}

TEST_CASE("retries stop after the policy's limit") {
    FakeRegistry registry;
    RetryPolicy policy;
    policy.max_retries = 2;
    policy.base_delay = std::chrono::milliseconds(5);
    ResourceResolver resolver(registry, policy);
    resolver.set_sleep_function(no_sleep);
    for (int i = 0; i < 5; ++i) {
        registry.fail_next("get_artifact", Error(ErrorCode::RATE_LIMITED, "slow down"));
    }

    GetOrCreateArtifactParams params;
    params.organization_prn = kOrgPrn;
    params.artifact_id = "7e0c8d4f-5a1b-4c2d-8e3f-9a0b1c2d3e4f";
    params.name = "fw";
    auto result = resolver.get_or_create_artifact(params);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::RATE_LIMITED);
    CHECK(registry.calls("get_artifact") == 3);
}

TEST_CASE("retry delays double up to a ceiling") {
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(1000);
    CHECK(retry_delay(policy, 0).count() == 1000);
    CHECK(retry_delay(policy, 1).count() == 2000);
    CHECK(retry_delay(policy, 5).count() == 32000);
    CHECK(retry_delay(policy, 6) == kMaxRetryDelay);
    CHECK(retry_delay(policy, 31) == kMaxRetryDelay);
    CHECK(retry_delay(policy, 32) == kMaxRetryDelay);
    CHECK(retry_delay(policy, 4000000000u) == kMaxRetryDelay);

    policy.base_delay = std::chrono::milliseconds(0);
    CHECK(retry_delay(policy, 40).count() == 0);
}

TEST_CASE("long retry budgets keep waiting at the ceiling") {
    FakeRegistry registry;
    RetryPolicy policy;
    policy.max_retries = 40;
    policy.base_delay = std::chrono::milliseconds(1);
    ResourceResolver resolver(registry, policy);
    std::vector<long long> delays;
    resolver.set_sleep_function([&delays](std::chrono::milliseconds d) {
        delays.push_back(d.count());
    });
    for (int i = 0; i < 40; ++i) {
        registry.fail_next("get_artifact", Error(ErrorCode::RATE_LIMITED, "slow down"));
    }

    GetOrCreateArtifactParams params;
    params.organization_prn = kOrgPrn;
    params.artifact_id = "7e0c8d4f-5a1b-4c2d-8e3f-9a0b1c2d3e4f";
    params.name = "fw";
    auto result = resolver.get_or_create_artifact(params);
    REQUIRE(result.isOk());
    REQUIRE(delays.size() == 40);
    CHECK(delays[0] == 1);
    CHECK(delays[10] == 1024);
    CHECK(delays[35] == kMaxRetryDelay.count());
    CHECK(delays[39] == kMaxRetryDelay.count());
}

TEST_CASE("other errors are not retried") {
    ResolverFixture f;
    f.registry.fail_next("create_binary", Error(ErrorCode::INVALID_INPUT, "bad target"));
    auto result = f.resolver.get_or_create_binary(f.params_for(make_content(10)));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_INPUT);
    CHECK(f.registry.calls("create_binary") == 1);
}

TEST_CASE("artifacts and versions are created under caller-chosen ids") {
    FakeRegistry registry;
    ResourceResolver resolver(registry);
    const std::string artifact_id = "11111111-2222-4333-8444-555555555555";
    const std::string version_id = "66666666-7777-4888-9999-000000000000";

    GetOrCreateArtifactParams artifact_params{kOrgPrn, artifact_id, "fw", std::string("firmware")};
    auto artifact = resolver.get_or_create_artifact(artifact_params);
    REQUIRE(artifact.isOk());
    CHECK(artifact.value().prn == PrnBuilder(kOrgId).artifact(artifact_id).value());
    CHECK(artifact.value().description == std::optional<std::string>("firmware"));

    GetOrCreateArtifactVersionParams version_params{kOrgPrn, artifact.value().prn, version_id,
                                                    "1.2.3", std::nullopt};
    auto version = resolver.get_or_create_artifact_version(version_params);
    REQUIRE(version.isOk());
    CHECK(version.value().prn == PrnBuilder(kOrgId).artifact_version(version_id).value());
    CHECK(version.value().artifact_prn == artifact.value().prn);

    REQUIRE(resolver.get_or_create_artifact(artifact_params).isOk());
    REQUIRE(resolver.get_or_create_artifact_version(version_params).isOk());
    CHECK(registry.calls("create_artifact") == 1);
    CHECK(registry.calls("create_artifact_version") == 1);
}

TEST_CASE("a create conflict with nothing to read back is a registry error") {
    FakeRegistry registry;
    ResourceResolver resolver(registry);
    registry.fail_next("create_artifact", Error(ErrorCode::CONFLICT, "already exists"));

    GetOrCreateArtifactParams params{kOrgPrn, "11111111-2222-4333-8444-555555555555", "fw",
                                     std::nullopt};
    auto result = resolver.get_or_create_artifact(params);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::REGISTRY_ERROR);
    CHECK(registry.calls("get_artifact") == 2);
}
