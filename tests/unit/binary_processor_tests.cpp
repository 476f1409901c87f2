#include <doctest/doctest.h>
#include "shipyard/binary_processor.hpp"

#include "test_support.hpp"

using namespace shipyard;
using namespace shipyard::testing;

namespace {

constexpr uint64_t MiB = 1024 * 1024;

ProcessorConfig processor_config(uint32_t concurrency = 2) {
    ProcessorConfig config;
    config.upload.part_size = 5 * MiB;
    config.upload.concurrency = concurrency;
    config.poll_interval = std::chrono::milliseconds(1);
    config.poll_attempts = 3;
    return config;
}

struct ProcessorFixture {
    FakeRegistry registry;
    FakeTransport transport;
    ArtifactVersion version;

    ProcessorFixture() { version = registry.add_version(registry.add_artifact("fw"), "1.0.0"); }

    Result<Binary> run(const Binary& binary, const std::vector<uint8_t>* content,
                       std::vector<SignatureConfig> signatures = {},
                       ProcessorConfig config = processor_config()) {
        BinaryProcessor processor(registry, transport, config, std::move(signatures));
        processor.set_sleep_function(no_sleep);
        return processor.process(binary, content);
    }
};

std::vector<BinaryState> update_states(const FakeRegistry& registry) {
    std::vector<BinaryState> states;
    for (const auto& update : registry.updates) {
        if (update.state) states.push_back(*update.state);
    }
    return states;
}

} // namespace

TEST_CASE("without signatures an upload stops at hashing") {
    ProcessorFixture f;
    auto content = make_content(12 * MiB);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Uploadable);

    auto result = f.run(binary, &content);
    REQUIRE(result.isOk());
    CHECK(result.value().state == BinaryState::Hashing);
    CHECK(f.registry.part_creates.size() == 3);
    CHECK(f.transport.bytes_put() == 12 * MiB);
    CHECK(update_states(f.registry) ==
          std::vector<BinaryState>{BinaryState::Hashable, BinaryState::Hashing});
    CHECK(f.registry.calls("create_binary_signature") == 0);
}

TEST_CASE("with signatures an upload runs through to signed") {
    ProcessorFixture f;
    auto content = make_content(7 * MiB);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Uploadable);

    auto result = f.run(binary, &content, {SignatureConfig::pre_computed("K1", "AA")});
    REQUIRE(result.isOk());
    CHECK(result.value().state == BinaryState::Signed);
    CHECK(update_states(f.registry) == std::vector<BinaryState>{
        BinaryState::Hashable, BinaryState::Hashing, BinaryState::Signed});
    CHECK(f.registry.signature_creates.size() == 1);
}

TEST_CASE("signed and destroyed binaries cause no registry calls") {
    for (auto state : {BinaryState::Signed, BinaryState::Destroyed}) {
        ProcessorFixture f;
        auto content = make_content(100);
        auto binary = f.registry.add_binary(f.version, "arm", content, state);
        int before = f.registry.total_calls();

        auto result = f.run(binary, &content, {SignatureConfig::pre_computed("K1", "AA")});
        REQUIRE(result.isOk());
        CHECK(result.value().state == state);
        CHECK(f.registry.total_calls() == before);
        CHECK(f.transport.requests().empty());
    }
}

TEST_CASE("an unrecognised state is skipped") {
    ProcessorFixture f;
    Binary binary;
    binary.prn = "prn:odd";
    binary.state = BinaryState::Unknown;
    binary.state_text = "quarantined";

    auto result = f.run(binary, nullptr);
    REQUIRE(result.isOk());
    CHECK(result.value().state_text == "quarantined");
    CHECK(f.registry.total_calls() == 0);
}

TEST_CASE("processing resumes from the registry's current state") {
    ProcessorFixture f;
    auto content = make_content(100);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Hashable);

    // the caller's copy is stale
    Binary stale = binary;
    stale.state = BinaryState::Uploadable;

    auto result = f.run(stale, nullptr);
    REQUIRE(result.isOk());
    CHECK(result.value().state == BinaryState::Hashing);
    CHECK(f.registry.part_creates.empty());
    CHECK(update_states(f.registry) == std::vector<BinaryState>{BinaryState::Hashing});
}

TEST_CASE("a signable binary is only signed") {
    ProcessorFixture f;
    auto content = make_content(100);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Signable);

    auto result = f.run(binary, nullptr, {SignatureConfig::pre_computed("K1", "AA")});
    REQUIRE(result.isOk());
    CHECK(result.value().state == BinaryState::Signed);
    CHECK(f.transport.requests().empty());
}

TEST_CASE("hashing is polled until signable") {
    ProcessorFixture f;
    f.registry.polls_until_signable = 3;
    auto content = make_content(100);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Hashing);

    int sleeps = 0;
    BinaryProcessor processor(f.registry, f.transport, processor_config(),
                              {SignatureConfig::pre_computed("K1", "AA")});
    processor.set_sleep_function([&sleeps](std::chrono::milliseconds) { ++sleeps; });
    auto result = processor.process(binary, nullptr);
    REQUIRE(result.isOk());
    CHECK(result.value().state == BinaryState::Signed);
    // the initial read counts as the first poll
    CHECK(sleeps == 2);
}

TEST_CASE("polling gives up with a timeout") {
    ProcessorFixture f;
    f.registry.auto_signable = false;
    auto content = make_content(100);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Hashing);

    auto result = f.run(binary, nullptr, {SignatureConfig::pre_computed("K1", "AA")});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TIMEOUT);
    CHECK(result.error().message().find("last state: hashing") != std::string::npos);
    CHECK(f.registry.calls("get_binary") == 4);
}

TEST_CASE("an uploadable binary needs content") {
    ProcessorFixture f;
    auto binary = f.registry.add_binary(f.version, "arm", make_content(100),
                                        BinaryState::Uploadable);
    auto result = f.run(binary, nullptr);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_INPUT);
    CHECK(f.registry.updates.empty());
}

TEST_CASE("a missing binary is not found") {
    ProcessorFixture f;
    Binary binary;
    binary.prn = "prn:1:missing";
    binary.state = BinaryState::Hashable;
    auto result = f.run(binary, nullptr);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("an upload failure leaves the binary uploadable") {
    ProcessorFixture f;
    f.transport.put_status = 500;
    auto content = make_content(6 * MiB);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Uploadable);

    auto result = f.run(binary, &content);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TRANSFER_FAILED);
    CHECK(f.registry.updates.empty());
    CHECK(f.registry.binary(binary.prn).state == BinaryState::Uploadable);
}

TEST_CASE("a partial signature failure keeps the binary signable") {
    ProcessorFixture f;
    f.registry.failing_signature_keyids = {"K2"};
    auto content = make_content(100);
    auto binary = f.registry.add_binary(f.version, "arm", content, BinaryState::Signable);

    auto result = f.run(binary, nullptr, {SignatureConfig::pre_computed("K1", "AA"),
                                          SignatureConfig::pre_computed("K2", "BB")});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::SIGNATURE_FAILED);
    CHECK(result.error().message().find("failed keyids: K2)") != std::string::npos);
    CHECK(f.registry.binary(binary.prn).state == BinaryState::Signable);
}
