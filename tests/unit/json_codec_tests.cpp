#include <doctest/doctest.h>
#include "shipyard/json_codec.hpp"

using namespace shipyard;

TEST_CASE("binary decodes every field and tolerates unknown keys") {
    auto j = nlohmann::json::parse(R"({
        "prn": "prn:1:org:binary:b1",
        "artifact_version_prn": "prn:1:org:artifact_version:v1",
        "organization_prn": "prn:1:org",
        "target": "aarch64-unknown-linux-gnu",
        "size": 12582912,
        "hash": "ab12",
        "state": "SIGNABLE",
        "description": "firmware",
        "custom_metadata": {"channel": "beta"},
        "signatures": [{"prn": "prn:1:org:binary_signature:s1", "keyid": "K1", "signature": "AA"}],
        "inserted_at": "2024-01-01T00:00:00Z",
        "future_field": true
    })");

    auto result = binary_from_json(j);
    REQUIRE(result.isOk());
    const Binary& b = result.value();
    CHECK(b.prn == "prn:1:org:binary:b1");
    CHECK(b.target == "aarch64-unknown-linux-gnu");
    CHECK(b.size == std::optional<uint64_t>(12582912));
    CHECK(b.hash == std::optional<std::string>("ab12"));
    CHECK(b.state == BinaryState::Signable);
    CHECK(b.state_text == "SIGNABLE");
    CHECK(b.description == std::optional<std::string>("firmware"));
    CHECK(b.custom_metadata["channel"] == "beta");
    REQUIRE(b.signatures.size() == 1);
    CHECK(b.signatures[0].keyid == "K1");
    CHECK(b.inserted_at == "2024-01-01T00:00:00Z");
}

TEST_CASE("binary with only a prn decodes with empty optionals") {
    auto result = binary_from_json(nlohmann::json{{"prn", "prn:1:org:binary:b1"}});
    REQUIRE(result.isOk());
    CHECK_FALSE(result.value().size.has_value());
    CHECK_FALSE(result.value().hash.has_value());
    CHECK(result.value().state == BinaryState::Unknown);
    CHECK(result.value().custom_metadata.is_null());
}

TEST_CASE("unrecognised state text is kept for display") {
    auto result = binary_from_json(nlohmann::json{{"prn", "p"}, {"state", "quarantined"}});
    REQUIRE(result.isOk());
    CHECK(result.value().state == BinaryState::Unknown);
    CHECK(binary_to_json(result.value())["state"] == "quarantined");
}

TEST_CASE("decoders reject missing prn and non-objects") {
    CHECK(binary_from_json(nlohmann::json{{"target", "x"}}).isErr());
    CHECK(artifact_from_json(nlohmann::json::array()).isErr());
    CHECK(artifact_version_from_json(nlohmann::json("text")).isErr());
    auto part = binary_part_from_json(nlohmann::json{{"size", 5}});
    REQUIRE(part.isErr());
    CHECK(part.error().code() == ErrorCode::REGISTRY_ERROR);
}

TEST_CASE("signature keyid falls back to signing_key_keyid") {
    auto sig = signature_from_json(nlohmann::json{{"signing_key_keyid", "K2"}});
    REQUIRE(sig.isOk());
    CHECK(sig.value().keyid == "K2");
}

TEST_CASE("binary part decodes state and upload url") {
    auto part = binary_part_from_json(nlohmann::json{
        {"index", 3}, {"size", 100}, {"hash", "ff"}, {"state", "valid"},
        {"presigned_upload_url", "https://upload"}});
    REQUIRE(part.isOk());
    CHECK(part.value().index == 3);
    CHECK(part.value().size == 100);
    CHECK(part.value().state == BinaryPartState::Valid);
    CHECK(part.value().presigned_upload_url == "https://upload");
}

TEST_CASE("bundle generation is chosen by shape, then by hint") {
    auto v1 = bundle_from_json(nlohmann::json{
        {"prn", "b1"}, {"artifact_version_prns", {"v1", "v2"}}}, 2);
    REQUIRE(v1.isOk());
    REQUIRE(std::holds_alternative<BundleV1>(v1.value()));
    CHECK(std::get<BundleV1>(v1.value()).artifact_version_prns.size() == 2);

    auto v2 = bundle_from_json(nlohmann::json::parse(R"({
        "prn": "b2", "name": "n",
        "binaries": [{"prn": "x", "custom_metadata": {"k": 1}}, {"prn": "y"}]
    })"), 1);
    REQUIRE(v2.isOk());
    REQUIRE(std::holds_alternative<BundleV2>(v2.value()));
    const auto& binaries = std::get<BundleV2>(v2.value()).binaries;
    REQUIRE(binaries.size() == 2);
    CHECK(binaries[0].custom_metadata["k"] == 1);
    CHECK(binaries[1].custom_metadata.is_null());

    auto bare = bundle_from_json(nlohmann::json{{"prn", "b3"}}, 1);
    REQUIRE(bare.isOk());
    CHECK(std::holds_alternative<BundleV1>(bare.value()));

    CHECK(bundle_from_json(nlohmann::json::parse(R"({"prn": "b", "binaries": [1]})"), 2).isErr());
}

TEST_CASE("update params encode only the fields that are set") {
    UpdateBinaryParams params;
    params.prn = "p";
    params.state = BinaryState::Uploadable;
    auto j = to_json(params);
    CHECK(j.size() == 1);
    CHECK(j["state"] == "uploadable");

    UpdateBinaryParams empty;
    CHECK(to_json(empty) == nlohmann::json::object());
}

TEST_CASE("create params omit empty custom metadata") {
    CreateBinaryParams params;
    params.artifact_version_prn = "v";
    params.target = "t";
    params.hash = "h";
    params.size = 9;
    params.custom_metadata = nlohmann::json::object();
    auto j = to_json(params);
    CHECK_FALSE(j.contains("custom_metadata"));
    CHECK_FALSE(j.contains("id"));
    CHECK(j["size"] == 9);

    params.id = "id-1";
    params.custom_metadata = {{"k", "v"}};
    j = to_json(params);
    CHECK(j["id"] == "id-1");
    CHECK(j["custom_metadata"]["k"] == "v");
}

TEST_CASE("bundle params follow the api version") {
    CreateBundleParams v1;
    v1.api_version = 1;
    v1.artifact_version_prns = {"a", "b"};
    v1.binaries = {BundleBinary{"ignored", nullptr}};
    auto j1 = to_json(v1);
    CHECK(j1["artifact_version_prns"].size() == 2);
    CHECK_FALSE(j1.contains("binaries"));

    CreateBundleParams v2;
    v2.name = "nightly";
    v2.binaries = {BundleBinary{"x", {{"k", 1}}}, BundleBinary{"y", nullptr}};
    auto j2 = to_json(v2);
    CHECK(j2["name"] == "nightly");
    REQUIRE(j2["binaries"].size() == 2);
    CHECK(j2["binaries"][0]["custom_metadata"]["k"] == 1);
    CHECK_FALSE(j2["binaries"][1].contains("custom_metadata"));
}

TEST_CASE("signature params carry exactly the key reference given") {
    CreateBinarySignatureParams params;
    params.binary_prn = "b";
    params.signature = "AB";
    params.signing_key_keyid = "K";
    auto j = to_json(params);
    CHECK(j["signing_key_keyid"] == "K");
    CHECK_FALSE(j.contains("signing_key_prn"));
}

TEST_CASE("custom metadata must be a non-empty object") {
    CHECK(has_custom_metadata(nlohmann::json{{"a", 1}}));
    CHECK_FALSE(has_custom_metadata(nlohmann::json::object()));
    CHECK_FALSE(has_custom_metadata(nullptr));
    CHECK_FALSE(has_custom_metadata(nlohmann::json::array({1})));
}
