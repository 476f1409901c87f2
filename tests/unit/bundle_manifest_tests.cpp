#include <doctest/doctest.h>
#include "shipyard/bundle_manifest.hpp"

using namespace shipyard;

namespace {

const char* kManifest = R"({
    "artifacts": {
        "a1": {
            "name": "firmware",
            "description": "main image",
            "versions": {
                "v1": {
                    "version": "1.2.0",
                    "binaries": {
                        "b1": {
                            "description": "arm build",
                            "signatures": [{"keyid": "K1", "sig": "AABB"}]
                        }
                    }
                }
            }
        }
    },
    "bundle": {
        "id": "bundle-1",
        "name": "nightly",
        "signatures": [],
        "manifest": [{
            "hash": "ABCDEF",
            "size": 42,
            "binary_id": "b1",
            "target": "arm",
            "artifact_version_id": "v1",
            "artifact_id": "a1",
            "custom_metadata": {"slot": "a"}
        }]
    }
})";

} // namespace

TEST_CASE("bundle.json parses artifacts and manifest entries") {
    auto result = parse_bundle_manifest(kManifest);
    REQUIRE(result.isOk());
    const auto& m = result.value();

    REQUIRE(m.artifacts.count("a1") == 1);
    const auto& artifact = m.artifacts.at("a1");
    CHECK(artifact.name == "firmware");
    CHECK(artifact.description == std::optional<std::string>("main image"));
    CHECK(artifact.versions.at("v1").version == "1.2.0");

    CHECK(m.bundle.id == "bundle-1");
    CHECK(m.bundle.name == std::optional<std::string>("nightly"));
    REQUIRE(m.bundle.manifest.size() == 1);
    const auto& item = m.bundle.manifest[0];
    CHECK(item.hash == "ABCDEF");
    CHECK(item.size == 42);
    CHECK(item.target == "arm");
    CHECK(item.custom_metadata["slot"] == "a");

    const auto* binary = m.find_binary(item);
    REQUIRE(binary != nullptr);
    CHECK(binary->description == std::optional<std::string>("arm build"));
    REQUIRE(binary->signatures.size() == 1);
    CHECK(binary->signatures[0].keyid == "K1");
    CHECK(binary->signatures[0].sig == "AABB");
}

TEST_CASE("find_binary returns null for undeclared entries") {
    auto result = parse_bundle_manifest(kManifest);
    REQUIRE(result.isOk());
    ManifestItem item = result.value().bundle.manifest[0];
    item.binary_id = "other";
    CHECK(result.value().find_binary(item) == nullptr);
    item = result.value().bundle.manifest[0];
    item.artifact_version_id = "v9";
    CHECK(result.value().find_binary(item) == nullptr);
}

TEST_CASE("serialized manifests parse back to the same content") {
    auto first = parse_bundle_manifest(kManifest);
    REQUIRE(first.isOk());
    auto text = serialize_bundle_manifest(first.value());
    CHECK(text.find("\n  \"artifacts\"") != std::string::npos);

    auto second = parse_bundle_manifest(text);
    REQUIRE(second.isOk());
    CHECK(serialize_bundle_manifest(second.value()) == text);
    CHECK(second.value().bundle.manifest[0].custom_metadata["slot"] == "a");
}

TEST_CASE("manifest entries without custom metadata serialize an empty object") {
    BundleManifest manifest;
    manifest.bundle.id = "b";
    ManifestItem item;
    item.hash = "00";
    item.binary_id = "b1";
    item.target = "t";
    item.artifact_version_id = "v";
    item.artifact_id = "a";
    item.custom_metadata = nullptr;
    manifest.bundle.manifest.push_back(item);

    auto j = nlohmann::json::parse(serialize_bundle_manifest(manifest));
    CHECK(j["bundle"]["manifest"][0]["custom_metadata"] == nlohmann::json::object());
    CHECK(j["bundle"]["signatures"] == nlohmann::json::array());
    CHECK_FALSE(j["bundle"].contains("name"));
}

TEST_CASE("bundle.json errors are archive errors") {
    struct Case { const char* name; const char* json; };
    for (auto c : {
             Case{"not json", "{"},
             Case{"not an object", "[]"},
             Case{"no bundle", R"({"artifacts": {}})"},
             Case{"no bundle id", R"({"bundle": {}})"},
             Case{"artifact without name", R"({"artifacts": {"a": {}}, "bundle": {"id": "b"}})"},
             Case{"manifest not an array", R"({"bundle": {"id": "b", "manifest": {}}})"},
             Case{"entry without target", R"({"bundle": {"id": "b", "manifest": [
                 {"hash": "h", "size": 1, "binary_id": "x", "artifact_version_id": "v",
                  "artifact_id": "a"}]}})"},
             Case{"negative size", R"({"bundle": {"id": "b", "manifest": [
                 {"hash": "h", "size": -1, "binary_id": "x", "target": "t",
                  "artifact_version_id": "v", "artifact_id": "a"}]}})"},
         }) {
        CAPTURE(c.name);
        auto result = parse_bundle_manifest(c.json);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::ARCHIVE_INVALID);
    }
}

TEST_CASE("an empty manifest list is allowed") {
    auto result = parse_bundle_manifest(R"({"bundle": {"id": "b"}})");
    REQUIRE(result.isOk());
    CHECK(result.value().bundle.manifest.empty());
    CHECK(result.value().artifacts.empty());
}
