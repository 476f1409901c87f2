#include <doctest/doctest.h>
#include "shipyard/http_registry.hpp"

#include "test_support.hpp"

using namespace shipyard;
using namespace shipyard::testing;

namespace {

HttpResponse json_response(long status, const nlohmann::json& body) {
    HttpResponse response;
    response.ok = true;
    response.status = status;
    std::string text = body.dump();
    response.body.assign(text.begin(), text.end());
    return response;
}

struct RegistryFixture {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    HttpRegistry registry{transport, HttpRegistryOptions{"https://registry.test/", "key-1", 2}};
};

} // namespace

TEST_CASE("requests carry auth, accept and api version headers") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        return json_response(200, {{"data", {{"email", "dev@example.com"},
                                             {"organization_prn", kOrgPrn}}}});
    };

    auto user = f.registry.get_current_user();
    REQUIRE(user.isOk());
    CHECK(user.value().organization_prn == kOrgPrn);
    CHECK(user.value().email == "dev@example.com");

    auto requests = f.transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "GET");
    CHECK(requests[0].url == "https://registry.test/users/me");
    CHECK(requests[0].headers.at("Authorization") == "Token key-1");
    CHECK(requests[0].headers.at("Accept") == "application/json");
    CHECK(requests[0].headers.at("peridio-api-version") == "2");
    CHECK(requests[0].headers.count("Content-Type") == 0);
}

TEST_CASE("bodies are sent as JSON") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        return json_response(201, {{"artifact", {{"prn", "prn:a"}, {"name", "fw"}}}});
    };

    CreateArtifactParams params;
    params.name = "fw";
    auto artifact = f.registry.create_artifact(params);
    REQUIRE(artifact.isOk());
    CHECK(artifact.value().name == "fw");

    auto request = f.transport->requests().at(0);
    CHECK(request.method == "POST");
    CHECK(request.url == "https://registry.test/artifacts");
    CHECK(request.headers.at("Content-Type") == "application/json");
    auto sent = nlohmann::json::parse(std::string(request.body.begin(), request.body.end()));
    CHECK(sent["name"] == "fw");
}

TEST_CASE("a 404 on lookup is an empty result") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        return json_response(404, {{"message", "not found"}});
    };

    auto binary = f.registry.get_binary("prn:1:org:binary:x");
    REQUIRE(binary.isOk());
    CHECK_FALSE(binary.value().has_value());
    CHECK(f.transport->requests().at(0).url.find("/binaries/prn%3A1%3Aorg") != std::string::npos);

    CHECK(f.registry.get_artifact("a").value() == std::nullopt);
    CHECK_FALSE(f.registry.get_bundle("b").value().has_value());
}

TEST_CASE("error statuses map onto error codes") {
    struct Case { long status; ErrorCode code; };
    for (auto c : {Case{400, ErrorCode::INVALID_INPUT}, Case{422, ErrorCode::INVALID_INPUT},
                   Case{404, ErrorCode::NOT_FOUND}, Case{409, ErrorCode::CONFLICT},
                   Case{429, ErrorCode::RATE_LIMITED}, Case{500, ErrorCode::REGISTRY_ERROR},
                   Case{403, ErrorCode::REGISTRY_ERROR}}) {
        CAPTURE(c.status);
        RegistryFixture f;
        f.transport->handler = [c](const HttpRequest&) {
            return json_response(c.status, {{"message", "nope"}});
        };
        CreateBinaryParams params;
        auto result = f.registry.create_binary(params);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == c.code);
        CHECK(result.error().message().find("POST /binaries returned HTTP " +
                                            std::to_string(c.status) + ": nope") !=
              std::string::npos);
    }
}

TEST_CASE("transport failures and bad JSON are registry errors") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        HttpResponse response;
        response.error = "could not resolve host";
        return response;
    };
    auto failed = f.registry.get_current_user();
    REQUIRE(failed.isErr());
    CHECK(failed.error().code() == ErrorCode::REGISTRY_ERROR);
    CHECK(failed.error().message().find("could not resolve host") != std::string::npos);

    f.transport->handler = [](const HttpRequest&) {
        HttpResponse response;
        response.ok = true;
        response.status = 200;
        std::string text = "<html>";
        response.body.assign(text.begin(), text.end());
        return response;
    };
    auto garbled = f.registry.get_current_user();
    REQUIRE(garbled.isErr());
    CHECK(garbled.error().message().find("invalid JSON") != std::string::npos);
}

TEST_CASE("list_binaries searches by version and target and follows pages") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest& request) {
        if (request.url.find("page=") == std::string::npos) {
            return json_response(200, {{"binaries", {{{"prn", "b1"}, {"target", "t"}}}},
                                       {"next_page", "p2"}});
        }
        return json_response(200, {{"binaries", {{{"prn", "b2"}, {"target", "t"}}}},
                                   {"next_page", nullptr}});
    };

    ListBinariesQuery query;
    query.artifact_version_prn = "prn:v";
    query.target = "t";
    auto binaries = f.registry.list_binaries(query);
    REQUIRE(binaries.isOk());
    REQUIRE(binaries.value().size() == 2);
    CHECK(binaries.value()[0].prn == "b1");
    CHECK(binaries.value()[1].prn == "b2");

    auto requests = f.transport->requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].url == "https://registry.test/binaries?search=" +
                             url_encode("artifact_version_prn:'prn:v' and target:'t'"));
    CHECK(requests[1].url.find("&page=p2") != std::string::npos);
}

TEST_CASE("binary signatures are listed by binary and follow pages") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest& request) {
        if (request.url.find("page=") == std::string::npos) {
            return json_response(200, {{"binary_signatures",
                                        {{{"prn", "s1"}, {"keyid", "K1"}, {"signature", "AA"}}}},
                                       {"next_page", "p2"}});
        }
        return json_response(200, {{"binary_signatures",
                                    {{{"prn", "s2"}, {"signing_key_prn", "prn:k"},
                                      {"signature", "BB"}}}}});
    };

    auto signatures = f.registry.list_binary_signatures("prn:b");
    REQUIRE(signatures.isOk());
    REQUIRE(signatures.value().size() == 2);
    CHECK(signatures.value()[0].keyid == "K1");
    CHECK(signatures.value()[1].signing_key_prn == "prn:k");

    auto requests = f.transport->requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].url == "https://registry.test/binary_signatures?search=" +
                             url_encode("binary_prn:'prn:b'"));
    CHECK(requests[1].url.find("&page=p2") != std::string::npos);
}

TEST_CASE("binary parts are created at their index") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        return json_response(201, {{"binary_part", {{"index", 2}, {"size", 10},
                                                     {"state", "pending"},
                                                     {"presigned_upload_url", "https://u"}}}});
    };

    CreateBinaryPartParams params;
    params.binary_prn = "b";
    params.index = 2;
    params.size = 10;
    params.hash = "ff";
    params.expected_binary_size = 20;
    auto part = f.registry.create_binary_part(params);
    REQUIRE(part.isOk());
    CHECK(part.value().presigned_upload_url == "https://u");
    CHECK(f.transport->requests().at(0).url == "https://registry.test/binaries/b/binary_parts/2");
}

TEST_CASE("update_binary patches the binary") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        return json_response(200, {{"binary", {{"prn", "b"}, {"state", "hashable"}}}});
    };

    UpdateBinaryParams params;
    params.prn = "b";
    params.state = BinaryState::Hashable;
    auto binary = f.registry.update_binary(params);
    REQUIRE(binary.isOk());
    CHECK(binary.value().state == BinaryState::Hashable);
    CHECK(f.transport->requests().at(0).method == "PATCH");
}

TEST_CASE("responses missing their resource key are errors") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) { return json_response(200, {{"other", 1}}); };
    auto binary = f.registry.get_binary("b");
    REQUIRE(binary.isErr());
    CHECK(binary.error().code() == ErrorCode::REGISTRY_ERROR);

    auto url = f.registry.get_binary_content_url("b");
    CHECK(url.isErr());
}

TEST_CASE("create_bundle validates the api version and decodes by it") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        return json_response(201, {{"bundle", {{"prn", "bundle-1"}}}});
    };

    CreateBundleParams bad;
    bad.api_version = 7;
    auto rejected = f.registry.create_bundle(bad);
    REQUIRE(rejected.isErr());
    CHECK(rejected.error().code() == ErrorCode::UNSUPPORTED_API_VERSION);
    CHECK(f.transport->requests().empty());

    CreateBundleParams v1;
    v1.api_version = 1;
    auto bundle = f.registry.create_bundle(v1);
    REQUIRE(bundle.isOk());
    CHECK(std::holds_alternative<BundleV1>(bundle.value()));
    CHECK(f.transport->requests().at(0).headers.at("peridio-api-version") == "1");
    auto sent = f.transport->requests().at(0).body;
    CHECK(std::string(sent.begin(), sent.end()).find("artifact_version_prns") != std::string::npos);
}

TEST_CASE("content url comes from the registry") {
    RegistryFixture f;
    f.transport->handler = [](const HttpRequest&) {
        return json_response(200, {{"url", "https://cdn.test/blob?sig=1"}});
    };
    auto url = f.registry.get_binary_content_url("b");
    REQUIRE(url.isOk());
    CHECK(url.value() == "https://cdn.test/blob?sig=1");
}

TEST_CASE("url_encode leaves unreserved characters alone") {
    CHECK(url_encode("abc-_.~XYZ09") == "abc-_.~XYZ09");
    CHECK(url_encode("a b:c'") == "a%20b%3Ac%27");
}
