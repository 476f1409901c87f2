#include "shipyard/http_registry.hpp"
#include "shipyard/json_codec.hpp"

#include <spdlog/spdlog.h>

namespace shipyard {

namespace {

constexpr long kStatusNotFound = 404;

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

// Pulls a human-readable message out of an error body
std::string describe_error_body(const nlohmann::json& body, const std::string& raw) {
    if (body.is_object()) {
        if (body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
        if (body.contains("errors")) {
            return body["errors"].dump();
        }
    }
    if (raw.size() > 512) return raw.substr(0, 512) + "...";
    return raw;
}

ErrorCode code_for_status(long status) {
    switch (status) {
        case 400:
        case 422: return ErrorCode::INVALID_INPUT;
        case 404: return ErrorCode::NOT_FOUND;
        case 409: return ErrorCode::CONFLICT;
        case 429: return ErrorCode::RATE_LIMITED;
        default: return ErrorCode::REGISTRY_ERROR;
    }
}

// Reads body[key] and decodes it with the given function
template<typename T, typename Decode>
Result<T> decode_field(const nlohmann::json& body, const char* key, Decode decode) {
    if (!body.is_object() || !body.contains(key)) {
        return Result<T>::err(Error(ErrorCode::REGISTRY_ERROR,
            std::string("registry response is missing \"") + key + "\""));
    }
    return decode(body[key]);
}

} // namespace

HttpRegistry::HttpRegistry(std::shared_ptr<HttpTransport> transport, HttpRegistryOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
    options_.base_url = trim_trailing_slash(options_.base_url);
}

Result<HttpRegistry::Reply> HttpRegistry::call(const std::string& method,
                                               const std::string& path,
                                               const nlohmann::json* body,
                                               bool allow_not_found,
                                               std::optional<int> api_version) {
    HttpRequest request;
    request.method = method;
    request.url = options_.base_url + path;
    request.headers["Authorization"] = "Token " + options_.api_key;
    request.headers["Accept"] = "application/json";
    request.headers["peridio-api-version"] =
        std::to_string(api_version ? *api_version : options_.api_version);
    if (body) {
        std::string text = body->dump();
        request.body.assign(text.begin(), text.end());
        request.headers["Content-Type"] = "application/json";
    }

    HttpResponse response = transport_->perform(request);
    if (!response.ok) {
        return Result<Reply>::err(Error(ErrorCode::REGISTRY_ERROR,
            method + " " + path + " failed: " + response.error));
    }

    Reply reply;
    reply.status = response.status;

    std::string raw = response.body_text();
    if (!raw.empty()) {
        try {
            reply.body = nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error& e) {
            if (response.success()) {
                return Result<Reply>::err(Error(ErrorCode::REGISTRY_ERROR,
                    method + " " + path + " returned invalid JSON: " + e.what()));
            }
        }
    }

    if (response.success()) {
        return Result<Reply>::ok(std::move(reply));
    }
    if (allow_not_found && response.status == kStatusNotFound) {
        return Result<Reply>::ok(std::move(reply));
    }

    spdlog::debug("registry {} {} rejected with HTTP {}", method, path, response.status);
    return Result<Reply>::err(Error(code_for_status(response.status),
        method + " " + path + " returned HTTP " + std::to_string(response.status) +
        ": " + describe_error_body(reply.body, raw)));
}

// ============================================================================
// Identity
// ============================================================================

Result<CurrentUser> HttpRegistry::get_current_user() {
    auto reply = call("GET", "/users/me", nullptr);
    if (reply.isErr()) {
        return Result<CurrentUser>::err(reply.error());
    }

    const auto& body = reply.value().body;
    if (!body.is_object() || !body.contains("data") || !body["data"].is_object()) {
        return Result<CurrentUser>::err(Error(ErrorCode::REGISTRY_ERROR,
            "registry response for /users/me is missing \"data\""));
    }
    const auto& data = body["data"];

    CurrentUser user;
    if (data.contains("organization_prn") && data["organization_prn"].is_string()) {
        user.organization_prn = data["organization_prn"].get<std::string>();
    } else {
        return Result<CurrentUser>::err(Error(ErrorCode::REGISTRY_ERROR,
            "current user has no organization_prn"));
    }
    if (data.contains("email") && data["email"].is_string()) {
        user.email = data["email"].get<std::string>();
    }
    return Result<CurrentUser>::ok(std::move(user));
}

// ============================================================================
// Artifacts
// ============================================================================

Result<std::optional<Artifact>> HttpRegistry::get_artifact(const std::string& prn) {
    using R = Result<std::optional<Artifact>>;
    auto reply = call("GET", "/artifacts/" + url_encode(prn), nullptr, true);
    if (reply.isErr()) return R::err(reply.error());
    if (reply.value().status == kStatusNotFound) return R::ok(std::nullopt);

    auto artifact = decode_field<Artifact>(reply.value().body, "artifact", artifact_from_json);
    if (artifact.isErr()) return R::err(artifact.error());
    return R::ok(std::move(artifact.value()));
}

Result<Artifact> HttpRegistry::create_artifact(const CreateArtifactParams& params) {
    auto body = to_json(params);
    auto reply = call("POST", "/artifacts", &body);
    if (reply.isErr()) return Result<Artifact>::err(reply.error());
    return decode_field<Artifact>(reply.value().body, "artifact", artifact_from_json);
}

Result<std::optional<ArtifactVersion>> HttpRegistry::get_artifact_version(const std::string& prn) {
    using R = Result<std::optional<ArtifactVersion>>;
    auto reply = call("GET", "/artifact_versions/" + url_encode(prn), nullptr, true);
    if (reply.isErr()) return R::err(reply.error());
    if (reply.value().status == kStatusNotFound) return R::ok(std::nullopt);

    auto version = decode_field<ArtifactVersion>(reply.value().body, "artifact_version",
                                                 artifact_version_from_json);
    if (version.isErr()) return R::err(version.error());
    return R::ok(std::move(version.value()));
}

Result<ArtifactVersion> HttpRegistry::create_artifact_version(const CreateArtifactVersionParams& params) {
    auto body = to_json(params);
    auto reply = call("POST", "/artifact_versions", &body);
    if (reply.isErr()) return Result<ArtifactVersion>::err(reply.error());
    return decode_field<ArtifactVersion>(reply.value().body, "artifact_version",
                                         artifact_version_from_json);
}

// ============================================================================
// Binaries
// ============================================================================

Result<std::optional<Binary>> HttpRegistry::get_binary(const std::string& prn) {
    using R = Result<std::optional<Binary>>;
    auto reply = call("GET", "/binaries/" + url_encode(prn), nullptr, true);
    if (reply.isErr()) return R::err(reply.error());
    if (reply.value().status == kStatusNotFound) return R::ok(std::nullopt);

    auto binary = decode_field<Binary>(reply.value().body, "binary", binary_from_json);
    if (binary.isErr()) return R::err(binary.error());
    return R::ok(std::move(binary.value()));
}

Result<std::vector<Binary>> HttpRegistry::list_binaries(const ListBinariesQuery& query) {
    using R = Result<std::vector<Binary>>;

    std::string search = "artifact_version_prn:'" + query.artifact_version_prn + "'";
    if (query.target) {
        search += " and target:'" + *query.target + "'";
    }

    std::vector<Binary> binaries;
    std::string page;
    while (true) {
        std::string path = "/binaries?search=" + url_encode(search);
        if (!page.empty()) {
            path += "&page=" + url_encode(page);
        }

        auto reply = call("GET", path, nullptr);
        if (reply.isErr()) return R::err(reply.error());

        const auto& body = reply.value().body;
        if (!body.is_object() || !body.contains("binaries") || !body["binaries"].is_array()) {
            return R::err(Error(ErrorCode::REGISTRY_ERROR,
                "registry response is missing \"binaries\""));
        }
        for (const auto& elem : body["binaries"]) {
            auto binary = binary_from_json(elem);
            if (binary.isErr()) return R::err(binary.error());
            binaries.push_back(std::move(binary.value()));
        }

        if (body.contains("next_page") && body["next_page"].is_string() &&
            !body["next_page"].get<std::string>().empty()) {
            page = body["next_page"].get<std::string>();
        } else {
            break;
        }
    }
    return R::ok(std::move(binaries));
}

Result<Binary> HttpRegistry::create_binary(const CreateBinaryParams& params) {
    auto body = to_json(params);
    auto reply = call("POST", "/binaries", &body);
    if (reply.isErr()) return Result<Binary>::err(reply.error());
    return decode_field<Binary>(reply.value().body, "binary", binary_from_json);
}

Result<Binary> HttpRegistry::update_binary(const UpdateBinaryParams& params) {
    auto body = to_json(params);
    auto reply = call("PATCH", "/binaries/" + url_encode(params.prn), &body);
    if (reply.isErr()) return Result<Binary>::err(reply.error());
    return decode_field<Binary>(reply.value().body, "binary", binary_from_json);
}

Result<std::vector<BinaryPart>> HttpRegistry::list_binary_parts(const std::string& binary_prn) {
    using R = Result<std::vector<BinaryPart>>;
    auto reply = call("GET", "/binaries/" + url_encode(binary_prn) + "/binary_parts", nullptr);
    if (reply.isErr()) return R::err(reply.error());

    const auto& body = reply.value().body;
    if (!body.is_object() || !body.contains("binary_parts") || !body["binary_parts"].is_array()) {
        return R::err(Error(ErrorCode::REGISTRY_ERROR,
            "registry response is missing \"binary_parts\""));
    }

    std::vector<BinaryPart> parts;
    for (const auto& elem : body["binary_parts"]) {
        auto part = binary_part_from_json(elem);
        if (part.isErr()) return R::err(part.error());
        parts.push_back(std::move(part.value()));
    }
    return R::ok(std::move(parts));
}

Result<BinaryPart> HttpRegistry::create_binary_part(const CreateBinaryPartParams& params) {
    auto body = to_json(params);
    auto reply = call("POST", "/binaries/" + url_encode(params.binary_prn) +
                              "/binary_parts/" + std::to_string(params.index), &body);
    if (reply.isErr()) return Result<BinaryPart>::err(reply.error());
    return decode_field<BinaryPart>(reply.value().body, "binary_part", binary_part_from_json);
}

Result<std::vector<Signature>> HttpRegistry::list_binary_signatures(const std::string& binary_prn) {
    using R = Result<std::vector<Signature>>;

    std::string search = "binary_prn:'" + binary_prn + "'";
    std::vector<Signature> signatures;
    std::string page;
    while (true) {
        std::string path = "/binary_signatures?search=" + url_encode(search);
        if (!page.empty()) {
            path += "&page=" + url_encode(page);
        }

        auto reply = call("GET", path, nullptr);
        if (reply.isErr()) return R::err(reply.error());

        const auto& body = reply.value().body;
        if (!body.is_object() || !body.contains("binary_signatures") ||
            !body["binary_signatures"].is_array()) {
            return R::err(Error(ErrorCode::REGISTRY_ERROR,
                "registry response is missing \"binary_signatures\""));
        }
        for (const auto& elem : body["binary_signatures"]) {
            auto sig = signature_from_json(elem);
            if (sig.isErr()) return R::err(sig.error());
            signatures.push_back(std::move(sig.value()));
        }

        if (body.contains("next_page") && body["next_page"].is_string() &&
            !body["next_page"].get<std::string>().empty()) {
            page = body["next_page"].get<std::string>();
        } else {
            break;
        }
    }
    return R::ok(std::move(signatures));
}

Result<Signature> HttpRegistry::create_binary_signature(const CreateBinarySignatureParams& params) {
    auto body = to_json(params);
    auto reply = call("POST", "/binary_signatures", &body);
    if (reply.isErr()) return Result<Signature>::err(reply.error());
    return decode_field<Signature>(reply.value().body, "binary_signature", signature_from_json);
}

Result<std::string> HttpRegistry::get_binary_content_url(const std::string& binary_prn) {
    auto reply = call("GET", "/binaries/" + url_encode(binary_prn) + "/content_url", nullptr);
    if (reply.isErr()) return Result<std::string>::err(reply.error());

    const auto& body = reply.value().body;
    if (!body.is_object() || !body.contains("url") || !body["url"].is_string()) {
        return Result<std::string>::err(Error(ErrorCode::REGISTRY_ERROR,
            "registry response is missing \"url\" for " + binary_prn));
    }
    return Result<std::string>::ok(body["url"].get<std::string>());
}

// ============================================================================
// Bundles
// ============================================================================

Result<std::optional<Bundle>> HttpRegistry::get_bundle(const std::string& prn) {
    using R = Result<std::optional<Bundle>>;
    auto reply = call("GET", "/bundles/" + url_encode(prn), nullptr, true);
    if (reply.isErr()) return R::err(reply.error());
    if (reply.value().status == kStatusNotFound) return R::ok(std::nullopt);

    int hint = options_.api_version;
    auto bundle = decode_field<Bundle>(reply.value().body, "bundle",
        [hint](const nlohmann::json& j) { return bundle_from_json(j, hint); });
    if (bundle.isErr()) return R::err(bundle.error());
    return R::ok(std::move(bundle.value()));
}

Result<Bundle> HttpRegistry::create_bundle(const CreateBundleParams& params) {
    auto valid = validate_api_version(params.api_version);
    if (valid.isErr()) return Result<Bundle>::err(valid.error());

    auto body = to_json(params);
    auto reply = call("POST", "/bundles", &body, false, params.api_version);
    if (reply.isErr()) return Result<Bundle>::err(reply.error());

    int hint = params.api_version;
    return decode_field<Bundle>(reply.value().body, "bundle",
        [hint](const nlohmann::json& j) { return bundle_from_json(j, hint); });
}

} // namespace shipyard
