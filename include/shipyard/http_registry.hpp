#pragma once

#include "shipyard/http.hpp"
#include "shipyard/registry.hpp"

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace shipyard {

constexpr const char* kDefaultBaseUrl = "https://api.cremini.peridio.com";

struct HttpRegistryOptions {
    std::string base_url = kDefaultBaseUrl;
    std::string api_key;
    int api_version = kDefaultApiVersion;
};

/**
 * Registry backed by the REST API.
 *
 * Maps HTTP status codes onto ErrorCode: 404 on a lookup is an empty
 * optional, 409 CONFLICT, 400/422 INVALID_INPUT, 429 RATE_LIMITED and
 * anything else REGISTRY_ERROR.
 */
class HttpRegistry : public Registry {
public:
    HttpRegistry(std::shared_ptr<HttpTransport> transport, HttpRegistryOptions options);

    Result<CurrentUser> get_current_user() override;

    Result<std::optional<Artifact>> get_artifact(const std::string& prn) override;
    Result<Artifact> create_artifact(const CreateArtifactParams& params) override;

    Result<std::optional<ArtifactVersion>> get_artifact_version(const std::string& prn) override;
    Result<ArtifactVersion> create_artifact_version(const CreateArtifactVersionParams& params) override;

    Result<std::optional<Binary>> get_binary(const std::string& prn) override;
    Result<std::vector<Binary>> list_binaries(const ListBinariesQuery& query) override;
    Result<Binary> create_binary(const CreateBinaryParams& params) override;
    Result<Binary> update_binary(const UpdateBinaryParams& params) override;

    Result<std::vector<BinaryPart>> list_binary_parts(const std::string& binary_prn) override;
    Result<BinaryPart> create_binary_part(const CreateBinaryPartParams& params) override;

    Result<std::vector<Signature>> list_binary_signatures(const std::string& binary_prn) override;
    Result<Signature> create_binary_signature(const CreateBinarySignatureParams& params) override;

    Result<std::optional<Bundle>> get_bundle(const std::string& prn) override;
    Result<Bundle> create_bundle(const CreateBundleParams& params) override;

    Result<std::string> get_binary_content_url(const std::string& binary_prn) override;

    const HttpRegistryOptions& options() const { return options_; }

private:
    struct Reply {
        long status = 0;
        nlohmann::json body;
    };

    // Sends the request; non-2xx statuses other than allow_not_found 404s
    // become errors. api_version overrides the configured header value.
    Result<Reply> call(const std::string& method, const std::string& path,
                       const nlohmann::json* body, bool allow_not_found = false,
                       std::optional<int> api_version = std::nullopt);

    std::shared_ptr<HttpTransport> transport_;
    HttpRegistryOptions options_;
};

} // namespace shipyard
