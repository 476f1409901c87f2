/**
 * shipyard CLI - binaries commands
 *
 * Create a binary and drive it through upload, hashing and signing.
 */

#include "../common.hpp"

#include "shipyard/binary_processor.hpp"
#include "shipyard/hashing.hpp"
#include "shipyard/json_codec.hpp"
#include "shipyard/progress.hpp"
#include "shipyard/resource_resolver.hpp"

#include <CLI/CLI.hpp>

namespace shipyard::cli::commands {

namespace {

struct CreateOptions {
    std::string artifact_version_prn;
    std::string target;
    std::string id;
    std::string description;
    std::string custom_metadata;
    std::string content_path;
    std::string hash;
    uint64_t size = 0;
    std::vector<std::string> signing_key_pairs;
    std::string signing_key_prn;
    std::string signing_key_private;
    uint64_t part_size = kDefaultPartSize;
    uint32_t concurrency = 0;
};

int cmd_create(const GlobalOptions& opts, const CreateOptions& create_opts) {
    // Validate local inputs before touching the network
    nlohmann::json custom_metadata;
    if (!create_opts.custom_metadata.empty()) {
        try {
            custom_metadata = nlohmann::json::parse(create_opts.custom_metadata);
        } catch (const nlohmann::json::exception& e) {
            print_error(std::string("--custom-metadata is not valid JSON: ") + e.what());
            return 1;
        }
        if (!custom_metadata.is_object()) {
            print_error("--custom-metadata must be a JSON object");
            return 1;
        }
    }

    if (create_opts.signing_key_prn.empty() != create_opts.signing_key_private.empty()) {
        print_error("--signing-key-prn and --signing-key-private must be given together");
        return 1;
    }

    auto session_result = open_session(opts);
    if (session_result.isErr()) {
        return fail(session_result.error());
    }
    Session& session = *session_result.value();

    std::vector<uint8_t> content;
    bool have_content = false;
    std::string hash = to_lower_hex(create_opts.hash);
    uint64_t size = create_opts.size;

    if (!create_opts.content_path.empty()) {
        auto bytes = read_file_bytes(create_opts.content_path);
        if (bytes.isErr()) {
            return fail(bytes.error());
        }
        content = std::move(bytes.value());
        have_content = true;

        HashResult digest = compute_sha256(content);
        if (!digest.ok) {
            print_error("hashing " + create_opts.content_path + ": " + digest.error);
            return 1;
        }
        if (!hash.empty() && hash != digest.hex_digest) {
            print_error("--hash does not match the content of " + create_opts.content_path);
            return 1;
        }
        hash = digest.hex_digest;
        size = content.size();
    } else if (hash.empty() || size == 0) {
        print_error("pass --content-path, or --hash together with --size");
        return 1;
    }

    std::vector<SignatureConfig> signatures;
    for (const auto& name : create_opts.signing_key_pairs) {
        if (session.config.signing_key_pairs.find(name) == session.config.signing_key_pairs.end()) {
            print_error("signing key pair '" + name + "' is not defined in " +
                        session.config.source_path);
            return 1;
        }
        signatures.push_back(SignatureConfig::key_pair(name));
    }
    if (!create_opts.signing_key_prn.empty()) {
        signatures.push_back(SignatureConfig::private_key(create_opts.signing_key_prn,
                                                          create_opts.signing_key_private));
    }

    ProcessorConfig config;
    config.upload.part_size = create_opts.part_size;
    if (create_opts.concurrency != 0) {
        config.upload.concurrency = create_opts.concurrency;
    }
    config.content_hash = hash;
    auto config_ok = validate_upload_config(config.upload);
    if (config_ok.isErr()) {
        return fail(config_ok.error());
    }

    GetOrCreateBinaryParams params;
    params.artifact_version_prn = create_opts.artifact_version_prn;
    params.target = create_opts.target;
    params.hash = hash;
    params.size = size;
    if (!create_opts.id.empty()) params.id = create_opts.id;
    if (!create_opts.description.empty()) params.description = create_opts.description;
    params.custom_metadata = custom_metadata;

    ResourceResolver resolver(*session.registry);
    auto binary = resolver.get_or_create_binary(params);
    if (binary.isErr()) {
        return fail(binary.error());
    }

    ConsoleProgressBar progress;
    BinaryProcessor processor(*session.registry, *session.transport, config,
                              std::move(signatures), session.config.signing_key_pairs,
                              opts.quiet ? nullptr : &progress);

    auto processed = processor.process(binary.value(), have_content ? &content : nullptr);
    if (processed.isErr()) {
        return fail(processed.error());
    }

    output_json(binary_to_json(processed.value()));
    return 0;
}

} // anonymous namespace

void setup_binaries(CLI::App* app, GlobalOptions& opts) {
    static CreateOptions create_opts;

    app->require_subcommand(1);

    auto* create = app->add_subcommand("create", "Create a binary and upload, hash and sign it");
    create->add_option("--artifact-version-prn", create_opts.artifact_version_prn,
                       "Artifact version the binary belongs to")->required();
    create->add_option("--target", create_opts.target, "Target triple or device class")->required();
    create->add_option("--id", create_opts.id, "Binary id (UUID) to create the binary under");
    create->add_option("--description", create_opts.description, "Binary description");
    create->add_option("--custom-metadata", create_opts.custom_metadata, "JSON object");

    create->add_option("--content-path", create_opts.content_path, "File to upload")->check(CLI::ExistingFile);
    create->add_option("--hash", create_opts.hash, "SHA-256 of the content (hex)");
    create->add_option("--size", create_opts.size, "Content size in bytes");

    auto* pair = create->add_option("--signing-key-pair", create_opts.signing_key_pairs,
                                    "Signing key pair from the config file (repeatable)");
    auto* key_prn = create->add_option("--signing-key-prn", create_opts.signing_key_prn,
                                       "Signing key PRN");
    create->add_option("--signing-key-private", create_opts.signing_key_private,
                       "Ed25519 private key (PEM)")->check(CLI::ExistingFile);
    pair->excludes(key_prn);

    create->add_option("--binary-part-size", create_opts.part_size, "Upload part size in bytes")
        ->capture_default_str();
    create->add_option("--concurrency", create_opts.concurrency, "Parallel part uploads");

    create->callback([&opts]() {
        std::exit(cmd_create(opts, create_opts));
    });
}

} // namespace shipyard::cli::commands
