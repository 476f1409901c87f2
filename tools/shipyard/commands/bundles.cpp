/**
 * shipyard CLI - bundles commands
 *
 * Build, push and pull bundle archives.
 */

#include "../common.hpp"

#include "shipyard/archive.hpp"
#include "shipyard/bundle_pull.hpp"
#include "shipyard/bundle_push.hpp"
#include "shipyard/hashing.hpp"
#include "shipyard/progress.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>

namespace shipyard::cli::commands {

namespace {

struct PushCmdOptions {
    std::string path;
    uint64_t part_size = kDefaultPartSize;
    uint32_t concurrency = 0;
    bool allow_unverified_payload_match = false;
};

struct PullCmdOptions {
    std::string bundle_prn;
    std::string output;
};

struct BuildCmdOptions {
    std::string manifest;
    std::string payload_dir;
    std::string output;
    bool gzip = false;
};

// ============================================================================
// bundles push
// ============================================================================

int cmd_push(const GlobalOptions& opts, const PushCmdOptions& push_opts) {
    auto session_result = open_session(opts);
    if (session_result.isErr()) {
        return fail(session_result.error());
    }
    Session& session = *session_result.value();

    ConsoleProgressBar progress;

    PushOptions options;
    options.processor.upload.part_size = push_opts.part_size;
    if (push_opts.concurrency != 0) {
        options.processor.upload.concurrency = push_opts.concurrency;
    }
    options.api_version = session.api_version;
    options.match_policy = push_opts.allow_unverified_payload_match ? MatchPolicy::Lenient
                                                                     : MatchPolicy::Strict;
    options.observer = opts.quiet ? nullptr : &progress;

    auto config_ok = validate_upload_config(options.processor.upload);
    if (config_ok.isErr()) {
        return fail(config_ok.error());
    }

    BundlePusher pusher(*session.registry, *session.transport, options);
    auto report = pusher.push(push_opts.path);
    if (report.isErr()) {
        return fail(report.error());
    }

    nlohmann::json j;
    j["bundle_prn"] = report.value().bundle_prn;
    j["binaries"] = report.value().binary_prns;
    j["skipped_artifacts"] = report.value().skipped_artifacts;
    j["skipped_versions"] = report.value().skipped_versions;
    output_json(j);
    return 0;
}

// ============================================================================
// bundles pull
// ============================================================================

int cmd_pull(const GlobalOptions& opts, const PullCmdOptions& pull_opts) {
    auto session_result = open_session(opts);
    if (session_result.isErr()) {
        return fail(session_result.error());
    }
    Session& session = *session_result.value();

    std::optional<std::string> output;
    if (!pull_opts.output.empty()) output = pull_opts.output;

    BundlePuller puller(*session.registry, *session.transport);
    auto report = puller.pull(pull_opts.bundle_prn, output);
    if (report.isErr()) {
        return fail(report.error());
    }

    nlohmann::json j;
    j["bundle_prn"] = report.value().bundle_prn;
    j["path"] = report.value().output_path;
    j["binaries"] = report.value().binary_count;
    j["bytes"] = report.value().payload_bytes;
    output_json(j);
    return 0;
}

// ============================================================================
// bundles build
// ============================================================================

// Payload files are named by target, or failing that by binary id
std::optional<std::string> find_payload_file(const std::string& dir, const ManifestItem& item) {
    for (const auto& name : {item.target, item.binary_id}) {
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

int cmd_build(const GlobalOptions& opts, const BuildCmdOptions& build_opts) {
    init_logging(LogOptions{opts.verbose, opts.quiet});

    auto manifest_text = read_file_text(build_opts.manifest);
    if (manifest_text.isErr()) {
        return fail(manifest_text.error());
    }
    auto manifest = parse_bundle_manifest(manifest_text.value());
    if (manifest.isErr()) {
        return fail(manifest.error().withContext(build_opts.manifest));
    }

    std::string payload_dir = build_opts.payload_dir;
    if (payload_dir.empty()) {
        payload_dir = get_parent_directory(build_opts.manifest);
        if (payload_dir.empty()) payload_dir = ".";
    }

    std::vector<std::vector<uint8_t>> payloads;
    for (const auto& item : manifest.value().bundle.manifest) {
        auto path = find_payload_file(payload_dir, item);
        if (!path) {
            print_error("no payload for binary " + item.binary_id + " (target '" + item.target +
                        "') in " + payload_dir);
            return 1;
        }
        auto bytes = read_file_bytes(*path);
        if (bytes.isErr()) {
            return fail(bytes.error());
        }
        HashResult digest = compute_sha256(bytes.value());
        if (!digest.ok) {
            print_error("hashing " + *path + ": " + digest.error);
            return 1;
        }
        if (digest.hex_digest != to_lower_hex(item.hash)) {
            print_error(*path + " hashes to " + digest.hex_digest + " but the manifest declares " +
                        item.hash + " for binary " + item.binary_id);
            return 1;
        }
        spdlog::debug("payload {} -> {}", item.binary_id, *path);
        payloads.push_back(std::move(bytes.value()));
    }

    std::string output = build_opts.output;
    Compression compression = build_opts.gzip ? Compression::Gzip : Compression::Zstd;
    if (output.empty()) {
        const auto& bundle = manifest.value().bundle;
        output = archive_file_name(bundle.name && !bundle.name->empty() ? *bundle.name : bundle.id,
                                   compression);
    }

    auto written = write_archive_file(output, manifest.value(), payloads, compression);
    if (written.isErr()) {
        return fail(written.error());
    }

    nlohmann::json j;
    j["path"] = output;
    j["bundle_id"] = manifest.value().bundle.id;
    j["binaries"] = payloads.size();
    output_json(j);
    return 0;
}

} // anonymous namespace

void setup_bundles(CLI::App* app, GlobalOptions& opts) {
    static PushCmdOptions push_opts;
    static PullCmdOptions pull_opts;
    static BuildCmdOptions build_opts;

    app->require_subcommand(1);

    auto* push = app->add_subcommand("push", "Publish a bundle archive");
    push->add_option("--path", push_opts.path, "Bundle archive (.cpio.zst or .cpio.gz)")
        ->required()
        ->check(CLI::ExistingFile);
    push->add_option("--binary-part-size", push_opts.part_size, "Upload part size in bytes")
        ->capture_default_str();
    push->add_option("--concurrency", push_opts.concurrency, "Parallel part uploads");
    push->add_flag("--allow-unverified-payload-match", push_opts.allow_unverified_payload_match,
                   "Match payloads by name or position when hashes differ");
    push->callback([&opts]() {
        std::exit(cmd_push(opts, push_opts));
    });

    auto* pull = app->add_subcommand("pull", "Download a bundle as an archive");
    pull->add_option("--bundle-prn", pull_opts.bundle_prn, "Bundle to download")->required();
    pull->add_option("-o,--output", pull_opts.output, "Output file path");
    pull->callback([&opts]() {
        std::exit(cmd_pull(opts, pull_opts));
    });

    auto* build = app->add_subcommand("build", "Build a bundle archive from local files");
    build->add_option("--manifest", build_opts.manifest, "bundle.json")
        ->required()
        ->check(CLI::ExistingFile);
    build->add_option("--payload-dir", build_opts.payload_dir,
                      "Directory holding the payloads (default: next to the manifest)")
        ->check(CLI::ExistingDirectory);
    build->add_option("-o,--output", build_opts.output, "Output file path");
    build->add_flag("--gzip", build_opts.gzip, "Compress with gzip instead of zstd");
    build->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace shipyard::cli::commands
