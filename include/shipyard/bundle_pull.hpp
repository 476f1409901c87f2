#pragma once

#include "shipyard/archive.hpp"
#include "shipyard/http.hpp"
#include "shipyard/registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shipyard {

struct PulledBundle {
    Bundle bundle;
    BundleManifest manifest;
    std::vector<std::vector<uint8_t>> payloads;   // manifest order
};

struct PullReport {
    std::string bundle_prn;
    std::string output_path;
    size_t binary_count = 0;
    uint64_t payload_bytes = 0;
};

// "<base>.cpio.zst" (".cpio.gz" for gzip), with every character of base
// other than alphanumerics, '-' and '_' replaced by '_'
std::string archive_file_name(const std::string& base,
                              Compression compression = Compression::Zstd);

// archive_file_name of the bundle name, or of the PRN for unnamed bundles
std::string default_output_path(const Bundle& bundle);

/**
 * Reconstructs a bundle archive from the registry.
 *
 * Every payload is downloaded from the binary's content URL and checked
 * against the size and SHA-256 the registry recorded for it. Downloads
 * have no overall time limit, only a stall timeout.
 */
class BundlePuller {
public:
    BundlePuller(Registry& registry, HttpTransport& transport);

    // Downloads every payload into memory
    Result<PulledBundle> fetch(const std::string& bundle_prn);

    // Writes the archive to output (or default_output_path), one payload
    // at a time, replacing the file only once every payload has arrived
    Result<PullReport> pull(const std::string& bundle_prn,
                            const std::optional<std::string>& output = std::nullopt,
                            Compression compression = Compression::Zstd);

private:
    // Bundle metadata and manifest, before any content is downloaded
    struct PlannedBundle {
        Bundle bundle;
        BundleManifest manifest;
        std::vector<Binary> binaries;   // manifest order
    };

    Result<PlannedBundle> plan(const std::string& bundle_prn);
    Result<std::vector<BundleBinary>> bundle_binaries(const Bundle& bundle);
    Result<std::vector<uint8_t>> download(const Binary& binary);

    Registry& registry_;
    HttpTransport& transport_;
};

} // namespace shipyard
