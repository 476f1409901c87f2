#pragma once

#include "shipyard/bundle_manifest.hpp"
#include "shipyard/result.hpp"

#include <cstdint>
#include <functional>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shipyard {

// ============================================================================
// cpio "newc" Container
// ============================================================================

struct CpioEntry {
    std::string name;
    std::vector<uint8_t> data;
};

// Regular files, mode 0100644, uid/gid/mtime 0, followed by the trailer.
// newc sizes are 32-bit, so entries of 4 GiB or more are rejected.
Result<std::vector<uint8_t>> write_cpio(const std::vector<CpioEntry>& entries);

// Reads entries up to the trailer; a stream without one is invalid
Result<std::vector<CpioEntry>> read_cpio(const std::vector<uint8_t>& data);

struct CpioHeader {
    std::string name;
    uint32_t size = 0;
};

// ============================================================================
// Compression
// ============================================================================

enum class Compression {
    Zstd,
    Gzip,
};

constexpr int kZstdLevel = 3;

struct CompressResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

CompressResult zstd_compress(const std::vector<uint8_t>& data, int level = kZstdLevel);
CompressResult zstd_decompress(const std::vector<uint8_t>& data);

// Deterministic header: mtime 0, no file name, OS 255
CompressResult gzip_compress(const std::vector<uint8_t>& data);
CompressResult gzip_decompress(const std::vector<uint8_t>& data);

// Detects zstd or gzip from the magic bytes
CompressResult decompress_auto(const std::vector<uint8_t>& data);

/**
 * Decompresses a zstd or gzip file as it is read.
 *
 * The format is detected from the magic bytes. At most one input and
 * one output block are buffered.
 */
class DecompressingReader {
public:
    static Result<std::unique_ptr<DecompressingReader>> open(const std::string& path);

    virtual ~DecompressingReader() = default;

    // Up to len decompressed bytes, 0 once the stream has ended
    virtual Result<size_t> read(uint8_t* buf, size_t len) = 0;
};

/**
 * Compresses into an output stream as data is written.
 *
 * Gzip output carries the same deterministic header as gzip_compress.
 */
class CompressingWriter {
public:
    static Result<std::unique_ptr<CompressingWriter>> create(std::ostream& out,
                                                             Compression compression,
                                                             int level = kZstdLevel);

    virtual ~CompressingWriter() = default;

    virtual Result<void> write(const uint8_t* data, size_t len) = 0;

    // Ends the compressed stream, nothing may be written after it
    virtual Result<void> finish() = 0;
};

// ============================================================================
// Bundle Archives
// ============================================================================

constexpr const char* kManifestEntryName = "bundle.json";

struct ArchivePayload {
    std::string name;
    std::vector<uint8_t> data;
};

struct ParsedArchive {
    BundleManifest manifest;
    std::vector<ArchivePayload> payloads;    // archive order, manifest excluded
};

// One payload per manifest item, in manifest order, each matching the
// declared size. Output is bundle.json, then the payloads named by target.
Result<std::vector<uint8_t>> build_archive(const BundleManifest& manifest,
                                           const std::vector<std::vector<uint8_t>>& payloads,
                                           Compression compression = Compression::Zstd);

// Same checks and layout as build_archive, streamed to path through
// ArchiveWriter
Result<void> write_archive_file(const std::string& path, const BundleManifest& manifest,
                                const std::vector<std::vector<uint8_t>>& payloads,
                                Compression compression = Compression::Zstd);

Result<ParsedArchive> parse_archive(const std::vector<uint8_t>& data);

// Reads the whole archive into memory through ArchiveReader
Result<ParsedArchive> parse_archive_file(const std::string& path);

/**
 * Reads a compressed newc archive file one entry at a time.
 *
 * Only the content of the current entry is ever buffered, and only when
 * the caller asks for all of it through next().
 */
class ArchiveReader {
public:
    explicit ArchiveReader(std::unique_ptr<DecompressingReader> source);

    static Result<std::unique_ptr<ArchiveReader>> open(const std::string& path);

    // Skips whatever is left of the current entry. Empty after the trailer.
    Result<std::optional<CpioHeader>> next_header();

    // Up to len bytes of the current entry's content, 0 at its end
    Result<size_t> read(uint8_t* buf, size_t len);

    // Whatever is left of the current entry's content
    Result<std::vector<uint8_t>> read_all();

    // next_header, then the entry's whole content
    Result<std::optional<CpioEntry>> next();

private:
    Result<size_t> fill(uint8_t* buf, size_t len);
    Result<void> skip_rest();

    std::unique_ptr<DecompressingReader> source_;
    uint64_t offset_ = 0;        // into the decompressed stream
    std::string name_;
    uint32_t remaining_ = 0;     // unread content of the current entry
    uint32_t padding_ = 0;
    bool done_ = false;
};

/**
 * Writes a bundle archive entry by entry to a temp file beside path.
 *
 * commit() writes the trailer and renames the temp file over path. A
 * writer destroyed before commit() removes its temp file and leaves any
 * existing file at path untouched.
 */
class ArchiveWriter {
public:
    static Result<std::unique_ptr<ArchiveWriter>> create(const std::string& path,
                                                         Compression compression =
                                                             Compression::Zstd);
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    Result<void> add(const std::string& name, const std::vector<uint8_t>& data);
    Result<void> commit();

private:
    ArchiveWriter(std::string path, std::string temp_path);

    Result<void> write_record(const std::string& name, const uint8_t* data, uint32_t size,
                              uint32_t ino, uint32_t mode);

    std::string path_;
    std::string temp_path_;
    std::unique_ptr<std::ofstream> file_;
    std::unique_ptr<CompressingWriter> compressor_;
    uint32_t next_ino_ = 1;
    bool committed_ = false;
};

// ============================================================================
// Streaming Payload Access
// ============================================================================

// A payload as seen by a streaming pass, without its content
struct PayloadInfo {
    std::string name;
    uint64_t size = 0;
    std::string content_hash;    // SHA-256, lowercase hex
};

struct ArchiveIndex {
    BundleManifest manifest;
    std::vector<PayloadInfo> payloads;    // archive order, manifest excluded
};

// Hashes every payload of an in-memory archive
Result<std::vector<PayloadInfo>> describe_payloads(const std::vector<ArchivePayload>& payloads);

// One streaming pass: parses the manifest and hashes each payload block by
// block, without holding any payload in memory
Result<ArchiveIndex> index_archive_file(const std::string& path);

using PayloadVisitor = std::function<Result<void>(size_t payload_index,
                                                  const ArchivePayload& payload)>;

// Another streaming pass, handing each payload marked in wanted (indexed
// like ArchiveIndex::payloads) to visit in archive order. Payloads not
// wanted are skipped unread. The first error from visit stops the pass.
Result<void> visit_archive_payloads(const std::string& path, const std::vector<bool>& wanted,
                                    const PayloadVisitor& visit);

// ============================================================================
// Payload Matching
// ============================================================================

enum class MatchPolicy {
    Strict,    // content hash must equal the manifest hash
    Lenient,   // hash, then name (binary id or target), then first unclaimed
};

enum class MatchKind {
    Hash,
    Name,
    FirstUnclaimed,
};

struct MatchedPayload {
    size_t manifest_index = 0;
    size_t payload_index = 0;
    MatchKind kind = MatchKind::Hash;
    std::string content_hash;    // SHA-256 of the payload, lowercase hex
};

// One match per manifest item, in manifest order. A payload is claimed at
// most once. An item without a match is an error.
Result<std::vector<MatchedPayload>> match_payloads(const BundleManifest& manifest,
                                                   const std::vector<PayloadInfo>& payloads,
                                                   MatchPolicy policy = MatchPolicy::Strict);

// describe_payloads, then match
Result<std::vector<MatchedPayload>> match_payloads(const BundleManifest& manifest,
                                                   const std::vector<ArchivePayload>& payloads,
                                                   MatchPolicy policy = MatchPolicy::Strict);

} // namespace shipyard
