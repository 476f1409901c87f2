#include "shipyard/archive.hpp"
#include "shipyard/hashing.hpp"
#include "shipyard/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <limits>
#include <optional>

#include <spdlog/spdlog.h>

namespace shipyard {

namespace {

constexpr const char* kNewcMagic = "070701";
constexpr const char* kTrailerName = "TRAILER!!!";
constexpr size_t kNewcHeaderSize = 110;
constexpr size_t kNewcFieldCount = 13;
constexpr uint32_t kRegularFileMode = 0100644;
constexpr uint32_t kMaxNameSize = 4096;
constexpr uint32_t kMaxManifestSize = 64 * 1024 * 1024;
constexpr size_t kStreamBlockSize = 1 << 16;

size_t pad4(size_t n) {
    return (4 - (n % 4)) % 4;
}

void append_field(std::vector<uint8_t>& out, uint32_t value) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08X", value);
    out.insert(out.end(), buf, buf + 8);
}

// Header, name and name padding; the content and its padding follow
void append_header(std::vector<uint8_t>& out, uint32_t ino, const std::string& name,
                   uint32_t file_size, uint32_t mode, uint32_t nlink) {
    out.insert(out.end(), kNewcMagic, kNewcMagic + 6);
    append_field(out, ino);
    append_field(out, mode);
    append_field(out, 0);                                   // uid
    append_field(out, 0);                                   // gid
    append_field(out, nlink);
    append_field(out, 0);                                   // mtime
    append_field(out, file_size);
    append_field(out, 0);                                   // devmajor
    append_field(out, 0);                                   // devminor
    append_field(out, 0);                                   // rdevmajor
    append_field(out, 0);                                   // rdevminor
    append_field(out, static_cast<uint32_t>(name.size() + 1));
    append_field(out, 0);                                   // check

    out.insert(out.end(), name.begin(), name.end());
    out.push_back(0);
    out.insert(out.end(), pad4(kNewcHeaderSize + name.size() + 1), 0);
}

void append_record(std::vector<uint8_t>& out, uint32_t ino, const std::string& name,
                   const std::vector<uint8_t>& data, uint32_t mode, uint32_t nlink) {
    append_header(out, ino, name, static_cast<uint32_t>(data.size()), mode, nlink);
    out.insert(out.end(), data.begin(), data.end());
    out.insert(out.end(), pad4(data.size()), 0);
}

bool parse_hex_field(const uint8_t* p, uint32_t& out) {
    uint32_t value = 0;
    for (size_t i = 0; i < 8; i++) {
        char c = static_cast<char>(p[i]);
        uint32_t digit;
        if (c >= '0' && c <= '9') digit = static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') digit = static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') digit = static_cast<uint32_t>(c - 'A' + 10);
        else return false;
        value = (value << 4) | digit;
    }
    out = value;
    return true;
}

Error invalid(const std::string& message) {
    return Error(ErrorCode::ARCHIVE_INVALID, message);
}

struct NewcSizes {
    uint32_t file_size = 0;
    uint32_t name_size = 0;     // includes the terminating NUL
};

Result<NewcSizes> parse_newc_header(const uint8_t* header, uint64_t offset) {
    using R = Result<NewcSizes>;
    if (std::memcmp(header, kNewcMagic, 6) != 0) {
        return R::err(invalid("bad cpio magic at offset " + std::to_string(offset) +
                              " (only newc archives are supported)"));
    }

    uint32_t fields[kNewcFieldCount];
    for (size_t i = 0; i < kNewcFieldCount; i++) {
        if (!parse_hex_field(header + 6 + i * 8, fields[i])) {
            return R::err(invalid("malformed cpio header at offset " + std::to_string(offset)));
        }
    }

    NewcSizes sizes;
    sizes.file_size = fields[6];
    sizes.name_size = fields[11];
    if (sizes.name_size == 0) {
        return R::err(invalid("cpio record with empty name at offset " + std::to_string(offset)));
    }
    return R::ok(sizes);
}

Error entry_too_large(const std::string& name, uint64_t size) {
    return Error(ErrorCode::INVALID_INPUT,
        "cpio entry " + name + " is " + std::to_string(size) +
        " bytes, newc entries must be smaller than 4 GiB");
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string base_name(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

enum class EntryRole {
    Manifest,
    Payload,
    Skipped,
};

// The first entry named */bundle.json is the manifest. Directory records
// and other empty entries carry no payload.
EntryRole classify_entry(const std::string& name, uint64_t size, bool have_manifest) {
    if (!have_manifest && ends_with(name, kManifestEntryName)) return EntryRole::Manifest;
    if (size == 0) return EntryRole::Skipped;
    return EntryRole::Payload;
}

Result<BundleManifest> parse_manifest_entry(const std::vector<uint8_t>& data) {
    return parse_bundle_manifest(std::string(data.begin(), data.end()));
}

// Size, count and target checks shared by every archive writer
Result<void> check_payloads(const BundleManifest& manifest,
                            const std::vector<std::vector<uint8_t>>& payloads) {
    const auto& items = manifest.bundle.manifest;

    if (payloads.size() != items.size()) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "manifest lists " + std::to_string(items.size()) + " binaries but " +
            std::to_string(payloads.size()) + " payloads were given"));
    }

    for (size_t i = 0; i < items.size(); i++) {
        const auto& item = items[i];
        if (payloads[i].size() != item.size) {
            return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
                "payload for binary " + item.binary_id + " (target '" + item.target + "') is " +
                std::to_string(payloads[i].size()) + " bytes, manifest declares " +
                std::to_string(item.size)));
        }
        if (item.target.empty()) {
            return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
                "manifest entry for binary " + item.binary_id + " has no target"));
        }
    }
    return Result<void>::ok();
}

const char* match_kind_name(MatchKind kind) {
    switch (kind) {
        case MatchKind::Hash: return "hash";
        case MatchKind::Name: return "name";
        case MatchKind::FirstUnclaimed: return "first unclaimed";
    }
    return "unknown";
}

} // namespace

// ============================================================================
// cpio "newc" Container
// ============================================================================

Result<std::vector<uint8_t>> write_cpio(const std::vector<CpioEntry>& entries) {
    using R = Result<std::vector<uint8_t>>;
    std::vector<uint8_t> out;

    uint32_t ino = 1;
    for (const auto& entry : entries) {
        if (entry.name.empty()) {
            return R::err(Error(ErrorCode::INVALID_INPUT, "cpio entry with an empty name"));
        }
        if (entry.data.size() > std::numeric_limits<uint32_t>::max()) {
            return R::err(entry_too_large(entry.name, entry.data.size()));
        }
        append_record(out, ino++, entry.name, entry.data, kRegularFileMode, 1);
    }

    append_record(out, 0, kTrailerName, {}, 0, 1);
    return R::ok(std::move(out));
}

Result<std::vector<CpioEntry>> read_cpio(const std::vector<uint8_t>& data) {
    using R = Result<std::vector<CpioEntry>>;
    std::vector<CpioEntry> entries;
    size_t offset = 0;

    while (true) {
        if (offset + kNewcHeaderSize > data.size()) {
            return R::err(invalid("cpio stream ends without a trailer"));
        }
        auto sizes = parse_newc_header(data.data() + offset, offset);
        if (sizes.isErr()) {
            return R::err(sizes.error());
        }
        uint32_t file_size = sizes.value().file_size;
        uint32_t name_size = sizes.value().name_size;

        size_t name_start = offset + kNewcHeaderSize;
        if (name_start + name_size > data.size()) {
            return R::err(invalid("truncated cpio record name at offset " + std::to_string(offset)));
        }
        // namesize counts the terminating NUL
        std::string name(reinterpret_cast<const char*>(data.data() + name_start), name_size - 1);

        size_t data_start = name_start + name_size + pad4(kNewcHeaderSize + name_size);
        if (name == kTrailerName) {
            break;
        }
        if (data_start + file_size > data.size()) {
            return R::err(invalid("truncated cpio record data for " + name));
        }

        CpioEntry entry;
        entry.name = std::move(name);
        entry.data.assign(data.begin() + static_cast<std::ptrdiff_t>(data_start),
                          data.begin() + static_cast<std::ptrdiff_t>(data_start + file_size));
        entries.push_back(std::move(entry));

        offset = data_start + file_size + pad4(file_size);
    }

    return R::ok(std::move(entries));
}

// ============================================================================
// Bundle Archives
// ============================================================================

Result<std::vector<uint8_t>> build_archive(const BundleManifest& manifest,
                                           const std::vector<std::vector<uint8_t>>& payloads,
                                           Compression compression) {
    using R = Result<std::vector<uint8_t>>;
    const auto& items = manifest.bundle.manifest;

    auto checked = check_payloads(manifest, payloads);
    if (checked.isErr()) {
        return R::err(checked.error());
    }

    std::vector<CpioEntry> entries;
    entries.reserve(items.size() + 1);

    std::string manifest_json = serialize_bundle_manifest(manifest);
    entries.push_back({kManifestEntryName,
                       std::vector<uint8_t>(manifest_json.begin(), manifest_json.end())});
    for (size_t i = 0; i < items.size(); i++) {
        entries.push_back({items[i].target, payloads[i]});
    }

    auto cpio = write_cpio(entries);
    if (cpio.isErr()) {
        return R::err(cpio.error());
    }

    CompressResult compressed = compression == Compression::Gzip
        ? gzip_compress(cpio.value())
        : zstd_compress(cpio.value(), kZstdLevel);
    if (!compressed.ok) {
        return R::err(Error(ErrorCode::IO_ERROR, "compressing archive: " + compressed.error));
    }
    return R::ok(std::move(compressed.data));
}

Result<void> write_archive_file(const std::string& path, const BundleManifest& manifest,
                                const std::vector<std::vector<uint8_t>>& payloads,
                                Compression compression) {
    auto checked = check_payloads(manifest, payloads);
    if (checked.isErr()) {
        return checked;
    }

    auto writer = ArchiveWriter::create(path, compression);
    if (writer.isErr()) {
        return Result<void>::err(writer.error());
    }

    std::string manifest_json = serialize_bundle_manifest(manifest);
    auto added = writer.value()->add(kManifestEntryName,
        std::vector<uint8_t>(manifest_json.begin(), manifest_json.end()));
    if (added.isErr()) {
        return added;
    }

    const auto& items = manifest.bundle.manifest;
    for (size_t i = 0; i < items.size(); i++) {
        added = writer.value()->add(items[i].target, payloads[i]);
        if (added.isErr()) {
            return added;
        }
    }

    auto committed = writer.value()->commit();
    if (committed.isErr()) {
        return committed;
    }
    spdlog::debug("wrote archive {} with {} payloads", path, payloads.size());
    return Result<void>::ok();
}

Result<ParsedArchive> parse_archive(const std::vector<uint8_t>& data) {
    using R = Result<ParsedArchive>;

    CompressResult raw = decompress_auto(data);
    if (!raw.ok) {
        return R::err(invalid("decompressing archive: " + raw.error));
    }

    auto entries = read_cpio(raw.data);
    if (entries.isErr()) {
        return R::err(entries.error());
    }

    ParsedArchive parsed;
    bool have_manifest = false;
    for (auto& entry : entries.value()) {
        switch (classify_entry(entry.name, entry.data.size(), have_manifest)) {
            case EntryRole::Manifest: {
                auto manifest = parse_manifest_entry(entry.data);
                if (manifest.isErr()) {
                    return R::err(manifest.error());
                }
                parsed.manifest = std::move(manifest.value());
                have_manifest = true;
                break;
            }
            case EntryRole::Payload:
                parsed.payloads.push_back({std::move(entry.name), std::move(entry.data)});
                break;
            case EntryRole::Skipped:
                break;
        }
    }

    if (!have_manifest) {
        return R::err(invalid(std::string("archive has no ") + kManifestEntryName));
    }
    return R::ok(std::move(parsed));
}

Result<ParsedArchive> parse_archive_file(const std::string& path) {
    using R = Result<ParsedArchive>;

    auto reader = ArchiveReader::open(path);
    if (reader.isErr()) {
        return R::err(reader.error());
    }

    ParsedArchive parsed;
    bool have_manifest = false;
    while (true) {
        auto entry = reader.value()->next();
        if (entry.isErr()) {
            return R::err(entry.error().withContext(path));
        }
        if (!entry.value()) {
            break;
        }
        CpioEntry& current = *entry.value();
        switch (classify_entry(current.name, current.data.size(), have_manifest)) {
            case EntryRole::Manifest: {
                auto manifest = parse_manifest_entry(current.data);
                if (manifest.isErr()) {
                    return R::err(manifest.error().withContext(path));
                }
                parsed.manifest = std::move(manifest.value());
                have_manifest = true;
                break;
            }
            case EntryRole::Payload:
                parsed.payloads.push_back({std::move(current.name), std::move(current.data)});
                break;
            case EntryRole::Skipped:
                break;
        }
    }

    if (!have_manifest) {
        return R::err(invalid(std::string("archive has no ") + kManifestEntryName).withContext(path));
    }
    return R::ok(std::move(parsed));
}

// ============================================================================
// ArchiveReader
// ============================================================================

ArchiveReader::ArchiveReader(std::unique_ptr<DecompressingReader> source)
    : source_(std::move(source)) {}

Result<std::unique_ptr<ArchiveReader>> ArchiveReader::open(const std::string& path) {
    using R = Result<std::unique_ptr<ArchiveReader>>;

    auto source = DecompressingReader::open(path);
    if (source.isErr()) {
        if (source.error().code() == ErrorCode::ARCHIVE_INVALID) {
            return R::err(source.error().withContext(path));
        }
        return R::err(source.error());
    }
    return R::ok(std::make_unique<ArchiveReader>(std::move(source.value())));
}

Result<size_t> ArchiveReader::fill(uint8_t* buf, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        auto n = source_->read(buf + filled, len - filled);
        if (n.isErr()) {
            return n;
        }
        if (n.value() == 0) {
            break;
        }
        filled += n.value();
    }
    offset_ += filled;
    return Result<size_t>::ok(filled);
}

Result<void> ArchiveReader::skip_rest() {
    uint64_t left = static_cast<uint64_t>(remaining_) + padding_;
    std::vector<uint8_t> scratch(static_cast<size_t>(std::min<uint64_t>(left, kStreamBlockSize)));
    while (left > 0) {
        size_t take = static_cast<size_t>(std::min<uint64_t>(left, scratch.size()));
        auto n = fill(scratch.data(), take);
        if (n.isErr()) {
            return Result<void>::err(n.error());
        }
        if (n.value() < take) {
            return Result<void>::err(invalid("truncated cpio record data for " + name_));
        }
        left -= take;
    }
    remaining_ = 0;
    padding_ = 0;
    return Result<void>::ok();
}

Result<std::optional<CpioHeader>> ArchiveReader::next_header() {
    using R = Result<std::optional<CpioHeader>>;
    if (done_) {
        return R::ok(std::nullopt);
    }

    auto skipped = skip_rest();
    if (skipped.isErr()) {
        return R::err(skipped.error());
    }

    const uint64_t header_offset = offset_;
    uint8_t header[kNewcHeaderSize];
    auto got = fill(header, sizeof(header));
    if (got.isErr()) {
        return R::err(got.error());
    }
    if (got.value() < sizeof(header)) {
        return R::err(invalid("cpio stream ends without a trailer"));
    }

    auto sizes = parse_newc_header(header, header_offset);
    if (sizes.isErr()) {
        return R::err(sizes.error());
    }
    const uint32_t name_size = sizes.value().name_size;
    if (name_size > kMaxNameSize) {
        return R::err(invalid("cpio record name of " + std::to_string(name_size) +
                              " bytes at offset " + std::to_string(header_offset)));
    }

    std::vector<uint8_t> name_buf(name_size + pad4(kNewcHeaderSize + name_size));
    got = fill(name_buf.data(), name_buf.size());
    if (got.isErr()) {
        return R::err(got.error());
    }
    if (got.value() < name_buf.size()) {
        return R::err(invalid("truncated cpio record name at offset " +
                              std::to_string(header_offset)));
    }
    std::string name(reinterpret_cast<const char*>(name_buf.data()), name_size - 1);

    if (name == kTrailerName) {
        done_ = true;
        return R::ok(std::nullopt);
    }

    name_ = name;
    remaining_ = sizes.value().file_size;
    padding_ = static_cast<uint32_t>(pad4(remaining_));
    return R::ok(CpioHeader{std::move(name), sizes.value().file_size});
}

Result<size_t> ArchiveReader::read(uint8_t* buf, size_t len) {
    using R = Result<size_t>;
    if (remaining_ == 0 || len == 0) {
        return R::ok(0);
    }

    size_t take = static_cast<size_t>(std::min<uint64_t>(len, remaining_));
    auto n = source_->read(buf, take);
    if (n.isErr()) {
        return n;
    }
    if (n.value() == 0) {
        return R::err(invalid("truncated cpio record data for " + name_));
    }
    offset_ += n.value();
    remaining_ -= static_cast<uint32_t>(n.value());
    return n;
}

Result<std::vector<uint8_t>> ArchiveReader::read_all() {
    using R = Result<std::vector<uint8_t>>;
    std::vector<uint8_t> data(remaining_);
    size_t filled = 0;
    while (filled < data.size()) {
        auto n = read(data.data() + filled, data.size() - filled);
        if (n.isErr()) {
            return R::err(n.error());
        }
        filled += n.value();
    }
    return R::ok(std::move(data));
}

Result<std::optional<CpioEntry>> ArchiveReader::next() {
    using R = Result<std::optional<CpioEntry>>;

    auto header = next_header();
    if (header.isErr()) {
        return R::err(header.error());
    }
    if (!header.value()) {
        return R::ok(std::nullopt);
    }

    auto data = read_all();
    if (data.isErr()) {
        return R::err(data.error());
    }
    return R::ok(CpioEntry{std::move(header.value()->name), std::move(data.value())});
}

// ============================================================================
// ArchiveWriter
// ============================================================================

ArchiveWriter::ArchiveWriter(std::string path, std::string temp_path)
    : path_(std::move(path)), temp_path_(std::move(temp_path)) {}

ArchiveWriter::~ArchiveWriter() {
    if (committed_) return;

    compressor_.reset();
    file_.reset();
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    if (ec) {
        spdlog::warn("could not remove {}: {}", temp_path_, ec.message());
    }
}

Result<std::unique_ptr<ArchiveWriter>> ArchiveWriter::create(const std::string& path,
                                                             Compression compression) {
    using R = Result<std::unique_ptr<ArchiveWriter>>;

    std::unique_ptr<ArchiveWriter> writer(new ArchiveWriter(path, make_temp_path(path)));
    writer->file_ = std::make_unique<std::ofstream>(writer->temp_path_,
                                                    std::ios::binary | std::ios::trunc);
    if (!*writer->file_) {
        return R::err(Error(ErrorCode::IO_ERROR,
            "writing archive " + path + ": failed to create temp file " + writer->temp_path_));
    }

    auto compressor = CompressingWriter::create(*writer->file_, compression);
    if (compressor.isErr()) {
        return R::err(compressor.error().withContext("writing archive " + path));
    }
    writer->compressor_ = std::move(compressor.value());
    return R::ok(std::move(writer));
}

Result<void> ArchiveWriter::write_record(const std::string& name, const uint8_t* data,
                                         uint32_t size, uint32_t ino, uint32_t mode) {
    std::vector<uint8_t> header;
    header.reserve(kNewcHeaderSize + name.size() + 4);
    append_header(header, ino, name, size, mode, 1);

    static const uint8_t kZeros[4] = {0, 0, 0, 0};
    auto put = [this](const uint8_t* bytes, size_t len) {
        if (len == 0) return Result<void>::ok();
        auto written = compressor_->write(bytes, len);
        if (written.isErr()) {
            return Result<void>::err(written.error().withContext("writing archive " + path_));
        }
        return Result<void>::ok();
    };

    auto written = put(header.data(), header.size());
    if (written.isOk()) written = put(data, size);
    if (written.isOk()) written = put(kZeros, pad4(size));
    return written;
}

Result<void> ArchiveWriter::add(const std::string& name, const std::vector<uint8_t>& data) {
    if (committed_ || !compressor_) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "archive " + path_ + " is already committed"));
    }
    if (name.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT, "cpio entry with an empty name"));
    }
    if (data.size() > std::numeric_limits<uint32_t>::max()) {
        return Result<void>::err(entry_too_large(name, data.size()));
    }
    return write_record(name, data.data(), static_cast<uint32_t>(data.size()), next_ino_++,
                        kRegularFileMode);
}

Result<void> ArchiveWriter::commit() {
    if (committed_ || !compressor_) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "archive " + path_ + " is already committed"));
    }

    auto trailer = write_record(kTrailerName, nullptr, 0, 0, 0);
    if (trailer.isErr()) {
        return trailer;
    }
    auto finished = compressor_->finish();
    compressor_.reset();
    if (finished.isErr()) {
        return Result<void>::err(finished.error().withContext("writing archive " + path_));
    }

    file_->close();
    if (file_->fail()) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
            "writing archive " + path_ + ": failed to close temp file"));
    }

    auto renamed = commit_temp_file(temp_path_, path_);
    if (!renamed.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
            "writing archive " + path_ + ": " + renamed.error));
    }
    committed_ = true;
    return Result<void>::ok();
}

// ============================================================================
// Streaming Payload Access
// ============================================================================

Result<std::vector<PayloadInfo>> describe_payloads(const std::vector<ArchivePayload>& payloads) {
    using R = Result<std::vector<PayloadInfo>>;

    std::vector<PayloadInfo> infos;
    infos.reserve(payloads.size());
    for (const auto& payload : payloads) {
        HashResult hash = compute_sha256(payload.data);
        if (!hash.ok) {
            return R::err(Error(ErrorCode::IO_ERROR,
                "hashing payload " + payload.name + ": " + hash.error));
        }
        infos.push_back({payload.name, payload.data.size(), hash.hex_digest});
    }
    return R::ok(std::move(infos));
}

Result<ArchiveIndex> index_archive_file(const std::string& path) {
    using R = Result<ArchiveIndex>;

    auto opened = ArchiveReader::open(path);
    if (opened.isErr()) {
        return R::err(opened.error());
    }
    ArchiveReader& reader = *opened.value();

    ArchiveIndex index;
    bool have_manifest = false;
    std::vector<uint8_t> block(kStreamBlockSize);

    while (true) {
        auto header = reader.next_header();
        if (header.isErr()) {
            return R::err(header.error().withContext(path));
        }
        if (!header.value()) {
            break;
        }
        const CpioHeader& entry = *header.value();

        switch (classify_entry(entry.name, entry.size, have_manifest)) {
            case EntryRole::Manifest: {
                if (entry.size > kMaxManifestSize) {
                    return R::err(invalid(entry.name + " is " + std::to_string(entry.size) +
                                          " bytes").withContext(path));
                }
                auto data = reader.read_all();
                if (data.isErr()) {
                    return R::err(data.error().withContext(path));
                }
                auto manifest = parse_manifest_entry(data.value());
                if (manifest.isErr()) {
                    return R::err(manifest.error().withContext(path));
                }
                index.manifest = std::move(manifest.value());
                have_manifest = true;
                break;
            }
            case EntryRole::Payload: {
                Sha256Hasher hasher;
                while (true) {
                    auto n = reader.read(block.data(), block.size());
                    if (n.isErr()) {
                        return R::err(n.error().withContext(path));
                    }
                    if (n.value() == 0 || !hasher.update(block.data(), n.value())) {
                        break;
                    }
                }
                HashResult hash = hasher.finish();
                if (!hash.ok) {
                    return R::err(Error(ErrorCode::IO_ERROR,
                        "hashing payload " + entry.name + ": " + hash.error));
                }
                index.payloads.push_back({entry.name, entry.size, hash.hex_digest});
                break;
            }
            case EntryRole::Skipped:
                break;
        }
    }

    if (!have_manifest) {
        return R::err(invalid(std::string("archive has no ") + kManifestEntryName).withContext(path));
    }
    return R::ok(std::move(index));
}

Result<void> visit_archive_payloads(const std::string& path, const std::vector<bool>& wanted,
                                    const PayloadVisitor& visit) {
    using R = Result<void>;

    auto opened = ArchiveReader::open(path);
    if (opened.isErr()) {
        return R::err(opened.error());
    }
    ArchiveReader& reader = *opened.value();

    bool have_manifest = false;
    size_t payload_index = 0;

    while (true) {
        auto header = reader.next_header();
        if (header.isErr()) {
            return R::err(header.error().withContext(path));
        }
        if (!header.value()) {
            break;
        }
        const CpioHeader& entry = *header.value();

        switch (classify_entry(entry.name, entry.size, have_manifest)) {
            case EntryRole::Manifest:
                have_manifest = true;
                break;
            case EntryRole::Payload: {
                size_t index = payload_index++;
                if (index >= wanted.size() || !wanted[index]) {
                    break;
                }
                auto data = reader.read_all();
                if (data.isErr()) {
                    return R::err(data.error().withContext(path));
                }
                ArchivePayload payload{entry.name, std::move(data.value())};
                auto visited = visit(index, payload);
                if (visited.isErr()) {
                    return visited;
                }
                break;
            }
            case EntryRole::Skipped:
                break;
        }
    }
    return R::ok();
}

// ============================================================================
// Payload Matching
// ============================================================================

Result<std::vector<MatchedPayload>> match_payloads(const BundleManifest& manifest,
                                                   const std::vector<PayloadInfo>& payloads,
                                                   MatchPolicy policy) {
    using R = Result<std::vector<MatchedPayload>>;

    std::vector<bool> claimed(payloads.size(), false);
    std::vector<MatchedPayload> matches;
    const auto& items = manifest.bundle.manifest;

    for (size_t i = 0; i < items.size(); i++) {
        const auto& item = items[i];
        const std::string want = to_lower_hex(item.hash);
        std::optional<MatchedPayload> match;

        for (size_t p = 0; p < payloads.size() && !match; p++) {
            if (!claimed[p] && payloads[p].content_hash == want) {
                match = MatchedPayload{i, p, MatchKind::Hash};
            }
        }

        if (!match && policy == MatchPolicy::Lenient) {
            for (size_t p = 0; p < payloads.size() && !match; p++) {
                std::string name = base_name(payloads[p].name);
                if (!claimed[p] && (name == item.binary_id || name == item.target)) {
                    match = MatchedPayload{i, p, MatchKind::Name};
                }
            }
            for (size_t p = 0; p < payloads.size() && !match; p++) {
                if (!claimed[p]) {
                    match = MatchedPayload{i, p, MatchKind::FirstUnclaimed};
                }
            }
            if (match) {
                spdlog::warn("binary {} (target '{}') matched payload {} by {}, "
                             "its content hash {} differs from the manifest",
                             item.binary_id, item.target, payloads[match->payload_index].name,
                             match_kind_name(match->kind),
                             payloads[match->payload_index].content_hash);
            }
        }

        if (!match) {
            return R::err(invalid("no payload matches binary " + item.binary_id + " (target '" +
                                  item.target + "', hash " + want + ")"));
        }
        claimed[match->payload_index] = true;
        match->content_hash = payloads[match->payload_index].content_hash;
        matches.push_back(*match);
    }

    return R::ok(std::move(matches));
}

Result<std::vector<MatchedPayload>> match_payloads(const BundleManifest& manifest,
                                                   const std::vector<ArchivePayload>& payloads,
                                                   MatchPolicy policy) {
    auto infos = describe_payloads(payloads);
    if (infos.isErr()) {
        return Result<std::vector<MatchedPayload>>::err(infos.error());
    }
    return match_payloads(manifest, infos.value(), policy);
}

} // namespace shipyard
