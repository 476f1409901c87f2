#include "shipyard/archive.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <ostream>

#include <zlib.h>
#include <zstd.h>

namespace shipyard {

namespace {

constexpr uint8_t kZstdMagic[4] = {0x28, 0xB5, 0x2F, 0xFD};
constexpr uint8_t kGzipMagic[2] = {0x1f, 0x8b};
constexpr size_t kChunk = 1 << 16;

CompressResult fail(const std::string& message) {
    CompressResult result;
    result.error = message;
    return result;
}

class ZstdCCtx {
public:
    ZstdCCtx() : ctx_(ZSTD_createCCtx()) {}
    ~ZstdCCtx() { if (ctx_) ZSTD_freeCCtx(ctx_); }

    ZstdCCtx(const ZstdCCtx&) = delete;
    ZstdCCtx& operator=(const ZstdCCtx&) = delete;

    ZSTD_CCtx* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    ZSTD_CCtx* ctx_;
};

class ZstdDCtx {
public:
    ZstdDCtx() : ctx_(ZSTD_createDCtx()) {}
    ~ZstdDCtx() { if (ctx_) ZSTD_freeDCtx(ctx_); }

    ZstdDCtx(const ZstdDCtx&) = delete;
    ZstdDCtx& operator=(const ZstdDCtx&) = delete;

    ZSTD_DCtx* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    ZSTD_DCtx* ctx_;
};

bool has_prefix(const std::vector<uint8_t>& data, const uint8_t* magic, size_t len) {
    return data.size() >= len && std::memcmp(data.data(), magic, len) == 0;
}

} // namespace

// ============================================================================
// Zstandard
// ============================================================================

CompressResult zstd_compress(const std::vector<uint8_t>& data, int level) {
    ZstdCCtx ctx;
    if (!ctx) return fail("ZSTD_createCCtx failed");

    CompressResult result;
    result.data.resize(ZSTD_compressBound(data.size()));

    size_t written = ZSTD_compressCCtx(ctx.get(), result.data.data(), result.data.size(),
                                       data.data(), data.size(), level);
    if (ZSTD_isError(written)) {
        return fail(std::string("zstd compression failed: ") + ZSTD_getErrorName(written));
    }

    result.data.resize(written);
    result.ok = true;
    return result;
}

CompressResult zstd_decompress(const std::vector<uint8_t>& data) {
    if (!has_prefix(data, kZstdMagic, sizeof(kZstdMagic))) {
        return fail("not a zstd stream");
    }

    ZstdDCtx ctx;
    if (!ctx) return fail("ZSTD_createDCtx failed");

    CompressResult result;
    ZSTD_inBuffer input = {data.data(), data.size(), 0};
    std::vector<uint8_t> chunk(ZSTD_DStreamOutSize());
    size_t remaining_hint = 1;

    while (input.pos < input.size) {
        ZSTD_outBuffer output = {chunk.data(), chunk.size(), 0};
        remaining_hint = ZSTD_decompressStream(ctx.get(), &output, &input);
        if (ZSTD_isError(remaining_hint)) {
            return fail(std::string("zstd decompression failed: ") +
                        ZSTD_getErrorName(remaining_hint));
        }
        result.data.insert(result.data.end(), chunk.begin(), chunk.begin() + output.pos);
    }

    // Flush anything still buffered in the decoder
    while (remaining_hint != 0) {
        ZSTD_outBuffer output = {chunk.data(), chunk.size(), 0};
        remaining_hint = ZSTD_decompressStream(ctx.get(), &output, &input);
        if (ZSTD_isError(remaining_hint)) {
            return fail(std::string("zstd decompression failed: ") +
                        ZSTD_getErrorName(remaining_hint));
        }
        if (output.pos == 0) {
            return fail("zstd stream is truncated");
        }
        result.data.insert(result.data.end(), chunk.begin(), chunk.begin() + output.pos);
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Gzip
// ============================================================================

CompressResult gzip_compress(const std::vector<uint8_t>& data) {
    CompressResult result;

    // Header written by hand so output does not depend on time or host
    result.data = {
        0x1f, 0x8b,              // magic
        0x08,                    // deflate
        0x00,                    // no flags
        0x00, 0x00, 0x00, 0x00,  // mtime 0
        0x00,                    // extra flags
        0xff,                    // OS unknown
    };

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate (negative window bits)
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return fail("deflateInit2 failed");
    }

    std::vector<uint8_t> out(kChunk);
    size_t offset = 0;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        size_t take = std::min(data.size() - offset, static_cast<size_t>(kChunk));
        strm.next_in = const_cast<Bytef*>(data.data() + offset);
        strm.avail_in = static_cast<uInt>(take);
        offset += take;
        int flush = offset == data.size() ? Z_FINISH : Z_NO_FLUSH;

        do {
            strm.next_out = out.data();
            strm.avail_out = static_cast<uInt>(out.size());
            ret = deflate(&strm, flush);
            if (ret == Z_STREAM_ERROR) {
                deflateEnd(&strm);
                return fail("deflate failed");
            }
            result.data.insert(result.data.end(), out.data(),
                               out.data() + (out.size() - strm.avail_out));
        } while (strm.avail_out == 0);

        if (flush != Z_FINISH && ret == Z_STREAM_END) break;
    }
    deflateEnd(&strm);

    // Trailer: CRC32 + size mod 2^32, little-endian
    uLong crc = crc32(0L, Z_NULL, 0);
    for (size_t pos = 0; pos < data.size(); pos += kChunk) {
        size_t take = std::min(data.size() - pos, static_cast<size_t>(kChunk));
        crc = crc32(crc, data.data() + pos, static_cast<uInt>(take));
    }
    uint32_t crc32_value = static_cast<uint32_t>(crc);
    uint32_t size = static_cast<uint32_t>(data.size());
    for (int shift = 0; shift < 32; shift += 8) result.data.push_back((crc32_value >> shift) & 0xff);
    for (int shift = 0; shift < 32; shift += 8) result.data.push_back((size >> shift) & 0xff);

    result.ok = true;
    return result;
}

CompressResult gzip_decompress(const std::vector<uint8_t>& data) {
    if (data.size() < 18) {
        return fail("gzip stream is too small");
    }
    if (!has_prefix(data, kGzipMagic, sizeof(kGzipMagic))) {
        return fail("not a gzip stream");
    }
    if (data[2] != 0x08) {
        return fail("unsupported gzip compression method");
    }

    size_t offset = 10;
    uint8_t flags = data[3];

    // Extra field
    if (flags & 0x04) {
        if (offset + 2 > data.size()) return fail("truncated gzip header");
        uint16_t xlen = static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
        offset += 2 + xlen;
    }
    // Original file name
    if (flags & 0x08) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    // Comment
    if (flags & 0x10) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    // Header CRC
    if (flags & 0x02) {
        offset += 2;
    }

    if (offset + 8 > data.size()) {
        return fail("truncated gzip header");
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit2(&strm, -15) != Z_OK) {
        return fail("inflateInit2 failed");
    }

    CompressResult result;
    std::vector<uint8_t> out(kChunk);
    size_t in_pos = offset;
    size_t in_end = data.size() - 8;
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        if (strm.avail_in == 0) {
            if (in_pos >= in_end) {
                inflateEnd(&strm);
                return fail("gzip stream is truncated");
            }
            size_t take = std::min(in_end - in_pos, static_cast<size_t>(kChunk));
            strm.next_in = const_cast<Bytef*>(data.data() + in_pos);
            strm.avail_in = static_cast<uInt>(take);
            in_pos += take;
        }

        strm.next_out = out.data();
        strm.avail_out = static_cast<uInt>(out.size());
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return fail(std::string("inflate failed: ") + (strm.msg ? strm.msg : "corrupt data"));
        }
        result.data.insert(result.data.end(), out.data(),
                           out.data() + (out.size() - strm.avail_out));
    }
    inflateEnd(&strm);

    const uint8_t* trailer = data.data() + data.size() - 8;
    uint32_t expected_crc = static_cast<uint32_t>(trailer[0]) |
                            (static_cast<uint32_t>(trailer[1]) << 8) |
                            (static_cast<uint32_t>(trailer[2]) << 16) |
                            (static_cast<uint32_t>(trailer[3]) << 24);
    uint32_t expected_size = static_cast<uint32_t>(trailer[4]) |
                             (static_cast<uint32_t>(trailer[5]) << 8) |
                             (static_cast<uint32_t>(trailer[6]) << 16) |
                             (static_cast<uint32_t>(trailer[7]) << 24);

    uLong crc = crc32(0L, Z_NULL, 0);
    for (size_t pos = 0; pos < result.data.size(); pos += kChunk) {
        size_t take = std::min(result.data.size() - pos, static_cast<size_t>(kChunk));
        crc = crc32(crc, result.data.data() + pos, static_cast<uInt>(take));
    }
    if (static_cast<uint32_t>(crc) != expected_crc ||
        static_cast<uint32_t>(result.data.size()) != expected_size) {
        return fail("gzip checksum mismatch");
    }

    result.ok = true;
    return result;
}

CompressResult decompress_auto(const std::vector<uint8_t>& data) {
    if (has_prefix(data, kZstdMagic, sizeof(kZstdMagic))) {
        return zstd_decompress(data);
    }
    if (has_prefix(data, kGzipMagic, sizeof(kGzipMagic))) {
        return gzip_decompress(data);
    }
    return fail("unrecognised compression (expected zstd or gzip)");
}

// ============================================================================
// Streaming
// ============================================================================

namespace {

Error stream_error(const std::string& message) {
    return Error(ErrorCode::ARCHIVE_INVALID, message);
}

Result<size_t> fill_from(std::ifstream& file, std::vector<uint8_t>& buf) {
    file.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (file.bad()) {
        return Result<size_t>::err(Error(ErrorCode::IO_ERROR, "failed to read archive"));
    }
    return Result<size_t>::ok(static_cast<size_t>(file.gcount()));
}

Result<void> emit(std::ostream& out, const uint8_t* data, size_t len) {
    if (len == 0) return Result<void>::ok();
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!out) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to write archive"));
    }
    return Result<void>::ok();
}

class ZstdFileReader : public DecompressingReader {
public:
    explicit ZstdFileReader(std::ifstream file)
        : file_(std::move(file)), in_(ZSTD_DStreamInSize()) {}

    bool valid() const { return static_cast<bool>(ctx_); }

    Result<size_t> read(uint8_t* buf, size_t len) override {
        using R = Result<size_t>;
        if (len == 0) return R::ok(0);

        ZSTD_outBuffer output = {buf, len, 0};
        while (output.pos == 0) {
            if (input_.pos == input_.size && !eof_) {
                auto filled = fill_from(file_, in_);
                if (filled.isErr()) return R::err(filled.error());
                eof_ = filled.value() == 0;
                input_ = {in_.data(), filled.value(), 0};
            }

            size_t hint = ZSTD_decompressStream(ctx_.get(), &output, &input_);
            if (ZSTD_isError(hint)) {
                return R::err(stream_error(std::string("zstd decompression failed: ") +
                                           ZSTD_getErrorName(hint)));
            }
            if (output.pos == 0 && eof_ && input_.pos == input_.size) {
                // Nothing more to read and nothing left buffered in the decoder
                if (hint != 0) return R::err(stream_error("zstd stream is truncated"));
                break;
            }
        }
        return R::ok(output.pos);
    }

private:
    std::ifstream file_;
    ZstdDCtx ctx_;
    std::vector<uint8_t> in_;
    ZSTD_inBuffer input_ = {nullptr, 0, 0};
    bool eof_ = false;
};

class GzipFileReader : public DecompressingReader {
public:
    explicit GzipFileReader(std::ifstream file) : file_(std::move(file)), in_(kChunk) {
        std::memset(&strm_, 0, sizeof(strm_));
        // gzip wrapper, header and trailer checked by zlib
        initialized_ = inflateInit2(&strm_, 16 + MAX_WBITS) == Z_OK;
    }

    ~GzipFileReader() override {
        if (initialized_) inflateEnd(&strm_);
    }

    GzipFileReader(const GzipFileReader&) = delete;
    GzipFileReader& operator=(const GzipFileReader&) = delete;

    bool valid() const { return initialized_; }

    Result<size_t> read(uint8_t* buf, size_t len) override {
        using R = Result<size_t>;
        if (finished_ || len == 0) return R::ok(0);

        const uInt capacity = static_cast<uInt>(std::min(len, kChunk));
        strm_.next_out = buf;
        strm_.avail_out = capacity;

        while (strm_.avail_out == capacity) {
            if (strm_.avail_in == 0) {
                auto filled = fill_from(file_, in_);
                if (filled.isErr()) return R::err(filled.error());
                if (filled.value() == 0) return R::err(stream_error("gzip stream is truncated"));
                strm_.next_in = in_.data();
                strm_.avail_in = static_cast<uInt>(filled.value());
            }

            int ret = inflate(&strm_, Z_NO_FLUSH);
            if (ret == Z_STREAM_END) {
                finished_ = true;
                break;
            }
            if (ret != Z_OK) {
                return R::err(stream_error(std::string("inflate failed: ") +
                                           (strm_.msg ? strm_.msg : "corrupt data")));
            }
        }
        return R::ok(capacity - strm_.avail_out);
    }

private:
    std::ifstream file_;
    std::vector<uint8_t> in_;
    z_stream strm_;
    bool initialized_ = false;
    bool finished_ = false;
};

class ZstdStreamWriter : public CompressingWriter {
public:
    explicit ZstdStreamWriter(std::ostream& out) : out_(out), buf_(ZSTD_CStreamOutSize()) {}

    Result<void> init(int level) {
        if (!ctx_) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "ZSTD_createCCtx failed"));
        }
        size_t rc = ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_compressionLevel, level);
        if (ZSTD_isError(rc)) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                std::string("zstd compression level: ") + ZSTD_getErrorName(rc)));
        }
        return Result<void>::ok();
    }

    Result<void> write(const uint8_t* data, size_t len) override {
        ZSTD_inBuffer input = {data, len, 0};
        while (input.pos < input.size) {
            auto step = compress(input, ZSTD_e_continue);
            if (step.isErr()) return Result<void>::err(step.error());
        }
        return Result<void>::ok();
    }

    Result<void> finish() override {
        ZSTD_inBuffer input = {nullptr, 0, 0};
        while (true) {
            auto remaining = compress(input, ZSTD_e_end);
            if (remaining.isErr()) return Result<void>::err(remaining.error());
            if (remaining.value() == 0) break;
        }
        return Result<void>::ok();
    }

private:
    Result<size_t> compress(ZSTD_inBuffer& input, ZSTD_EndDirective mode) {
        ZSTD_outBuffer output = {buf_.data(), buf_.size(), 0};
        size_t rc = ZSTD_compressStream2(ctx_.get(), &output, &input, mode);
        if (ZSTD_isError(rc)) {
            return Result<size_t>::err(Error(ErrorCode::IO_ERROR,
                std::string("zstd compression failed: ") + ZSTD_getErrorName(rc)));
        }
        auto written = emit(out_, buf_.data(), output.pos);
        if (written.isErr()) return Result<size_t>::err(written.error());
        return Result<size_t>::ok(rc);
    }

    std::ostream& out_;
    ZstdCCtx ctx_;
    std::vector<uint8_t> buf_;
};

class GzipStreamWriter : public CompressingWriter {
public:
    explicit GzipStreamWriter(std::ostream& out) : out_(out), buf_(kChunk) {
        std::memset(&strm_, 0, sizeof(strm_));
    }

    ~GzipStreamWriter() override {
        if (initialized_) deflateEnd(&strm_);
    }

    GzipStreamWriter(const GzipStreamWriter&) = delete;
    GzipStreamWriter& operator=(const GzipStreamWriter&) = delete;

    Result<void> init() {
        if (deflateInit2(&strm_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "deflateInit2 failed"));
        }
        initialized_ = true;
        crc_ = crc32(0L, Z_NULL, 0);

        // Same fixed header as gzip_compress
        const uint8_t header[10] = {0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xff};
        return emit(out_, header, sizeof(header));
    }

    Result<void> write(const uint8_t* data, size_t len) override {
        size_t offset = 0;
        while (offset < len) {
            size_t take = std::min(len - offset, kChunk);
            crc_ = crc32(crc_, data + offset, static_cast<uInt>(take));
            strm_.next_in = const_cast<Bytef*>(data + offset);
            strm_.avail_in = static_cast<uInt>(take);
            auto step = deflate_all(Z_NO_FLUSH);
            if (step.isErr()) return step;
            offset += take;
        }
        size_ += static_cast<uint32_t>(len);
        return Result<void>::ok();
    }

    Result<void> finish() override {
        strm_.next_in = nullptr;
        strm_.avail_in = 0;
        auto step = deflate_all(Z_FINISH);
        if (step.isErr()) return step;

        // CRC32 + size mod 2^32, little-endian
        uint8_t trailer[8];
        uint32_t crc32_value = static_cast<uint32_t>(crc_);
        for (int i = 0; i < 4; i++) {
            trailer[i] = static_cast<uint8_t>((crc32_value >> (8 * i)) & 0xff);
            trailer[4 + i] = static_cast<uint8_t>((size_ >> (8 * i)) & 0xff);
        }
        return emit(out_, trailer, sizeof(trailer));
    }

private:
    Result<void> deflate_all(int flush) {
        int ret = Z_OK;
        do {
            strm_.next_out = buf_.data();
            strm_.avail_out = static_cast<uInt>(buf_.size());
            ret = deflate(&strm_, flush);
            if (ret == Z_STREAM_ERROR) {
                return Result<void>::err(Error(ErrorCode::IO_ERROR, "deflate failed"));
            }
            auto written = emit(out_, buf_.data(), buf_.size() - strm_.avail_out);
            if (written.isErr()) return written;
        } while (strm_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
        return Result<void>::ok();
    }

    std::ostream& out_;
    std::vector<uint8_t> buf_;
    z_stream strm_;
    bool initialized_ = false;
    uLong crc_ = 0;
    uint32_t size_ = 0;
};

} // namespace

Result<std::unique_ptr<DecompressingReader>> DecompressingReader::open(const std::string& path) {
    using R = Result<std::unique_ptr<DecompressingReader>>;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return R::err(Error(ErrorCode::IO_ERROR, "failed to open file: " + path));
    }

    std::vector<uint8_t> magic(sizeof(kZstdMagic));
    file.read(reinterpret_cast<char*>(magic.data()), static_cast<std::streamsize>(magic.size()));
    magic.resize(static_cast<size_t>(file.gcount()));
    file.clear();
    file.seekg(0);
    if (!file) {
        return R::err(Error(ErrorCode::IO_ERROR, "failed to read file: " + path));
    }

    if (has_prefix(magic, kZstdMagic, sizeof(kZstdMagic))) {
        auto reader = std::make_unique<ZstdFileReader>(std::move(file));
        if (!reader->valid()) return R::err(Error(ErrorCode::IO_ERROR, "ZSTD_createDCtx failed"));
        return R::ok(std::move(reader));
    }
    if (has_prefix(magic, kGzipMagic, sizeof(kGzipMagic))) {
        auto reader = std::make_unique<GzipFileReader>(std::move(file));
        if (!reader->valid()) return R::err(Error(ErrorCode::IO_ERROR, "inflateInit2 failed"));
        return R::ok(std::move(reader));
    }
    return R::err(stream_error("unrecognised compression (expected zstd or gzip)"));
}

Result<std::unique_ptr<CompressingWriter>> CompressingWriter::create(std::ostream& out,
                                                                     Compression compression,
                                                                     int level) {
    using R = Result<std::unique_ptr<CompressingWriter>>;

    if (compression == Compression::Gzip) {
        auto writer = std::make_unique<GzipStreamWriter>(out);
        auto ready = writer->init();
        if (ready.isErr()) return R::err(ready.error());
        return R::ok(std::move(writer));
    }

    auto writer = std::make_unique<ZstdStreamWriter>(out);
    auto ready = writer->init(level);
    if (ready.isErr()) return R::err(ready.error());
    return R::ok(std::move(writer));
}

} // namespace shipyard
