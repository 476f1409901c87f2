#include <doctest/doctest.h>
#include "shipyard/hashing.hpp"

#include "test_support.hpp"

using namespace shipyard;
using namespace shipyard::testing;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("sha256 of known inputs") {
    auto empty = compute_sha256(std::vector<uint8_t>{});
    REQUIRE(empty.ok);
    CHECK(empty.hex_digest == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto abc = compute_sha256(bytes_of("abc"));
    REQUIRE(abc.ok);
    CHECK(abc.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(abc.digest.size() == 32);
}

TEST_CASE("incremental hashing matches one-shot hashing") {
    auto content = make_content(100000, 7);
    Sha256Hasher hasher;
    size_t offset = 0;
    for (size_t step : {1u, 4095u, 33333u, 62571u}) {
        REQUIRE(hasher.update(content.data() + offset, step));
        offset += step;
    }
    REQUIRE(offset == content.size());
    auto incremental = hasher.finish();
    REQUIRE(incremental.ok);
    CHECK(incremental.hex_digest == sha256_hex(content));
}

TEST_CASE("file hashing streams the whole file") {
    TempDir dir;
    auto content = make_content(3 * 65536 + 17, 3);
    auto path = dir.write("payload.bin", content);

    auto result = compute_sha256_file(path);
    REQUIRE(result.ok);
    CHECK(result.hex_digest == sha256_hex(content));
}

TEST_CASE("file hashing reports a missing file") {
    auto result = compute_sha256_file("/nonexistent/shipyard/payload.bin");
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("hex encodings") {
    std::vector<uint8_t> data = {0x00, 0xAB, 0x7f, 0xff};
    CHECK(bytes_to_hex(data.data(), data.size()) == "00ab7fff");
    CHECK(bytes_to_hex_upper(data.data(), data.size()) == "00AB7FFF");
    CHECK(to_upper_hex("00ab7fff") == "00AB7FFF");
    CHECK(to_lower_hex("00AB7FFF") == "00ab7fff");

    std::vector<uint8_t> decoded;
    REQUIRE(hex_to_bytes("00Ab7FfF", decoded));
    CHECK(decoded == data);
    CHECK_FALSE(hex_to_bytes("abc", decoded));
    CHECK_FALSE(hex_to_bytes("zz", decoded));
}

TEST_CASE("base64 pads to four characters") {
    CHECK(base64_encode(bytes_of("")) == "");
    CHECK(base64_encode(bytes_of("a")) == "YQ==");
    CHECK(base64_encode(bytes_of("ab")) == "YWI=");
    CHECK(base64_encode(bytes_of("abc")) == "YWJj");
    CHECK(base64_encode(bytes_of("hello world")) == "aGVsbG8gd29ybGQ=");
}
