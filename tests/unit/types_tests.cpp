#include <doctest/doctest.h>
#include "shipyard/types.hpp"

using namespace shipyard;

TEST_CASE("binary states parse case-insensitively") {
    CHECK(parse_binary_state("uploadable") == BinaryState::Uploadable);
    CHECK(parse_binary_state("HASHABLE") == BinaryState::Hashable);
    CHECK(parse_binary_state("Hashing") == BinaryState::Hashing);
    CHECK(parse_binary_state("signable") == BinaryState::Signable);
    CHECK(parse_binary_state("signed") == BinaryState::Signed);
    CHECK(parse_binary_state("destroyed") == BinaryState::Destroyed);
    CHECK(parse_binary_state("archived") == BinaryState::Unknown);
    CHECK(parse_binary_state("") == BinaryState::Unknown);
}

TEST_CASE("binary state names round trip") {
    for (auto s : {BinaryState::Uploadable, BinaryState::Hashable, BinaryState::Hashing,
                   BinaryState::Signable, BinaryState::Signed, BinaryState::Destroyed}) {
        CHECK(parse_binary_state(binary_state_to_string(s)) == s);
    }
}

TEST_CASE("forward path advances one state at a time") {
    CHECK(next_binary_state(BinaryState::Uploadable) == BinaryState::Hashable);
    CHECK(next_binary_state(BinaryState::Hashable) == BinaryState::Hashing);
    CHECK(next_binary_state(BinaryState::Hashing) == BinaryState::Signable);
    CHECK(next_binary_state(BinaryState::Signable) == BinaryState::Signed);
    CHECK_FALSE(next_binary_state(BinaryState::Signed).has_value());
    CHECK_FALSE(next_binary_state(BinaryState::Destroyed).has_value());
}

TEST_CASE("transition table allows forward edges and self loops only") {
    CHECK(transition_allowed(BinaryState::Uploadable, BinaryState::Hashable));
    CHECK(transition_allowed(BinaryState::Signable, BinaryState::Signed));
    CHECK(transition_allowed(BinaryState::Hashing, BinaryState::Hashing));

    CHECK_FALSE(transition_allowed(BinaryState::Uploadable, BinaryState::Hashing));
    CHECK_FALSE(transition_allowed(BinaryState::Signed, BinaryState::Signable));
    CHECK_FALSE(transition_allowed(BinaryState::Signed, BinaryState::Uploadable));
    CHECK_FALSE(transition_allowed(BinaryState::Destroyed, BinaryState::Destroyed));
    CHECK_FALSE(transition_allowed(BinaryState::Signable, BinaryState::Destroyed));
    CHECK_FALSE(transition_allowed(BinaryState::Unknown, BinaryState::Hashable));
}

TEST_CASE("only unsigned live binaries may be reset") {
    CHECK(reset_allowed(BinaryState::Uploadable));
    CHECK(reset_allowed(BinaryState::Hashable));
    CHECK(reset_allowed(BinaryState::Hashing));
    CHECK(reset_allowed(BinaryState::Signable));
    CHECK_FALSE(reset_allowed(BinaryState::Signed));
    CHECK_FALSE(reset_allowed(BinaryState::Destroyed));
    CHECK_FALSE(reset_allowed(BinaryState::Unknown));
}

TEST_CASE("binary part states") {
    CHECK(parse_binary_part_state("valid") == BinaryPartState::Valid);
    CHECK(parse_binary_part_state("PENDING") == BinaryPartState::Pending);
    CHECK(parse_binary_part_state("broken") == BinaryPartState::Unknown);
    CHECK(std::string(binary_part_state_to_string(BinaryPartState::Valid)) == "valid");
}

TEST_CASE("has_signature_for matches keyid or signing key PRN") {
    Binary binary;
    Signature sig;
    sig.keyid = "ABCD";
    sig.signing_key_prn = "prn:1:org:signing_key:1";
    binary.signatures.push_back(sig);

    CHECK(binary.has_signature_for("ABCD"));
    CHECK(binary.has_signature_for("prn:1:org:signing_key:1"));
    CHECK_FALSE(binary.has_signature_for("EF01"));
    CHECK_FALSE(binary.has_signature_for(""));
}

TEST_CASE("api versions 1 and 2 are supported") {
    CHECK(validate_api_version(1).isOk());
    CHECK(validate_api_version(2).isOk());
    auto bad = validate_api_version(3);
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::UNSUPPORTED_API_VERSION);
}

TEST_CASE("bundle accessors see through both generations") {
    BundleV1 v1;
    v1.prn = "prn:v1";
    v1.name = "nightly";
    BundleV2 v2;
    v2.prn = "prn:v2";

    Bundle a = v1;
    Bundle b = v2;
    CHECK(bundle_prn(a) == "prn:v1");
    CHECK(bundle_name(a) == std::optional<std::string>("nightly"));
    CHECK(bundle_api_version(a) == 1);
    CHECK(bundle_prn(b) == "prn:v2");
    CHECK_FALSE(bundle_name(b).has_value());
    CHECK(bundle_api_version(b) == 2);
}

TEST_CASE("errors carry context") {
    Error error(ErrorCode::NOT_FOUND, "no such binary");
    error.withContext("pulling bundle");
    CHECK(error.message() == "pulling bundle: no such binary");
    CHECK(error.describe() == "not found: pulling bundle: no such binary");
}
