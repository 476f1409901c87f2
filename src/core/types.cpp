#include "shipyard/types.hpp"

#include <algorithm>
#include <cctype>

namespace shipyard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "invalid input";
        case ErrorCode::UNSUPPORTED_API_VERSION: return "unsupported api version";
        case ErrorCode::REGISTRY_ERROR: return "registry error";
        case ErrorCode::NOT_FOUND: return "not found";
        case ErrorCode::CONFLICT: return "conflict";
        case ErrorCode::RATE_LIMITED: return "rate limited";
        case ErrorCode::TRANSFER_FAILED: return "transfer failed";
        case ErrorCode::INTEGRITY_CONFLICT: return "integrity conflict";
        case ErrorCode::AMBIGUOUS_MATCH: return "ambiguous match";
        case ErrorCode::SIGNATURE_FAILED: return "signature failed";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::IO_ERROR: return "i/o error";
        case ErrorCode::ARCHIVE_INVALID: return "invalid archive";
        default: return "error";
    }
}

// ============================================================================
// Binary State Machine
// ============================================================================

BinaryState parse_binary_state(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "uploadable") return BinaryState::Uploadable;
    if (lower == "hashable") return BinaryState::Hashable;
    if (lower == "hashing") return BinaryState::Hashing;
    if (lower == "signable") return BinaryState::Signable;
    if (lower == "signed") return BinaryState::Signed;
    if (lower == "destroyed") return BinaryState::Destroyed;
    return BinaryState::Unknown;
}

std::optional<BinaryState> next_binary_state(BinaryState s) {
    switch (s) {
        case BinaryState::Uploadable: return BinaryState::Hashable;
        case BinaryState::Hashable: return BinaryState::Hashing;
        case BinaryState::Hashing: return BinaryState::Signable;
        case BinaryState::Signable: return BinaryState::Signed;
        default: return std::nullopt;
    }
}

bool transition_allowed(BinaryState from, BinaryState to) {
    if (from == BinaryState::Unknown || to == BinaryState::Unknown) return false;
    if (from == BinaryState::Destroyed || to == BinaryState::Destroyed) return false;
    if (from == to) return true;
    auto next = next_binary_state(from);
    return next && *next == to;
}

bool reset_allowed(BinaryState from) {
    switch (from) {
        case BinaryState::Uploadable:
        case BinaryState::Hashable:
        case BinaryState::Hashing:
        case BinaryState::Signable:
            return true;
        default:
            return false;
    }
}

BinaryPartState parse_binary_part_state(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "pending") return BinaryPartState::Pending;
    if (lower == "valid") return BinaryPartState::Valid;
    return BinaryPartState::Unknown;
}

const char* binary_part_state_to_string(BinaryPartState s) {
    switch (s) {
        case BinaryPartState::Pending: return "pending";
        case BinaryPartState::Valid: return "valid";
        default: return "unknown";
    }
}

bool Binary::has_signature_for(const std::string& key_id) const {
    if (key_id.empty()) return false;
    return std::any_of(signatures.begin(), signatures.end(), [&](const Signature& sig) {
        return sig.keyid == key_id || sig.signing_key_prn == key_id;
    });
}

// ============================================================================
// Bundles
// ============================================================================

Result<void> validate_api_version(int api_version) {
    if (api_version == 1 || api_version == 2) {
        return Result<void>::ok();
    }
    return Result<void>::err(Error(ErrorCode::UNSUPPORTED_API_VERSION,
        "API version " + std::to_string(api_version) + " is not supported, use 1 or 2"));
}

const std::string& bundle_prn(const Bundle& bundle) {
    return std::visit([](const auto& b) -> const std::string& { return b.prn; }, bundle);
}

const std::optional<std::string>& bundle_name(const Bundle& bundle) {
    return std::visit([](const auto& b) -> const std::optional<std::string>& { return b.name; },
                      bundle);
}

int bundle_api_version(const Bundle& bundle) {
    return std::holds_alternative<BundleV1>(bundle) ? 1 : 2;
}

} // namespace shipyard
