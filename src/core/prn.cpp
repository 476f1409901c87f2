#include "shipyard/prn.hpp"

#include <cctype>
#include <vector>

namespace shipyard {

namespace {

std::vector<std::string> split_colons(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(':', start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

PrnParseResult fail(PrnErrorKind kind, const std::string& message) {
    PrnParseResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

// Shared checks for the prn:1:<org> head of every PRN
bool check_head(const std::vector<std::string>& parts, PrnParseResult& result) {
    if (parts[0] != "prn") {
        result = fail(PrnErrorKind::InvalidPrefix, "invalid PRN prefix: " + parts[0]);
        return false;
    }
    if (parts[1] != "1") {
        result = fail(PrnErrorKind::UnsupportedVersion, "unsupported PRN version: " + parts[1]);
        return false;
    }
    if (!is_valid_uuid(parts[2])) {
        result = fail(PrnErrorKind::InvalidOrganizationId, "invalid organization ID: " + parts[2]);
        return false;
    }
    return true;
}

} // namespace

std::string Prn::to_string() const {
    return "prn:" + version + ":" + organization_id + ":" + resource_type + ":" + resource_id;
}

bool is_valid_uuid(const std::string& s) {
    auto is_hex = [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; };

    if (s.size() == 32) {
        for (char c : s) {
            if (!is_hex(c)) return false;
        }
        return true;
    }

    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!is_hex(s[i])) {
            return false;
        }
    }
    return true;
}

PrnParseResult parse_prn(const std::string& prn) {
    auto parts = split_colons(prn);
    if (parts.size() != 5) {
        return fail(PrnErrorKind::InvalidFormat,
                    "invalid PRN format: expected 5 colon-separated parts, got " +
                    std::to_string(parts.size()));
    }

    PrnParseResult result;
    if (!check_head(parts, result)) {
        return result;
    }
    if (parts[3].empty()) {
        return fail(PrnErrorKind::InvalidFormat, "invalid PRN format: empty resource type");
    }
    if (!is_valid_uuid(parts[4])) {
        return fail(PrnErrorKind::InvalidResourceId, "invalid resource ID: " + parts[4]);
    }

    result.prn.version = parts[1];
    result.prn.organization_id = parts[2];
    result.prn.resource_type = parts[3];
    result.prn.resource_id = parts[4];
    result.ok = true;
    return result;
}

PrnParseResult parse_organization_prn(const std::string& prn) {
    auto parts = split_colons(prn);
    if (parts.size() != 3) {
        return fail(PrnErrorKind::InvalidFormat,
                    "invalid organization PRN format: expected 3 colon-separated parts, got " +
                    std::to_string(parts.size()));
    }

    PrnParseResult result;
    if (!check_head(parts, result)) {
        return result;
    }

    result.prn.version = parts[1];
    result.prn.organization_id = parts[2];
    result.ok = true;
    return result;
}

Result<std::string> resource_id_from_prn(const std::string& prn) {
    auto parsed = parse_prn(prn);
    if (!parsed.ok) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_INPUT, parsed.error));
    }
    return Result<std::string>::ok(parsed.prn.resource_id);
}

// ============================================================================
// PrnBuilder
// ============================================================================

Result<PrnBuilder> PrnBuilder::from_prn(const std::string& prn) {
    auto parts = split_colons(prn);

    PrnParseResult parsed;
    if (parts.size() == 3) {
        parsed = parse_organization_prn(prn);
    } else if (parts.size() == 5) {
        parsed = parse_prn(prn);
    } else {
        return Result<PrnBuilder>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid PRN format: expected 3 or 5 colon-separated parts, got " +
            std::to_string(parts.size())));
    }

    if (!parsed.ok) {
        return Result<PrnBuilder>::err(Error(ErrorCode::INVALID_INPUT, parsed.error));
    }
    return Result<PrnBuilder>::ok(PrnBuilder(parsed.prn.organization_id));
}

Result<std::string> PrnBuilder::binary(const std::string& binary_id) const {
    return build("binary", binary_id);
}

Result<std::string> PrnBuilder::artifact(const std::string& artifact_id) const {
    return build("artifact", artifact_id);
}

Result<std::string> PrnBuilder::artifact_version(const std::string& version_id) const {
    return build("artifact_version", version_id);
}

Result<std::string> PrnBuilder::bundle(const std::string& bundle_id) const {
    return build("bundle", bundle_id);
}

Result<std::string> PrnBuilder::build(const std::string& resource_type,
                                      const std::string& resource_id) const {
    if (!is_valid_uuid(organization_id_)) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid organization ID: " + organization_id_));
    }
    if (!is_valid_uuid(resource_id)) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid resource ID: " + resource_id));
    }
    return Result<std::string>::ok("prn:1:" + organization_id_ + ":" +
                                   resource_type + ":" + resource_id);
}

} // namespace shipyard
