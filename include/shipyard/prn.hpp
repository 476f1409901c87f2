#pragma once

#include "shipyard/result.hpp"

#include <string>
#include <utility>

namespace shipyard {

// ============================================================================
// Resource Names
//
//   organization:  prn:1:<org-uuid>
//   resource:      prn:1:<org-uuid>:<resource-type>:<resource-uuid>
// ============================================================================

enum class PrnErrorKind {
    None,
    InvalidFormat,
    InvalidPrefix,
    UnsupportedVersion,
    InvalidOrganizationId,
    InvalidResourceId,
};

struct Prn {
    std::string version;
    std::string organization_id;
    std::string resource_type;
    std::string resource_id;

    std::string to_string() const;
};

struct PrnParseResult {
    bool ok = false;
    PrnErrorKind kind = PrnErrorKind::None;
    std::string error;
    Prn prn;
};

// Hyphenated (8-4-4-4-12) or 32 hex digit form
bool is_valid_uuid(const std::string& s);

// Parse a 5-part resource PRN
PrnParseResult parse_prn(const std::string& prn);

// Parse a 3-part organization PRN; prn.organization_id holds the result
PrnParseResult parse_organization_prn(const std::string& prn);

// Id of the resource a PRN names, e.g. the binary id of a binary PRN
Result<std::string> resource_id_from_prn(const std::string& prn);

/**
 * Builds PRNs scoped to one organization.
 *
 * Lets callers derive the PRN of a resource from a caller-chosen UUID
 * without a registry lookup.
 */
class PrnBuilder {
public:
    explicit PrnBuilder(std::string organization_id)
        : organization_id_(std::move(organization_id)) {}

    // Accepts both organization (3-part) and resource (5-part) PRNs
    static Result<PrnBuilder> from_prn(const std::string& prn);

    const std::string& organization_id() const { return organization_id_; }
    std::string organization_prn() const { return "prn:1:" + organization_id_; }

    Result<std::string> binary(const std::string& binary_id) const;
    Result<std::string> artifact(const std::string& artifact_id) const;
    Result<std::string> artifact_version(const std::string& version_id) const;
    Result<std::string> bundle(const std::string& bundle_id) const;

    Result<std::string> build(const std::string& resource_type,
                              const std::string& resource_id) const;

private:
    std::string organization_id_;
};

} // namespace shipyard
