#pragma once

#include "onboarding/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace onboarding {

// Column names of the permission manifest.
namespace columns {
inline constexpr const char* resource_type       = "ResourceType";
inline constexpr const char* resource_name       = "ResourceName";
inline constexpr const char* role                = "Role";
inline constexpr const char* resource_group_name = "ResourceGroupName";
} // namespace columns

struct ManifestRow {
    std::size_t  line_number = 0;
    GrantRequest request;
    std::string  malformed_reason;   // non-empty when a required field is missing

    bool malformed() const { return !malformed_reason.empty(); }
};

enum class ManifestStatus { Loaded, NotFound };

struct Manifest {
    ManifestStatus           status = ManifestStatus::NotFound;
    std::string              path;
    std::string              detail;   // why NotFound
    std::vector<ManifestRow> rows;     // file order, blank lines dropped

    bool loaded() const { return status == ManifestStatus::Loaded; }
};

/// "{client}-{position}-Permissions"
std::string manifest_key(const std::string& client, const std::string& position);

/// <root>/<key>.csv
std::string manifest_path(const std::string& root,
                          const std::string& client,
                          const std::string& position);

/// Parses manifest text. Row order is preserved; rows are never merged,
/// reordered or dropped except for blank lines.
std::vector<ManifestRow> parse_manifest(const std::string& text);

/// Locates and parses the manifest for (client, position) under root.
Manifest load_manifest(const std::string& client,
                       const std::string& position,
                       const std::string& root);

} // namespace onboarding
