#include "onboarding/manifest.hpp"
#include "onboarding/csv.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace onboarding {

std::string manifest_key(const std::string& client, const std::string& position) {
    return client + "-" + position + "-Permissions";
}

std::string manifest_path(const std::string& root,
                          const std::string& client,
                          const std::string& position) {
    return (fs::path(root) / (manifest_key(client, position) + ".csv")).string();
}

std::vector<ManifestRow> parse_manifest(const std::string& text) {
    const auto table = parse_csv_table(text);
    std::vector<ManifestRow> rows;
    rows.reserve(table.records.size());

    for (const auto& record : table.records) {
        ManifestRow row;
        row.line_number                 = record.line_number;
        row.request.resource_type       = table.get(record, columns::resource_type);
        row.request.resource_name       = table.get(record, columns::resource_name);
        row.request.role                = table.get(record, columns::role);
        row.request.resource_group_name = table.get(record, columns::resource_group_name);

        if (row.request.resource_type.empty())
            row.malformed_reason = std::string("missing ") + columns::resource_type;
        else if (row.request.resource_name.empty())
            row.malformed_reason = std::string("missing ") + columns::resource_name;
        else if (row.request.role.empty())
            row.malformed_reason = std::string("missing ") + columns::role;

        rows.push_back(std::move(row));
    }
    return rows;
}

Manifest load_manifest(const std::string& client,
                       const std::string& position,
                       const std::string& root) {
    Manifest manifest;
    manifest.path = manifest_path(root, client, position);

    std::error_code ec;
    if (!fs::is_regular_file(manifest.path, ec)) {
        manifest.detail = "Permissions file not found: " + manifest.path;
        return manifest;
    }

    auto text = read_text_file(manifest.path);
    if (!text) {
        manifest.detail = "Permissions file unreadable: " + manifest.path;
        return manifest;
    }

    manifest.status = ManifestStatus::Loaded;
    manifest.rows   = parse_manifest(*text);
    return manifest;
}

} // namespace onboarding
