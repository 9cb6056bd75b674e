#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace onboarding {

struct CsvRecord {
    std::size_t              line_number = 0;  // 1-based line the record starts on
    std::vector<std::string> fields;

    /// Field i, or "" when the record is shorter than that.
    const std::string& field(std::size_t i) const;
};

/**
 * CsvTable
 *
 * A header row plus data records. Header lookup is case-insensitive;
 * missing columns and short records both read as empty strings.
 */
struct CsvTable {
    std::vector<std::string> header;
    std::vector<CsvRecord>   records;

    std::optional<std::size_t> column(const std::string& name) const;

    /// Value of the named column in `record`, "" if absent.
    std::string get(const CsvRecord& record, const std::string& name) const;
};

/// Comma-separated, RFC 4180 quoting. Accepts CRLF, skips blank lines,
/// drops a leading UTF-8 BOM and trims whitespace around unquoted fields.
std::vector<CsvRecord> parse_csv(const std::string& text);

/// First record becomes the header. Empty text gives an empty table.
CsvTable parse_csv_table(const std::string& text);

/// Quotes the field only when it contains a delimiter, quote or line break.
std::string csv_escape(const std::string& field);

std::string csv_line(const std::vector<std::string>& fields);

/// Whole file contents, or nullopt when it cannot be opened.
std::optional<std::string> read_text_file(const std::string& path);

} // namespace onboarding
