#include "onboarding/csv.hpp"
#include "onboarding/strings.hpp"

#include <fstream>
#include <sstream>

namespace onboarding {

// ── CsvRecord / CsvTable ──────────────────────────────────────────────────────

const std::string& CsvRecord::field(std::size_t i) const {
    static const std::string empty;
    return i < fields.size() ? fields[i] : empty;
}

std::optional<std::size_t> CsvTable::column(const std::string& name) const {
    for (std::size_t i = 0; i < header.size(); ++i)
        if (iequals(header[i], name)) return i;
    return std::nullopt;
}

std::string CsvTable::get(const CsvRecord& record, const std::string& name) const {
    auto idx = column(name);
    return idx ? record.field(*idx) : std::string();
}

// ── Parsing ───────────────────────────────────────────────────────────────────

namespace {

class CsvParser {
public:
    explicit CsvParser(const std::string& text) : text_(text) {}

    std::vector<CsvRecord> run() {
        std::size_t i = 0;
        if (text_.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

        for (; i < text_.size(); ++i) {
            const char c = text_[i];

            if (in_quotes_) {
                if (c == '"') {
                    if (i + 1 < text_.size() && text_[i + 1] == '"') {
                        field_ += '"';
                        ++i;
                    } else {
                        in_quotes_ = false;
                    }
                } else {
                    if (c == '\n') ++line_;
                    field_ += c;
                }
                continue;
            }

            switch (c) {
                case '"':
                    if (!field_quoted_ && trim(field_).empty()) {
                        field_.clear();
                        in_quotes_    = true;
                        field_quoted_ = true;
                        record_quoted_ = true;
                    } else {
                        field_ += c;
                    }
                    break;
                case ',':
                    end_field();
                    break;
                case '\r':
                    if (i + 1 < text_.size() && text_[i + 1] == '\n') break;
                    end_record();
                    break;
                case '\n':
                    end_record();
                    break;
                default:
                    // Text after a closing quote is kept unless it is padding.
                    if (!(field_quoted_ && std::isspace(static_cast<unsigned char>(c))))
                        field_ += c;
                    break;
            }
        }

        if (!field_.empty() || !fields_.empty() || field_quoted_) end_record();
        return std::move(records_);
    }

private:
    void end_field() {
        fields_.push_back(field_quoted_ ? field_ : trim(field_));
        field_.clear();
        field_quoted_ = false;
    }

    void end_record() {
        end_field();
        const bool blank = fields_.size() == 1 && fields_[0].empty() && !record_quoted_;
        if (!blank) records_.push_back({ record_start_, std::move(fields_) });
        fields_.clear();
        record_quoted_ = false;
        ++line_;
        record_start_ = line_;
    }

    const std::string&       text_;
    std::vector<CsvRecord>   records_;
    std::vector<std::string> fields_;
    std::string              field_;
    bool                     in_quotes_     = false;
    bool                     field_quoted_  = false;
    bool                     record_quoted_ = false;
    std::size_t              line_          = 1;
    std::size_t              record_start_  = 1;
};

} // namespace

std::vector<CsvRecord> parse_csv(const std::string& text) {
    return CsvParser(text).run();
}

CsvTable parse_csv_table(const std::string& text) {
    CsvTable table;
    auto records = parse_csv(text);
    if (records.empty()) return table;

    table.header = std::move(records.front().fields);
    records.erase(records.begin());
    table.records = std::move(records);
    return table;
}

// ── Writing ───────────────────────────────────────────────────────────────────

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string csv_line(const std::vector<std::string>& fields) {
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ',';
        line += csv_escape(fields[i]);
    }
    return line;
}

std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace onboarding
