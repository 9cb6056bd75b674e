#pragma once

#include "onboarding/types.hpp"

#include <cstdio>
#include <sstream>
#include <string>

namespace onboarding {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

} // namespace json_detail

inline std::string to_json(const GrantOutcome& o) {
    std::ostringstream os;
    os << "{ \"line\": "              << o.line_number
       << ", \"resourceType\": "      << json_detail::quoted(o.request.resource_type)
       << ", \"resourceName\": "      << json_detail::quoted(o.request.resource_name)
       << ", \"role\": "              << json_detail::quoted(o.request.role)
       << ", \"resourceGroupName\": " << json_detail::quoted(o.request.resource_group_name)
       << ", \"scope\": "             << json_detail::quoted(o.scope)
       << ", \"status\": "            << json_detail::quoted(to_string(o.status))
       << ", \"error\": "             << json_detail::quoted(to_string(o.error))
       << ", \"detail\": "            << json_detail::quoted(o.detail)
       << " }";
    return os.str();
}

inline std::string to_json(const RunReport& report) {
    std::ostringstream os;
    os << "{\n"
       << "  \"jobId\": "    << json_detail::quoted(report.job_id) << ",\n"
       << "  \"status\": "   << json_detail::quoted(to_string(report.status)) << ",\n"
       << "  \"detail\": "   << json_detail::quoted(report.detail) << ",\n"
       << "  \"manifest\": " << json_detail::quoted(report.manifest_path) << ",\n"
       << "  \"granted\": "  << report.granted_count() << ",\n"
       << "  \"failed\": "   << report.failed_count() << ",\n"
       << "  \"outcomes\": [";
    for (std::size_t i = 0; i < report.outcomes.size(); ++i) {
        os << "\n    " << to_json(report.outcomes[i]);
        if (i + 1 < report.outcomes.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

} // namespace onboarding
