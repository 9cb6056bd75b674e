#include "onboarding/report.hpp"
#include "onboarding/csv.hpp"

#include <fstream>

namespace onboarding {

const std::vector<std::string>& results_header() {
    static const std::vector<std::string> header = {
        "JobId", "ResourceType", "ResourceName", "Role",
        "ResourceGroupName", "Scope", "Status", "Error", "Detail"
    };
    return header;
}

std::vector<std::string> results_record(const std::string& job_id, const GrantOutcome& outcome) {
    return {
        job_id,
        outcome.request.resource_type,
        outcome.request.resource_name,
        outcome.request.role,
        outcome.request.resource_group_name,
        outcome.scope,
        to_string(outcome.status),
        outcome.error == ErrorCode::None ? std::string() : std::string(to_string(outcome.error)),
        outcome.detail
    };
}

bool write_results_csv(const std::string& path, const RunReport& report) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    out << csv_line(results_header()) << "\n";
    for (const auto& outcome : report.outcomes)
        out << csv_line(results_record(report.job_id, outcome)) << "\n";
    out.flush();
    return static_cast<bool>(out);
}

// ── Console ───────────────────────────────────────────────────────────────────

void print_report(std::ostream& os, const RunReport& report) {
    os << "\n" << std::string(55, '-') << "\n"
       << "  Onboarding " << report.job_id << "\n"
       << std::string(55, '-') << "\n";

    if (report.status != RunStatus::Completed) {
        os << "  Status   : " << report.status << "\n"
           << "  Reason   : " << report.detail << "\n";
        return;
    }

    os << "  Manifest : " << report.manifest_path << "\n\n";
    for (const auto& o : report.outcomes) {
        os << "  [" << (o.granted() ? "GRANTED" : "FAILED ") << "] "
           << o.request.resource_type << "/" << o.request.resource_name
           << " <- " << o.request.role << "\n";
        if (!o.scope.empty())
            os << "             scope: " << o.scope << "\n";
        if (!o.granted())
            os << "             " << o.error << ": " << o.detail << "\n";
    }

    os << "\n  Granted: " << report.granted_count()
       << "  Failed: " << report.failed_count() << "\n";
}

} // namespace onboarding
