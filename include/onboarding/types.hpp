#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace onboarding {

// One manifest row. resource_type is the raw tag as written in the manifest;
// it is only interpreted by the scope resolver.
struct GrantRequest {
    std::string resource_type;        // "StorageAccount", "KeyVault", ...
    std::string resource_name;
    std::string role;                 // role definition name, e.g. "Reader"
    std::string resource_group_name;  // empty for ResourceGroup rows
};

struct OnboardingJob {
    std::string user_principal_name;
    std::string position;             // job title, e.g. "Developer"
    std::string client;
    std::string subscription_id;
};

enum class GrantStatus { Granted, Failed };

enum class ErrorCode {
    None,
    MalformedRow,
    UnknownPrincipal,
    UnknownResourceType,
    RoleAssignmentFailed
};

struct GrantOutcome {
    GrantRequest request;
    std::size_t  line_number = 0;     // manifest line, 0 when not from a file
    std::string  scope;               // empty when never resolved
    GrantStatus  status = GrantStatus::Failed;
    ErrorCode    error  = ErrorCode::None;
    std::string  detail;

    bool granted() const { return status == GrantStatus::Granted; }
};

enum class RunStatus { Completed, InvalidJob, ManifestNotFound };

struct RunReport {
    RunStatus                 status = RunStatus::Completed;
    std::string               detail;   // set for InvalidJob / ManifestNotFound
    std::string               job_id;
    std::string               manifest_path;
    std::vector<GrantOutcome> outcomes;

    std::size_t granted_count() const {
        std::size_t count = 0;
        for (const auto& o : outcomes)
            if (o.granted()) ++count;
        return count;
    }
    std::size_t failed_count() const { return outcomes.size() - granted_count(); }
    bool all_granted() const { return status == RunStatus::Completed && failed_count() == 0; }
};

inline const char* to_string(GrantStatus s) {
    return s == GrantStatus::Granted ? "Granted" : "Failed";
}

inline const char* to_string(ErrorCode e) {
    switch (e) {
        case ErrorCode::None:                 return "None";
        case ErrorCode::MalformedRow:         return "MalformedRow";
        case ErrorCode::UnknownPrincipal:     return "UnknownPrincipal";
        case ErrorCode::UnknownResourceType:  return "UnknownResourceType";
        case ErrorCode::RoleAssignmentFailed: return "RoleAssignmentFailed";
        default:                              return "Unknown";
    }
}

inline const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Completed:        return "Completed";
        case RunStatus::InvalidJob:       return "InvalidJob";
        case RunStatus::ManifestNotFound: return "ManifestNotFound";
        default:                          return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, GrantStatus s) { return os << to_string(s); }
inline std::ostream& operator<<(std::ostream& os, ErrorCode e)   { return os << to_string(e); }
inline std::ostream& operator<<(std::ostream& os, RunStatus s)   { return os << to_string(s); }

/// "{client}-{position}-{userPrincipalName}", used to tag every result record.
inline std::string job_id(const OnboardingJob& job) {
    return job.client + "-" + job.position + "-" + job.user_principal_name;
}

} // namespace onboarding
