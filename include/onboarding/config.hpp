#pragma once

#include "onboarding/orchestrator.hpp"
#include "onboarding/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace onboarding {

struct OnboardingConfig {
    OnboardingJob job;
    std::string   manifest_root   = ".";
    std::string   directory_file  = "directory.csv";
    std::string   ledger_file     = "role-assignments.csv";
    std::string   transcript_path;            // empty: console only
    std::string   results_path;               // empty: no results file
    bool          json            = false;
    bool          per_row_identity = false;
    bool          chdir_to_root   = false;
    bool          show_help       = false;

    OrchestratorOptions orchestrator_options() const;
};

struct ConfigResult {
    std::optional<OnboardingConfig> config;
    std::string                     error;   // usage error when config is empty
};

/// Environment lookup; returns nullopt for unset variables.
using EnvFn = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the process environment.
std::optional<std::string> process_env(const std::string& name);

/**
 * Parses the command line. Defaults come first, then environment
 * fallbacks (ONBOARDING_MANIFEST_ROOT, ONBOARDING_DIRECTORY_FILE,
 * ONBOARDING_LEDGER_FILE, ONBOARDING_TRANSCRIPT), then flags.
 * Required job fields are not checked here; validate_job does that.
 */
ConfigResult parse_args(int argc, const char* const* argv, const EnvFn& env = process_env);

std::string usage(const std::string& program);

} // namespace onboarding
