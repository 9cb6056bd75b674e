#include "onboarding/config.hpp"
#include "onboarding/json.hpp"
#include "onboarding/local_backends.hpp"
#include "onboarding/orchestrator.hpp"
#include "onboarding/report.hpp"
#include "onboarding/transcript.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

using namespace onboarding;

namespace fs = std::filesystem;

namespace {

enum ExitCode {
    ExitAllGranted      = 0,
    ExitRowsFailed      = 1,
    ExitInvalidInput    = 2,
    ExitManifestMissing = 3
};

// Paths given on the command line stay relative to where the tool was started.
std::string absolute_or_empty(const std::string& path) {
    if (path.empty()) return path;
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    return ec ? path : abs.string();
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "onboard";

    auto parsed = parse_args(argc, argv);
    if (!parsed.config) {
        std::cerr << parsed.error << "\n\n" << usage(program);
        return ExitInvalidInput;
    }
    auto config = *parsed.config;
    if (config.show_help) {
        std::cout << usage(program);
        return ExitAllGranted;
    }

    config.manifest_root   = absolute_or_empty(config.manifest_root);
    config.directory_file  = absolute_or_empty(config.directory_file);
    config.ledger_file     = absolute_or_empty(config.ledger_file);
    config.transcript_path = absolute_or_empty(config.transcript_path);
    config.results_path    = absolute_or_empty(config.results_path);

    // Console echo goes to stderr when stdout carries JSON.
    std::ostream& log_stream = config.json ? std::cerr : std::cout;
    Transcript transcript(config.transcript_path, &log_stream);
    if (!config.transcript_path.empty() && !transcript.file_open())
        transcript.warn("Cannot open transcript file " + config.transcript_path);

    std::unique_ptr<WorkingDirectoryGuard> cwd;
    if (config.chdir_to_root) {
        cwd = std::make_unique<WorkingDirectoryGuard>(config.manifest_root);
        if (!cwd->ok()) {
            transcript.error("Cannot enter manifest root: " + cwd->error());
            return ExitManifestMissing;
        }
    }

    DirectoryFile directory(config.directory_file);
    if (!directory.found())
        transcript.warn("Identity directory not found: " + config.directory_file);

    AssignmentLedger ledger(config.ledger_file);

    OnboardingOrchestrator orchestrator({ directory.resolver(), ledger.assigner() },
                                        config.orchestrator_options(), &transcript);
    const auto report = orchestrator.run(config.job);

    if (config.json)
        std::cout << to_json(report) << "\n";
    else
        print_report(std::cout, report);

    if (!config.results_path.empty() && report.status == RunStatus::Completed) {
        if (write_results_csv(config.results_path, report))
            transcript.info("Results written to " + config.results_path);
        else
            transcript.error("Cannot write results file " + config.results_path);
    }

    switch (report.status) {
        case RunStatus::InvalidJob:       return ExitInvalidInput;
        case RunStatus::ManifestNotFound: return ExitManifestMissing;
        case RunStatus::Completed:        break;
    }
    return report.failed_count() == 0 ? ExitAllGranted : ExitRowsFailed;
}
