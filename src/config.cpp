#include "onboarding/config.hpp"
#include "onboarding/scope_resolver.hpp"

#include <cstdlib>
#include <sstream>

namespace onboarding {

OrchestratorOptions OnboardingConfig::orchestrator_options() const {
    OrchestratorOptions options;
    options.manifest_root = manifest_root;
    options.identity_mode = per_row_identity ? IdentityMode::PerRow : IdentityMode::PerRun;
    return options;
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

ConfigResult parse_args(int argc, const char* const* argv, const EnvFn& env) {
    OnboardingConfig config;

    if (env) {
        if (auto v = env("ONBOARDING_MANIFEST_ROOT"))  config.manifest_root   = *v;
        if (auto v = env("ONBOARDING_DIRECTORY_FILE")) config.directory_file  = *v;
        if (auto v = env("ONBOARDING_LEDGER_FILE"))    config.ledger_file     = *v;
        if (auto v = env("ONBOARDING_TRANSCRIPT"))     config.transcript_path = *v;
    }

    struct ValueFlag {
        const char*  name;
        std::string* target;
    };
    const ValueFlag value_flags[] = {
        { "--user",          &config.job.user_principal_name },
        { "--position",      &config.job.position },
        { "--client",        &config.job.client },
        { "--subscription",  &config.job.subscription_id },
        { "--manifest-root", &config.manifest_root },
        { "--directory",     &config.directory_file },
        { "--ledger",        &config.ledger_file },
        { "--transcript",    &config.transcript_path },
        { "--results",       &config.results_path },
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") { config.show_help = true;        continue; }
        if (arg == "--json")                { config.json = true;             continue; }
        if (arg == "--per-row-identity")    { config.per_row_identity = true; continue; }
        if (arg == "--chdir")               { config.chdir_to_root = true;    continue; }

        bool matched = false;
        for (const auto& flag : value_flags) {
            if (arg != flag.name) continue;
            if (i + 1 >= argc)
                return { std::nullopt, "Missing value for " + arg };
            *flag.target = argv[++i];
            matched = true;
            break;
        }
        if (!matched)
            return { std::nullopt, "Unknown argument: " + arg };
    }

    return { config, "" };
}

std::string usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " --user <upn> --position <title> --client <name>"
       << " --subscription <guid> [options]\n\n"
       << "Grants the role assignments listed in <client>-<position>-Permissions.csv.\n\n"
       << "Options:\n"
       << "  --manifest-root <dir>   Directory holding permission manifests"
          " (env ONBOARDING_MANIFEST_ROOT, default .)\n"
       << "  --directory <file>      Identity directory CSV"
          " (env ONBOARDING_DIRECTORY_FILE, default directory.csv)\n"
       << "  --ledger <file>         Role assignment ledger CSV"
          " (env ONBOARDING_LEDGER_FILE, default role-assignments.csv)\n"
       << "  --transcript <file>     Append a transcript of the run"
          " (env ONBOARDING_TRANSCRIPT)\n"
       << "  --results <file>        Write per-row results as CSV\n"
       << "  --json                  Print the run report as JSON\n"
       << "  --per-row-identity      Look the user up once per row\n"
       << "  --chdir                 Run from inside the manifest root\n"
       << "  --help                  Show this message\n\n"
       << "Resource types:\n ";
    for (auto type : supported_resource_types())
        os << " " << to_string(type);
    os << "\n\n"
       << "Exit status: 0 all granted, 1 some rows failed, 2 invalid input,"
          " 3 manifest not found.\n";
    return os.str();
}

} // namespace onboarding
