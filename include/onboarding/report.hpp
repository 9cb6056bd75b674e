#pragma once

#include "onboarding/types.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace onboarding {

/// Column order of the results file.
const std::vector<std::string>& results_header();

/// One results-file record per outcome, tagged with the run's job id.
std::vector<std::string> results_record(const std::string& job_id, const GrantOutcome& outcome);

/// Writes header + one line per outcome. Returns false if the file cannot be written.
bool write_results_csv(const std::string& path, const RunReport& report);

/// Human-readable run summary: one line per row, then the Granted/Failed counts.
void print_report(std::ostream& os, const RunReport& report);

} // namespace onboarding
