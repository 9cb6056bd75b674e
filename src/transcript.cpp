#include "onboarding/transcript.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace onboarding {

namespace {

std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "?????";
    }
}

// ── Transcript ────────────────────────────────────────────────────────────────

Transcript::Transcript(std::ostream* echo) : echo_(echo) {}

Transcript::Transcript(const std::string& path, std::ostream* echo)
    : path_(path), echo_(echo) {
    if (!path_.empty()) file_ = std::fopen(path_.c_str(), "a");
}

Transcript::~Transcript() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Transcript::write(LogLevel level, const std::string& message) {
    const std::string line = "[" + utc_timestamp() + "] " + to_string(level) + " " + message + "\n";
    if (echo_) *echo_ << line;
    if (file_) {
        std::fputs(line.c_str(), file_);
        std::fflush(file_);
    }
    ++lines_;
}

// ── WorkingDirectoryGuard ─────────────────────────────────────────────────────

WorkingDirectoryGuard::WorkingDirectoryGuard(const std::string& dir) {
    std::error_code ec;
    previous_ = fs::current_path(ec).string();
    if (ec) {
        error_ = ec.message();
        return;
    }
    fs::current_path(dir, ec);
    if (ec) {
        error_ = dir + ": " + ec.message();
        return;
    }
    ok_ = true;
}

WorkingDirectoryGuard::~WorkingDirectoryGuard() {
    if (!ok_) return;
    std::error_code ec;
    fs::current_path(previous_, ec);
}

} // namespace onboarding
