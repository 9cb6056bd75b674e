#pragma once

#include <cstdio>
#include <ostream>
#include <string>

namespace onboarding {

enum class LogLevel { Info, Warn, Error };

const char* to_string(LogLevel level);

/**
 * Transcript
 *
 * Log sink for one run. Every line goes to the echo stream (if any) and,
 * when a path is given, is appended to the transcript file. The file is
 * opened on construction and closed on destruction, so it is released on
 * every exit path of the owning scope.
 *
 * Line format: [2026-01-31T09:15:00Z] INFO  message
 */
class Transcript {
public:
    /// Echo only; no file.
    explicit Transcript(std::ostream* echo = nullptr);

    Transcript(const std::string& path, std::ostream* echo);
    ~Transcript();

    Transcript(const Transcript&)            = delete;
    Transcript& operator=(const Transcript&) = delete;

    void info(const std::string& message)  { write(LogLevel::Info, message); }
    void warn(const std::string& message)  { write(LogLevel::Warn, message); }
    void error(const std::string& message) { write(LogLevel::Error, message); }

    void write(LogLevel level, const std::string& message);

    /// False when a path was given but the file could not be opened.
    bool file_open() const { return file_ != nullptr; }
    const std::string& path() const { return path_; }
    std::size_t line_count() const { return lines_; }

private:
    std::string   path_;
    std::FILE*    file_  = nullptr;
    std::ostream* echo_  = nullptr;
    std::size_t   lines_ = 0;
};

/**
 * WorkingDirectoryGuard
 *
 * Changes into `dir` and restores the previous working directory when the
 * guard goes out of scope. ok() is false if the change failed; in that
 * case nothing is restored.
 */
class WorkingDirectoryGuard {
public:
    explicit WorkingDirectoryGuard(const std::string& dir);
    ~WorkingDirectoryGuard();

    WorkingDirectoryGuard(const WorkingDirectoryGuard&)            = delete;
    WorkingDirectoryGuard& operator=(const WorkingDirectoryGuard&) = delete;

    bool ok() const { return ok_; }
    const std::string& error() const { return error_; }

private:
    std::string previous_;
    std::string error_;
    bool        ok_ = false;
};

} // namespace onboarding
