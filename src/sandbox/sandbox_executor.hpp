#pragma once

#include <chrono>
#include <map>
#include <string>

namespace gamesmith::sandbox {

// Exit code reported when the child never produced a real exit status.
constexpr int kAbnormalExitCode = -1;

enum class ExecutionStatus {
    kCompleted,
    kTimedOut,
    kSpawnFailed
};

struct ExecutionRecord {
    ExecutionStatus status = ExecutionStatus::kSpawnFailed;
    bool success = false;
    std::string output;
    std::string error;
    int exit_code = kAbnormalExitCode;
    std::chrono::duration<double> duration{0.0};
};

struct ExecOptions {
    // Bare names are looked up on the host PATH; paths containing '/' are used as is.
    std::string interpreter = "python3";
    // Parent of the per-run scratch directories; empty means the system temp dir.
    std::string scratch_root;
    // Added to the child's otherwise minimal environment.
    std::map<std::string, std::string> extra_env;
};

class SandboxExecutor {
public:
    explicit SandboxExecutor(ExecOptions options = {});

    // Runs `source` as a standalone script in a child process. Never throws:
    // timeouts and spawn failures come back as records with exit_code -1.
    ExecutionRecord Run(const std::string& source, std::chrono::seconds timeout) const;

    const ExecOptions& Options() const { return options_; }

private:
    ExecOptions options_;
};

}  // namespace gamesmith::sandbox
