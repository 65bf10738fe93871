#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace gamesmith::sandbox {
namespace bp = boost::process;
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);
constexpr const char* kSourceName = "game.py";
constexpr const char* kStdoutName = "stdout.log";
constexpr const char* kStderrName = "stderr.log";

std::atomic<unsigned long> g_scratch_sequence{0};

// Owns a freshly created directory and removes it with everything inside on scope exit.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& root) {
        const std::filesystem::path base =
            root.empty() ? std::filesystem::temp_directory_path() : std::filesystem::path(root);
        std::filesystem::create_directories(base);
        const auto stamp = std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        while (true) {
            auto candidate = base / ("gamesmith_" + std::to_string(::getpid()) + "_" + stamp + "_" +
                                     std::to_string(g_scratch_sequence.fetch_add(1)));
            if (std::filesystem::create_directory(candidate)) {
                path_ = std::move(candidate);
                break;
            }
        }
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "sandbox",
                       "failed to remove " + path_.string() + ": " + ec.message());
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

void WriteSource(const std::filesystem::path& path, const std::string& source) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("cannot create " + path.string());
    }
    output.write(source.data(), static_cast<std::streamsize>(source.size()));
    if (!output) {
        throw std::runtime_error("short write to " + path.string());
    }
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string ResolveInterpreter(const std::string& interpreter) {
    if (interpreter.find('/') != std::string::npos) {
        return interpreter;
    }
    const auto found = bp::search_path(interpreter);
    if (found.empty()) {
        throw std::runtime_error("interpreter '" + interpreter + "' not found on PATH");
    }
    return found.string();
}

// Boost.Process 1.7x compares a lookup key against every stored entry over the
// key's full length, so keys are inserted longest first: no stored entry is
// then shorter than a later lookup.
bp::environment BuildEnvironment(const ExecOptions& options) {
    std::map<std::string, std::string> variables{
        {"PYTHONPATH", std::string()},
        {"PYTHONDONTWRITEBYTECODE", "1"},
    };
    for (const auto& [key, value] : options.extra_env) {
        variables[key] = value;
    }
    std::vector<std::pair<std::string, std::string>> ordered(variables.begin(), variables.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first.size() > rhs.first.size();
    });

    bp::environment env;
    for (const auto& [key, value] : ordered) {
        env[key] = value;
    }
    return env;
}

pid_t WaitRetrying(pid_t pid, int* status, int flags) {
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, status, flags);
    } while (waited < 0 && errno == EINTR);
    return waited;
}

ExecutionRecord FailedRecord(ExecutionStatus status, std::string message) {
    ExecutionRecord record{};
    record.status = status;
    record.success = false;
    record.exit_code = kAbnormalExitCode;
    record.error = std::move(message);
    return record;
}

ExecutionRecord RunInScratch(const ScratchDirectory& scratch,
                             const std::string& source,
                             std::chrono::seconds timeout,
                             const ExecOptions& options) {
    const auto source_path = scratch.Path() / kSourceName;
    const auto stdout_path = scratch.Path() / kStdoutName;
    const auto stderr_path = scratch.Path() / kStderrName;
    WriteSource(source_path, source);

    const auto interpreter = ResolveInterpreter(options.interpreter);
    auto env = BuildEnvironment(options);

    // Declared before the child so its destructor runs last and kills any
    // process the candidate left behind in the group.
    bp::group group;
    bp::child child_process(
        bp::exe = interpreter,
        bp::args = std::vector<std::string>{source_path.string()},
        env,
        bp::start_dir = scratch.Path().string(),
        bp::std_in < bp::null,
        bp::std_out > stdout_path.string(),
        bp::std_err > stderr_path.string(),
        group);

    const pid_t pid = child_process.id();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    bool finished = false;
    while (true) {
        const auto waited = WaitRetrying(pid, &status, WNOHANG);
        if (waited == pid) {
            finished = true;
            break;
        }
        if (waited < 0) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (!finished) {
        std::error_code ec;
        group.terminate(ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "sandbox",
                       "group kill failed, killing leader: " + ec.message());
            ::kill(pid, SIGKILL);
        }
        if (WaitRetrying(pid, &status, 0) < 0 && errno != ECHILD) {
            utils::Log(utils::LogLevel::kWarn, "sandbox",
                       std::string("reaping timed out child failed: ") + std::strerror(errno));
        }
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "killed candidate after " + std::to_string(timeout.count()) + "s");
        return FailedRecord(
            ExecutionStatus::kTimedOut,
            "Execution timeout after " + std::to_string(timeout.count()) + " seconds");
    }

    ExecutionRecord record{};
    record.status = ExecutionStatus::kCompleted;
    record.output = ReadCapture(stdout_path);
    record.error = ReadCapture(stderr_path);
    if (WIFSIGNALED(status)) {
        const int signal_number = WTERMSIG(status);
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "candidate killed by signal " + std::to_string(signal_number));
        if (!record.error.empty() && record.error.back() != '\n') {
            record.error += '\n';
        }
        record.error += "Execution error: killed by signal " + std::to_string(signal_number);
        record.exit_code = kAbnormalExitCode;
    } else {
        record.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : kAbnormalExitCode;
    }
    record.success = record.exit_code == 0;
    return record;
}

}  // namespace

SandboxExecutor::SandboxExecutor(ExecOptions options)
    : options_(std::move(options)) {}

ExecutionRecord SandboxExecutor::Run(const std::string& source, std::chrono::seconds timeout) const {
    const auto started = std::chrono::steady_clock::now();
    ExecutionRecord record{};
    try {
        ScratchDirectory scratch(options_.scratch_root);
        record = RunInScratch(scratch, source, timeout, options_);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", std::string("spawn failed: ") + ex.what());
        record = FailedRecord(ExecutionStatus::kSpawnFailed,
                              std::string("Execution error: ") + ex.what());
    }
    record.duration = std::chrono::steady_clock::now() - started;

    utils::LogMessage entry{};
    entry.level = utils::LogLevel::kDebug;
    entry.tag = "sandbox";
    entry.message = "candidate finished";
    entry.fields["exit_code"] = std::to_string(record.exit_code);
    entry.fields["seconds"] = std::to_string(record.duration.count());
    utils::Log(entry);
    return record;
}

}  // namespace gamesmith::sandbox
