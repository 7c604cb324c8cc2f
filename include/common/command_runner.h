#ifndef PAW_COMMAND_RUNNER_H
#define PAW_COMMAND_RUNNER_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <sys/types.h>

namespace paw {

struct CommandResult {
    bool launched = false;   // false when the binary could not be executed at all
    int exit_code = -1;
    std::string output;
    std::string error;

    bool succeeded() const { return launched && exit_code == 0; }
};

struct SpawnOptions {
    // Append child stdout/stderr to this file; ignored when capture_output is set
    std::string output_path;
    // Keep stdout+stderr on a pipe readable through ChildProcess::readOutput()
    bool capture_output = false;
};

// A supervised child process. Destroying the handle terminates and reaps it.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual pid_t pid() const = 0;
    // Non-blocking; reaps the child once it has exited
    virtual bool isRunning() = 0;
    // Non-blocking drain of whatever the child wrote since the last call
    virtual std::string readOutput() = 0;
    // SIGTERM, wait up to grace_ms, then SIGKILL. Returns false if the child
    // could not be reaped.
    virtual bool terminate(int grace_ms) = 0;
    // -1 while running, exit status, or 128 + signal number
    virtual int exitCode() const = 0;
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual bool isAvailable(const std::string& program) = 0;
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
    // Returns nullptr when the process could not be started
    virtual std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                                const SpawnOptions& options) = 0;
};

class SystemChildProcess : public ChildProcess {
public:
    SystemChildProcess(pid_t pid, int output_fd);
    ~SystemChildProcess() override;

    pid_t pid() const override { return pid_; }
    bool isRunning() override;
    std::string readOutput() override;
    bool terminate(int grace_ms) override;
    int exitCode() const override;

private:
    bool reapLocked(bool block);
    void recordStatus(int status);

    pid_t pid_;
    int output_fd_;
    bool exited_;
    int exit_code_;
    mutable std::mutex mutex_;
};

// fork/execvp based runner; argv is never passed through a shell
class SystemCommandRunner : public CommandRunner {
public:
    SystemCommandRunner() = default;

    bool isAvailable(const std::string& program) override;
    CommandResult run(const std::vector<std::string>& argv) override;
    std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                        const SpawnOptions& options) override;

private:
    // Forks and execs argv with the given stdin/stdout/stderr descriptors.
    // Returns the child pid, or -1 with errno_out set when fork or exec failed.
    pid_t launch(const std::vector<std::string>& argv, int out_fd, int err_fd,
                 bool new_process_group, int& errno_out);
};

} // namespace paw

#endif // PAW_COMMAND_RUNNER_H
