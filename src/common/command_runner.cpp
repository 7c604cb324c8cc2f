#include "common/command_runner.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <chrono>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

namespace paw {

namespace {

const char* kDefaultPath = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

bool isExecutableFile(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Reads whatever is available on fd into out. Returns false on EOF or error.
bool drainFd(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// SystemChildProcess
// ---------------------------------------------------------------------------

SystemChildProcess::SystemChildProcess(pid_t pid, int output_fd)
    : pid_(pid), output_fd_(output_fd), exited_(false), exit_code_(-1) {
}

SystemChildProcess::~SystemChildProcess() {
    if (!terminate(500)) {
        Logger::getInstance().warning("Could not reap child process " + std::to_string(pid_));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    closeFd(output_fd_);
}

void SystemChildProcess::recordStatus(int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = 255;
    }
}

bool SystemChildProcess::reapLocked(bool block) {
    if (exited_) return true;

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (result == pid_) {
            recordStatus(status);
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECHILD) {
            // Somebody else reaped it; the status is lost
            exited_ = true;
            exit_code_ = 255;
            return true;
        }
        Logger::getInstance().error("waitpid(" + std::to_string(pid_) + ") failed: " +
                                    std::string(strerror(errno)));
        return false;
    }
}

bool SystemChildProcess::isRunning() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !reapLocked(false);
}

std::string SystemChildProcess::readOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    if (output_fd_ < 0) return out;

    if (!drainFd(output_fd_, out)) {
        closeFd(output_fd_);
    }
    return out;
}

bool SystemChildProcess::terminate(int grace_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reapLocked(false)) return true;

    // The child leads its own process group, so helpers it forked go too
    if (kill(-pid_, SIGTERM) != 0) {
        kill(pid_, SIGTERM);
    }

    const int step_ms = 50;
    for (int waited = 0; waited < grace_ms; waited += step_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(step_ms));
        if (reapLocked(false)) return true;
    }

    Logger::getInstance().debug("Process " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
    if (kill(-pid_, SIGKILL) != 0) {
        kill(pid_, SIGKILL);
    }
    return reapLocked(true);
}

int SystemChildProcess::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_ ? exit_code_ : -1;
}

// ---------------------------------------------------------------------------
// SystemCommandRunner
// ---------------------------------------------------------------------------

bool SystemCommandRunner::isAvailable(const std::string& program) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) {
        return isExecutableFile(program);
    }

    const char* env_path = std::getenv("PATH");
    std::string path = (env_path && *env_path) ? env_path : kDefaultPath;

    std::istringstream iss(path);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (isExecutableFile(dir + "/" + program)) {
            return true;
        }
    }
    return false;
}

pid_t SystemCommandRunner::launch(const std::vector<std::string>& argv, int out_fd, int err_fd,
                                  bool new_process_group, int& errno_out) {
    errno_out = 0;
    if (argv.empty()) {
        errno_out = EINVAL;
        return -1;
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> child_argv;
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        errno_out = errno;
        return -1;
    }

    int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        errno_out = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        if (null_fd >= 0) close(null_fd);
        return -1;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec
        if (new_process_group) {
            setpgid(0, 0);
        }

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
        }
        dup2(out_fd >= 0 ? out_fd : null_fd, STDOUT_FILENO);
        dup2(err_fd >= 0 ? err_fd : null_fd, STDERR_FILENO);

        execvp(child_argv[0], child_argv.data());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    if (new_process_group) {
        setpgid(pid, pid);
    }

    close(exec_pipe[1]);
    if (null_fd >= 0) close(null_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec failed: reap the child and report why
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        errno_out = child_errno;
        return -1;
    }

    return pid;
}

CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + strerror(errno);
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    Logger::getInstance().debug("exec: " + joinArgs(argv));

    int launch_errno = 0;
    pid_t pid = launch(argv, out_pipe[1], err_pipe[1], true, launch_errno);
    close(out_pipe[1]);
    close(err_pipe[1]);

    if (pid < 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        std::string program = argv.empty() ? "" : argv[0];
        if (launch_errno == ENOENT) {
            result.error = "Command '" + program + "' not found. Make sure it's installed.";
        } else {
            result.error = "Error executing '" + program + "': " + strerror(launch_errno);
        }
        return result;
    }

    result.launched = true;

    struct pollfd fds[2];
    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;
    int open_count = 2;

    while (open_count > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                char buffer[4096];
                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    (i == 0 ? result.output : result.error).append(buffer, static_cast<size_t>(n));
                } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                    close(fds[i].fd);
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }

    for (int i = 0; i < 2; ++i) {
        if (fds[i].fd >= 0) close(fds[i].fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = 255;
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    Logger::getInstance().debug(argv[0] + " exited with code " + std::to_string(result.exit_code));
    return result;
}

std::unique_ptr<ChildProcess> SystemCommandRunner::spawn(const std::vector<std::string>& argv,
                                                         const SpawnOptions& options) {
    int read_fd = -1;
    int write_fd = -1;

    if (options.capture_output) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) {
            Logger::getInstance().error(std::string("pipe failed: ") + strerror(errno));
            return nullptr;
        }
        read_fd = fds[0];
        write_fd = fds[1];
    } else if (!options.output_path.empty()) {
        write_fd = open(options.output_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (write_fd < 0) {
            Logger::getInstance().warning("Cannot open " + options.output_path + ": " + strerror(errno) +
                                          ", discarding child output");
        }
    }

    Logger::getInstance().debug("spawn: " + joinArgs(argv));

    int launch_errno = 0;
    pid_t pid = launch(argv, write_fd, write_fd, true, launch_errno);
    closeFd(write_fd);

    if (pid < 0) {
        closeFd(read_fd);
        Logger::getInstance().error("Failed to start " + (argv.empty() ? std::string() : argv[0]) +
                                    ": " + strerror(launch_errno));
        return nullptr;
    }

    if (read_fd >= 0) {
        int flags = fcntl(read_fd, F_GETFL, 0);
        fcntl(read_fd, F_SETFL, flags | O_NONBLOCK);
    }

    Logger::getInstance().debug("Started " + argv[0] + " with PID " + std::to_string(pid));
    return std::make_unique<SystemChildProcess>(pid, read_fd);
}

} // namespace paw
