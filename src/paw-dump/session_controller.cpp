#include "paw-dump/session_controller.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

namespace paw {

namespace {

const char* kBroadcastMac = "FF:FF:FF:FF:FF:FF";

std::string readFileTail(const std::string& path, size_t lines) {
    std::ifstream file(path);
    if (!file.is_open()) return "";
    std::stringstream buffer;
    buffer << file.rdbuf();
    return tailLines(buffer.str(), lines);
}

bool ensureDirectory(const std::string& dir) {
    struct stat st;
    if (stat(dir.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
        Logger::getInstance().error("Cannot create " + dir + ": " + strerror(errno));
        return false;
    }
    return true;
}

// Splits complete lines off the front of pending and hands them to the callback
void emitLines(std::string& pending, const OutputCallback& on_output, bool flush) {
    size_t start = 0;
    while (true) {
        size_t end = pending.find_first_of("\r\n", start);
        if (end == std::string::npos) break;
        std::string line = pending.substr(start, end - start);
        if (!trim(line).empty() && on_output) {
            on_output(line);
        }
        start = end + 1;
    }
    pending.erase(0, start);

    if (flush && !trim(pending).empty() && on_output) {
        on_output(pending);
        pending.clear();
    }
}

} // namespace

std::string sessionKindToString(SessionKind kind) {
    switch (kind) {
        case SessionKind::CAPTURE: return "capture";
        case SessionKind::ATTACK: return "attack";
        case SessionKind::SCAN: return "scan";
    }
    return "session";
}

SessionController::SessionController(CommandRunner& runner, InterfaceLocks& locks, const Config& config)
    : runner_(runner), locks_(locks), config_(config),
      foreground_(nullptr), foreground_busy_(false), interrupt_requested_(false),
      capture_starting_(false), shutting_down_(false), watcher_running_(true) {
    watcher_thread_ = std::thread(&SessionController::watcherLoop, this);
}

SessionController::~SessionController() {
    watcher_running_ = false;
    cv_.notify_all();
    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
    terminateAll();
}

void SessionController::setCompletionHandler(CompletionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    completion_handler_ = handler;
}

std::string SessionController::capturePrefix(const std::string& capture_dir, const std::string& bssid) {
    std::string compact;
    for (char c : toUpper(bssid)) {
        if (c != ':' && c != '-') compact += c;
    }
    std::string dir = capture_dir.empty() ? "." : capture_dir;
    if (dir.back() == '/') dir.pop_back();
    return dir + "/capture_" + compact;
}

std::string SessionController::resolveClient(const std::string& client) {
    std::string lower = toLower(trim(client));
    if (lower.empty() || lower == "broadcast" || lower == "all" || lower == "*") {
        return kBroadcastMac;
    }
    return normalizeMacAddress(trim(client));
}

std::string SessionController::newestCaptureFile(const std::string& prefix) {
    std::string dir = ".";
    std::string base = prefix;
    size_t slash = prefix.find_last_of('/');
    if (slash != std::string::npos) {
        dir = slash == 0 ? "/" : prefix.substr(0, slash);
        base = prefix.substr(slash + 1);
    }

    DIR* handle = opendir(dir.c_str());
    if (!handle) {
        return prefix;
    }

    std::string best;
    int best_index = -1;
    const std::string lead = base + "-";
    struct dirent* entry;
    while ((entry = readdir(handle)) != nullptr) {
        std::string name = entry->d_name;
        if (!startsWith(name, lead) || !endsWith(name, ".cap")) continue;

        std::string digits = name.substr(lead.size(), name.size() - lead.size() - 4);
        if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) continue;

        int index = std::atoi(digits.c_str());
        if (index > best_index) {
            best_index = index;
            best = name;
        }
    }
    closedir(handle);

    if (best_index < 0) {
        return prefix;
    }
    return (dir == "/" ? "" : dir) + "/" + best;
}

std::string SessionController::installHint(const std::string& program) const {
    if (program == config_.airodump_binary || program == config_.aireplay_binary ||
        startsWith(program, "air")) {
        return program + " is not installed. Install with: sudo apt-get install aircrack-ng";
    }
    return program + " is not installed. Make sure it's in your PATH.";
}

// ---------------------------------------------------------------------------
// Background capture
// ---------------------------------------------------------------------------

SessionResult SessionController::startCapture(const std::string& interface, const std::string& bssid,
                                              const std::string& channel) {
    SessionResult result;

    MacAddress parsed;
    if (!MacAddress::parse(bssid, parsed)) {
        result.status = SessionStatus::FAILED;
        result.message = "Error: invalid BSSID: " + bssid;
        return result;
    }
    std::string target = parsed.toString();

    auto interface_lock = locks_.acquire(interface);

    // Reserve the slot; spawning and the settle wait happen without mutex_
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            result.status = SessionStatus::SHUTTING_DOWN;
            result.message = "Shutting down: capture not started";
            return result;
        }
        if (capture_) {
            result.status = SessionStatus::ALREADY_ACTIVE;
            result.output_file = newestCaptureFile(capture_->target_file);
            result.message = "A capture session is already active on " + capture_->interface_name +
                             " (writing " + result.output_file + "). Stop it first with 'capture stop'.";
            return result;
        }
        if (capture_starting_) {
            result.status = SessionStatus::ALREADY_ACTIVE;
            result.message = "A capture session is already starting. Check it with 'capture status'.";
            return result;
        }
        capture_starting_ = true;
    }

    auto abandon = [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        capture_starting_ = false;
        cv_.notify_all();
    };

    if (!runner_.isAvailable(config_.airodump_binary)) {
        abandon();
        result.status = SessionStatus::TOOL_UNAVAILABLE;
        result.message = installHint(config_.airodump_binary);
        return result;
    }

    if (!ensureDirectory(config_.capture_dir.empty() ? "." : config_.capture_dir)) {
        abandon();
        result.status = SessionStatus::FAILED;
        result.message = "Error: capture directory " + config_.capture_dir + " is not usable";
        return result;
    }

    std::string prefix = capturePrefix(config_.capture_dir, target);
    SpawnOptions options;
    options.output_path = prefix + ".log";

    std::unique_ptr<ChildProcess> child = runner_.spawn(
        {config_.airodump_binary, "-c", channel, "--bssid", target, "-w", prefix, interface}, options);
    interface_lock.unlock();
    if (!child) {
        abandon();
        result.status = SessionStatus::FAILED;
        result.message = "Error starting capture: could not launch " + config_.airodump_binary;
        return result;
    }

    bool cancelled;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (config_.capture_settle_ms > 0) {
            cv_.wait_for(lock, std::chrono::milliseconds(config_.capture_settle_ms),
                         [this] { return shutting_down_; });
        }
        cancelled = shutting_down_;
    }

    if (cancelled) {
        // terminateAll() waits for capture_starting_ to clear, so the child dies first
        if (!child->terminate(config_.terminate_grace_ms)) {
            Logger::getInstance().warning("Capture process " + std::to_string(child->pid()) +
                                          " could not be reaped");
        }
        abandon();
        result.status = SessionStatus::SHUTTING_DOWN;
        result.message = "Shutting down: capture on " + interface + " stopped before it started";
        return result;
    }

    if (!child->isRunning()) {
        abandon();
        result.status = SessionStatus::FAILED;
        result.exit_code = child->exitCode();
        std::string tail = readFileTail(options.output_path, 10);
        result.message = "Error starting capture: " + config_.airodump_binary + " exited with code " +
                         std::to_string(result.exit_code);
        if (!tail.empty()) {
            result.message += "\n" + tail;
        }
        Logger::getInstance().error("Capture on " + interface + " died during startup");
        return result;
    }

    auto session = std::make_unique<Session>();
    session->process = std::move(child);
    session->target_file = prefix;
    session->kind = SessionKind::CAPTURE;
    session->interface_name = interface;
    session->bssid = target;
    session->channel = channel;
    session->started_at = std::chrono::system_clock::now();

    Logger::getInstance().info("Capture started on " + interface + " for " + target +
                               " (PID " + std::to_string(session->process->pid()) + ")");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capture_ = std::move(session);
        capture_starting_ = false;
        cv_.notify_all();
    }

    result.status = SessionStatus::OK;
    result.output_file = prefix + "-01.cap";
    result.message = "Capture started on " + interface + " for " + target + " on channel " + channel +
                     ". Packets will be saved to " + prefix + "-NN.cap. Use 'capture stop' to end it.";
    return result;
}

SessionResult SessionController::stop() {
    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(capture_);
        cv_.notify_all();
    }

    SessionResult result;
    if (!session) {
        result.status = SessionStatus::NOT_ACTIVE;
        result.message = "No active capture session";
        return result;
    }

    if (!session->process->terminate(config_.terminate_grace_ms)) {
        Logger::getInstance().warning("Capture process " + std::to_string(session->process->pid()) +
                                      " could not be reaped");
    }

    result.status = SessionStatus::OK;
    result.exit_code = session->process->exitCode();
    result.output_file = newestCaptureFile(session->target_file);
    result.message = "Capture stopped. Packets saved to " + result.output_file;

    finishCapture(std::move(session), "stopped");
    return result;
}

void SessionController::finishCapture(std::unique_ptr<Session> session, const std::string& reason) {
    SessionSummary summary;
    summary.interface_name = session->interface_name;
    summary.bssid = session->bssid;
    summary.channel = session->channel;
    summary.output_file = newestCaptureFile(session->target_file);
    summary.started_at = session->started_at;
    summary.ended_at = std::chrono::system_clock::now();
    summary.exit_code = session->process->exitCode();
    summary.reason = reason;

    Logger::getInstance().info("Capture on " + summary.interface_name + " ended (" + reason + ")");

    CompletionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = completion_handler_;
    }
    if (handler) {
        try {
            handler(summary);
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("Capture completion handler failed: ") + e.what());
        }
    }
}

std::string SessionController::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!capture_) {
        return "No active capture session";
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - capture_->started_at).count();

    std::ostringstream out;
    out << "Capture active on " << capture_->interface_name << "\n"
        << "Target:  " << capture_->bssid << " (channel " << capture_->channel << ")\n"
        << "Output:  " << newestCaptureFile(capture_->target_file) << "\n"
        << "Running: " << elapsed << "s (PID " << capture_->process->pid() << ")";
    return out.str();
}

bool SessionController::isActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return capture_ != nullptr;
}

bool SessionController::waitForCaptureEnd(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto idle = [this] { return !capture_ && !capture_starting_; };
    if (timeout_ms <= 0) {
        cv_.wait(lock, idle);
        return true;
    }
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
}

void SessionController::watcherLoop() {
    while (watcher_running_) {
        std::unique_ptr<Session> ended;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(250), [this] { return !watcher_running_; });
            if (!watcher_running_) break;

            if (capture_ && !capture_->process->isRunning()) {
                ended = std::move(capture_);
                cv_.notify_all();
            }
        }

        if (ended) {
            Logger::getInstance().warning("Capture process on " + ended->interface_name +
                                          " exited on its own with code " +
                                          std::to_string(ended->process->exitCode()));
            finishCapture(std::move(ended), "exited");
        }
    }
}

// ---------------------------------------------------------------------------
// Foreground runs
// ---------------------------------------------------------------------------

SessionResult SessionController::startAttack(const std::string& interface, const std::string& bssid,
                                             const std::string& client, int count, OutputCallback on_output) {
    SessionResult result;

    MacAddress parsed;
    if (!MacAddress::parse(bssid, parsed)) {
        result.status = SessionStatus::FAILED;
        result.message = "Error: invalid BSSID: " + bssid;
        return result;
    }

    std::string target_client = resolveClient(client);
    if (!isValidMacAddress(target_client)) {
        result.status = SessionStatus::FAILED;
        result.message = "Error: invalid client MAC: " + client;
        return result;
    }

    if (count < 0) count = 0;

    std::vector<std::string> argv = {
        config_.aireplay_binary, "-0", std::to_string(count),
        "-a", parsed.toString(), "-c", target_client, interface
    };

    Logger::getInstance().info("Deauthentication against " + parsed.toString() + " (client " +
                               target_client + ") on " + interface);

    result = runForeground(SessionKind::ATTACK, interface, argv, 0, on_output);
    if (result.status == SessionStatus::OK) {
        std::string detail = result.message;
        result.message = "Deauthentication attack completed";
        if (!detail.empty() && detail != "Command executed successfully.") {
            result.message += "\n" + detail;
        }
    } else if (result.status == SessionStatus::INTERRUPTED) {
        result.message = "Deauthentication attack stopped by user";
    }
    return result;
}

SessionResult SessionController::runForeground(SessionKind kind, const std::string& interface,
                                               const std::vector<std::string>& argv, int max_seconds,
                                               OutputCallback on_output) {
    SessionResult result;
    if (argv.empty()) {
        result.status = SessionStatus::FAILED;
        result.message = "Error: nothing to run";
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            result.status = SessionStatus::SHUTTING_DOWN;
            result.message = "Shutting down: " + argv[0] + " not started";
            return result;
        }
        if (foreground_busy_) {
            result.status = SessionStatus::ALREADY_ACTIVE;
            result.message = "Another foreground operation is already running";
            return result;
        }
        foreground_busy_ = true;
        interrupt_requested_ = false;
    }

    auto release = [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        foreground_ = nullptr;
        foreground_busy_ = false;
        cv_.notify_all();
    };

    if (!runner_.isAvailable(argv[0])) {
        release();
        result.status = SessionStatus::TOOL_UNAVAILABLE;
        result.message = installHint(argv[0]);
        return result;
    }

    std::unique_ptr<ChildProcess> child;
    {
        auto interface_lock = locks_.acquire(interface);
        SpawnOptions options;
        options.capture_output = true;
        child = runner_.spawn(argv, options);
    }
    if (!child) {
        release();
        result.status = SessionStatus::FAILED;
        result.message = "Error: could not launch " + argv[0];
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        foreground_ = child.get();
    }

    Logger::getInstance().debug("Foreground " + sessionKindToString(kind) + " running as PID " +
                                std::to_string(child->pid()));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(max_seconds);
    std::string pending;
    std::string collected;
    bool interrupted = false;
    bool timed_out = false;

    while (true) {
        std::string chunk = child->readOutput();
        if (!chunk.empty()) {
            collected += chunk;
            pending += chunk;
            emitLines(pending, on_output, false);
        }

        if (!child->isRunning()) break;

        if (max_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, std::chrono::milliseconds(100), [this] { return interrupt_requested_; })) {
            interrupted = true;
            break;
        }
    }

    if (interrupted || timed_out) {
        if (!child->terminate(config_.terminate_grace_ms)) {
            Logger::getInstance().warning("Could not reap " + argv[0] + " (PID " +
                                          std::to_string(child->pid()) + ")");
        }
    }

    std::string rest = child->readOutput();
    collected += rest;
    pending += rest;
    emitLines(pending, on_output, true);

    result.exit_code = child->exitCode();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        foreground_ = nullptr;
    }
    child.reset();
    release();

    if (interrupted) {
        result.status = SessionStatus::INTERRUPTED;
        result.message = "Stopped by user";
        Logger::getInstance().info(argv[0] + " stopped by user");
    } else if (timed_out || result.exit_code == 0) {
        // Reaching the time limit is the normal end of a timed run
        result.status = SessionStatus::OK;
        result.message = tailLines(collected, 10);
        if (result.message.empty()) {
            result.message = "Command executed successfully.";
        }
    } else {
        result.status = SessionStatus::FAILED;
        std::string tail = tailLines(collected, 10);
        result.message = "Error: " + argv[0] + " exited with code " + std::to_string(result.exit_code);
        if (!tail.empty()) {
            result.message += "\n" + tail;
        }
        Logger::getInstance().error(argv[0] + " failed with code " + std::to_string(result.exit_code));
    }
    return result;
}

bool SessionController::interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!foreground_busy_) {
        return false;
    }
    interrupt_requested_ = true;
    cv_.notify_all();
    return true;
}

bool SessionController::isShuttingDown() {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutting_down_;
}

void SessionController::terminateAll() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        shutting_down_ = true;
        cv_.notify_all();
        // A start in flight either publishes its session or kills its own child
        bool settled = cv_.wait_for(lock, std::chrono::milliseconds(config_.capture_settle_ms +
                                                                     config_.terminate_grace_ms + 1000),
                                    [this] { return !capture_starting_; });
        if (!settled) {
            Logger::getInstance().warning("Capture start did not finish before shutdown");
        }
    }

    if (interrupt()) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool released = cv_.wait_for(lock, std::chrono::milliseconds(config_.terminate_grace_ms + 1000),
                                     [this] { return !foreground_busy_; });
        if (!released && foreground_) {
            Logger::getInstance().warning("Foreground process did not stop, killing it");
            foreground_->terminate(0);
        }
    }

    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(capture_);
        cv_.notify_all();
    }
    if (session) {
        if (!session->process->terminate(config_.terminate_grace_ms)) {
            Logger::getInstance().warning("Capture process " + std::to_string(session->process->pid()) +
                                          " could not be reaped");
        }
        finishCapture(std::move(session), "shutdown");
    }
}

} // namespace paw
