#ifndef PAW_SESSION_CONTROLLER_H
#define PAW_SESSION_CONTROLLER_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>
#include "common/types.h"
#include "common/command_runner.h"
#include "common/interface_locks.h"

namespace paw {

enum class SessionKind {
    CAPTURE,
    ATTACK,
    SCAN
};

enum class SessionStatus {
    OK,
    ALREADY_ACTIVE,
    NOT_ACTIVE,
    TOOL_UNAVAILABLE,
    FAILED,
    INTERRUPTED,
    SHUTTING_DOWN
};

std::string sessionKindToString(SessionKind kind);

struct SessionResult {
    SessionStatus status = SessionStatus::OK;
    std::string message;
    std::string output_file;
    int exit_code = -1;

    bool ok() const { return status == SessionStatus::OK; }
};

struct Session {
    std::unique_ptr<ChildProcess> process;
    std::string target_file;   // output prefix handed to the tool
    SessionKind kind = SessionKind::CAPTURE;
    std::string interface_name;
    std::string bssid;
    std::string channel;
    std::chrono::system_clock::time_point started_at;
};

// Handed to the completion handler whenever a capture ends
struct SessionSummary {
    std::string interface_name;
    std::string bssid;
    std::string channel;
    std::string output_file;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point ended_at;
    int exit_code = -1;
    std::string reason;   // "stopped", "exited" or "shutdown"
};

using OutputCallback = std::function<void(const std::string& line)>;
using CompletionHandler = std::function<void(const SessionSummary& summary)>;

// Owns every child process paw starts: at most one background capture and
// at most one blocking foreground run (attack or scan) at a time.
class SessionController {
public:
    SessionController(CommandRunner& runner, InterfaceLocks& locks, const Config& config);
    ~SessionController();

    // Background capture
    SessionResult startCapture(const std::string& interface, const std::string& bssid,
                               const std::string& channel);
    SessionResult stop();
    std::string status();
    bool isActive();
    // Blocks until no capture is active; timeout_ms == 0 waits without limit.
    // Returns false on timeout.
    bool waitForCaptureEnd(int timeout_ms = 0);

    // Foreground runs; both block until the child exits or interrupt() is called
    SessionResult startAttack(const std::string& interface, const std::string& bssid,
                              const std::string& client, int count, OutputCallback on_output);
    SessionResult runForeground(SessionKind kind, const std::string& interface,
                                const std::vector<std::string>& argv, int max_seconds,
                                OutputCallback on_output);

    // Safe from any thread. After terminateAll() no new child is started.
    bool interrupt();
    void terminateAll();
    bool isShuttingDown();

    void setCompletionHandler(CompletionHandler handler);

    // <capture_dir>/capture_<BSSID without colons>
    static std::string capturePrefix(const std::string& capture_dir, const std::string& bssid);
    // broadcast / all / * / empty -> FF:FF:FF:FF:FF:FF
    static std::string resolveClient(const std::string& client);
    // Newest <prefix>-NN.cap, or the prefix itself when the tool wrote none yet
    static std::string newestCaptureFile(const std::string& prefix);

private:
    CommandRunner& runner_;
    InterfaceLocks& locks_;
    Config config_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<Session> capture_;
    ChildProcess* foreground_;
    bool foreground_busy_;
    bool interrupt_requested_;
    bool capture_starting_;
    bool shutting_down_;
    CompletionHandler completion_handler_;

    std::atomic<bool> watcher_running_;
    std::thread watcher_thread_;

    void watcherLoop();
    void finishCapture(std::unique_ptr<Session> session, const std::string& reason);
    std::string installHint(const std::string& program) const;
};

} // namespace paw

#endif // PAW_SESSION_CONTROLLER_H
