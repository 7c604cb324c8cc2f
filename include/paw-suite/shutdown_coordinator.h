#ifndef PAW_SHUTDOWN_COORDINATOR_H
#define PAW_SHUTDOWN_COORDINATOR_H

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <thread>
#include <functional>
#include "paw-mon/interface_probe.h"
#include "paw-mon/mode_controller.h"
#include "paw-dump/session_controller.h"
#include "paw-suite/console.h"

namespace paw {

// Stops sessions, restores monitor interfaces to managed mode, says goodbye
// and exits. Runs at most once per process.
class ShutdownCoordinator {
public:
    using ExitFunction = std::function<void(int)>;

    ShutdownCoordinator(SessionController& sessions, InterfaceProbe& probe, ModeController& modes,
                        OutputSink& output);
    ~ShutdownCoordinator();

    // Blocks SIGINT/SIGTERM in the calling thread and every thread it starts
    // afterwards. main() calls this before any other thread exists.
    static bool blockSignals();

    // Waits for SIGINT/SIGTERM on a dedicated thread
    bool install();

    // Normal end of the program (exit, end of input, finished one-shot command)
    void shutdown(const std::string& reason);
    // SIGINT/SIGTERM: always restores monitor interfaces
    void handleSignal(int sig);
    bool hasRun() const { return done_; }

    void setCleanupHook(std::function<void()> hook) { cleanup_hook_ = hook; }
    void setExitFunction(ExitFunction exit_function) { exit_function_ = exit_function; }
    // A finished one-shot command leaves interface modes as the command set them.
    // Signals restore interfaces regardless.
    void setRestoreOnFinish(bool restore) { restore_on_finish_ = restore; }

    // Interfaces restored by the last shutdown, in order
    const std::vector<std::string>& restoredInterfaces() const { return restored_; }

private:
    SessionController& sessions_;
    InterfaceProbe& probe_;
    ModeController& modes_;
    OutputSink& output_;

    std::function<void()> cleanup_hook_;
    ExitFunction exit_function_;
    bool restore_on_finish_;

    std::mutex mutex_;
    std::atomic<bool> started_;
    std::atomic<bool> done_;
    std::vector<std::string> restored_;

    std::atomic<bool> signal_thread_running_;
    std::thread signal_thread_;

    void signalLoop();
    void stopSessions();
    void runShutdown(const std::string& reason, bool restore);
    std::string restoreInterfaces();
};

} // namespace paw

#endif // PAW_SHUTDOWN_COORDINATOR_H
