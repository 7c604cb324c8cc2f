#include "paw-suite/shutdown_coordinator.h"
#include "common/logger.h"
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <signal.h>
#include <pthread.h>

namespace paw {

namespace {

// SIGUSR2 only wakes the signal thread when the coordinator is destroyed
void fillSignalSet(sigset_t& set) {
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR2);
}

void defaultExit(int code) {
    std::cout << std::flush;
    std::cerr << std::flush;
    std::_Exit(code);
}

} // namespace

ShutdownCoordinator::ShutdownCoordinator(SessionController& sessions, InterfaceProbe& probe,
                                         ModeController& modes, OutputSink& output)
    : sessions_(sessions), probe_(probe), modes_(modes), output_(output),
      exit_function_(defaultExit), restore_on_finish_(true), started_(false), done_(false), signal_thread_running_(false) {
}

ShutdownCoordinator::~ShutdownCoordinator() {
    if (signal_thread_.joinable()) {
        signal_thread_running_ = false;
        pthread_kill(signal_thread_.native_handle(), SIGUSR2);
        signal_thread_.join();
    }
}

bool ShutdownCoordinator::blockSignals() {
    sigset_t set;
    fillSignalSet(set);

    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        Logger::getInstance().error(std::string("Cannot block signals: ") + strerror(rc));
        return false;
    }
    return true;
}

bool ShutdownCoordinator::install() {
    if (!blockSignals()) {
        return false;
    }

    signal_thread_running_ = true;
    signal_thread_ = std::thread(&ShutdownCoordinator::signalLoop, this);
    Logger::getInstance().debug("Signal handling installed");
    return true;
}

void ShutdownCoordinator::signalLoop() {
    sigset_t set;
    fillSignalSet(set);

    while (signal_thread_running_) {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) {
            continue;
        }
        if (sig == SIGUSR2) {
            continue;
        }

        handleSignal(sig);
    }
}

void ShutdownCoordinator::handleSignal(int sig) {
    Logger::getInstance().warning("Received signal " + std::to_string(sig) + ", shutting down...");
    runShutdown(sig == SIGINT ? "interrupt" : "termination", true);
}

void ShutdownCoordinator::stopSessions() {
    try {
        if (sessions_.interrupt()) {
            Logger::getInstance().info("Interrupted the running foreground operation");
        }
        sessions_.terminateAll();
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Error stopping sessions: ") + e.what());
    }
}

std::string ShutdownCoordinator::restoreInterfaces() {
    std::vector<Interface> interfaces;
    try {
        interfaces = probe_.listInterfaces();
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Error listing interfaces: ") + e.what());
        return "";
    }

    std::string summary;
    for (const auto& iface : interfaces) {
        if (iface.mode != InterfaceMode::MONITOR) continue;

        try {
            ModeChangeResult result = modes_.setManagedMode(iface.name);
            if (result.changed()) {
                restored_.push_back(iface.name);
                summary += "Restored " + iface.name + " to managed mode\n";
            } else {
                summary += "Could not restore " + iface.name + ": " + result.message + "\n";
                Logger::getInstance().warning("Could not restore " + iface.name + ": " + result.message);
            }
        } catch (const std::exception& e) {
            summary += "Could not restore " + iface.name + ": " + e.what() + "\n";
            Logger::getInstance().error("Error restoring " + iface.name + ": " + e.what());
        }
    }
    return summary;
}

void ShutdownCoordinator::shutdown(const std::string& reason) {
    runShutdown(reason, restore_on_finish_);
}

void ShutdownCoordinator::runShutdown(const std::string& reason, bool restore) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        return;
    }
    started_ = true;

    Logger::getInstance().info("Shutting down (" + reason + ")");

    stopSessions();
    std::string summary = restore ? restoreInterfaces() : "";

    if (cleanup_hook_) {
        try {
            cleanup_hook_();
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("Cleanup failed: ") + e.what());
        }
    }

    output_.display(summary + "Goodbye!", "Exit");
    done_ = true;

    if (exit_function_) {
        exit_function_(0);
    }
}

} // namespace paw
