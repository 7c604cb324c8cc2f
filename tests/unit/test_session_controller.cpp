#include <gtest/gtest.h>
#include "paw-dump/session_controller.h"
#include "fake_command_runner.h"
#include "temp_dir.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace paw;
using paw::fakes::FakeCommandRunner;
using paw::fakes::TempDir;

namespace {

const char* kBssid = "aa:bb:cc:dd:ee:ff";

template <typename Predicate>
bool waitFor(Predicate predicate, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

} // namespace

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.capture_dir = dir.path();
        config.capture_settle_ms = 0;
        config.terminate_grace_ms = 50;
    }

    std::string prefix() const {
        return dir.path() + "/capture_AABBCCDDEEFF";
    }

    void recordSummaries(SessionController& sessions) {
        sessions.setCompletionHandler([this](const SessionSummary& summary) {
            std::lock_guard<std::mutex> lock(summaries_mutex);
            summaries.push_back(summary);
        });
    }

    size_t summaryCount() {
        std::lock_guard<std::mutex> lock(summaries_mutex);
        return summaries.size();
    }

    TempDir dir;
    FakeCommandRunner runner;
    InterfaceLocks locks;
    Config config;

    std::mutex summaries_mutex;
    std::vector<SessionSummary> summaries;
};

TEST_F(SessionControllerTest, StartCaptureLaunchesAirodump) {
    SessionController sessions(runner, locks, config);

    auto result = sessions.startCapture("wlan0mon", kBssid, "6");

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.output_file, prefix() + "-01.cap");
    EXPECT_EQ(result.message.find("Capture started on wlan0mon"), 0u);
    EXPECT_TRUE(sessions.isActive());

    auto spawned = runner.spawned();
    ASSERT_EQ(spawned.size(), 1u);
    EXPECT_EQ(spawned[0], "airodump-ng -c 6 --bssid AA:BB:CC:DD:EE:FF -w " + prefix() + " wlan0mon");
    EXPECT_EQ(runner.spawnOptions()[0].output_path, prefix() + ".log");
    EXPECT_FALSE(runner.spawnOptions()[0].capture_output);
}

TEST_F(SessionControllerTest, SecondCaptureIsRejected) {
    SessionController sessions(runner, locks, config);
    ASSERT_TRUE(sessions.startCapture("wlan0mon", kBssid, "6").ok());

    auto second = sessions.startCapture("wlan1mon", "11:22:33:44:55:66", "11");

    EXPECT_EQ(second.status, SessionStatus::ALREADY_ACTIVE);
    EXPECT_NE(second.message.find("already active on wlan0mon"), std::string::npos);
    EXPECT_NE(second.message.find("capture stop"), std::string::npos);
    EXPECT_EQ(runner.spawned().size(), 1u);

    auto first = runner.child(0);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->terminate_calls, 0);
    std::string status = sessions.status();
    EXPECT_NE(status.find("AA:BB:CC:DD:EE:FF"), std::string::npos);
    EXPECT_EQ(status.find("11:22:33:44:55:66"), std::string::npos);
}

TEST_F(SessionControllerTest, StopWhenIdle) {
    SessionController sessions(runner, locks, config);

    auto result = sessions.stop();

    EXPECT_EQ(result.status, SessionStatus::NOT_ACTIVE);
    EXPECT_EQ(result.message, "No active capture session");
    EXPECT_EQ(sessions.status(), "No active capture session");
    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(SessionControllerTest, StopTerminatesAndReportsNewestFile) {
    SessionController sessions(runner, locks, config);
    recordSummaries(sessions);
    ASSERT_TRUE(sessions.startCapture("wlan0mon", kBssid, "6").ok());
    dir.write("capture_AABBCCDDEEFF-01.cap", "x");

    auto result = sessions.stop();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.output_file, prefix() + "-01.cap");
    EXPECT_EQ(result.message, "Capture stopped. Packets saved to " + prefix() + "-01.cap");
    EXPECT_EQ(runner.child(0)->terminate_calls, 1);
    EXPECT_FALSE(sessions.isActive());

    ASSERT_EQ(summaryCount(), 1u);
    EXPECT_EQ(summaries[0].reason, "stopped");
    EXPECT_EQ(summaries[0].bssid, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(summaries[0].output_file, prefix() + "-01.cap");

    EXPECT_EQ(sessions.stop().status, SessionStatus::NOT_ACTIVE);
}

TEST_F(SessionControllerTest, CaptureDyingAtStartupFails) {
    runner.spawnExitedChildren(1);
    dir.write("capture_AABBCCDDEEFF.log", "Interface wlan9mon:\nioctl(SIOCSIWMODE) failed: No such device\n");
    SessionController sessions(runner, locks, config);

    auto result = sessions.startCapture("wlan9mon", kBssid, "6");

    EXPECT_EQ(result.status, SessionStatus::FAILED);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.message.find("exited with code 1"), std::string::npos);
    EXPECT_NE(result.message.find("No such device"), std::string::npos);
    EXPECT_FALSE(sessions.isActive());
}

TEST_F(SessionControllerTest, CaptureRejectsBadInput) {
    SessionController sessions(runner, locks, config);

    auto result = sessions.startCapture("wlan0mon", "not-a-bssid", "6");
    EXPECT_EQ(result.status, SessionStatus::FAILED);
    EXPECT_EQ(result.message, "Error: invalid BSSID: not-a-bssid");

    runner.setMissing("airodump-ng");
    result = sessions.startCapture("wlan0mon", kBssid, "6");
    EXPECT_EQ(result.status, SessionStatus::TOOL_UNAVAILABLE);
    EXPECT_EQ(result.message, "airodump-ng is not installed. Install with: sudo apt-get install aircrack-ng");

    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(SessionControllerTest, WatcherReleasesSlotWhenCaptureExits) {
    SessionController sessions(runner, locks, config);
    recordSummaries(sessions);
    ASSERT_TRUE(sessions.startCapture("wlan0mon", kBssid, "6").ok());

    paw::fakes::finishChild(runner.child(0), 1);

    ASSERT_TRUE(waitFor([&] { return !sessions.isActive(); }));
    ASSERT_TRUE(waitFor([&] { return summaryCount() == 1; }));
    EXPECT_EQ(summaries[0].reason, "exited");
    EXPECT_EQ(summaries[0].exit_code, 1);

    // The slot is free again
    EXPECT_TRUE(sessions.startCapture("wlan0mon", kBssid, "6").ok());
}

TEST_F(SessionControllerTest, BroadcastAttack) {
    runner.spawnExitedChildren(0);
    runner.setSpawnOutput("Waiting for beacon frame (BSSID: AA:BB:CC:DD:EE:FF) on channel 6\r\n"
                          "Sending DeAuth (code 7) to broadcast -- BSSID: [AA:BB:CC:DD:EE:FF]\n");
    SessionController sessions(runner, locks, config);

    std::vector<std::string> lines;
    auto result = sessions.startAttack("wlan0mon", kBssid, "broadcast", 5,
                                       [&lines](const std::string& line) { lines.push_back(line); });

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.message.find("Deauthentication attack completed"), 0u);
    auto spawned = runner.spawned();
    ASSERT_EQ(spawned.size(), 1u);
    EXPECT_EQ(spawned[0], "aireplay-ng -0 5 -a AA:BB:CC:DD:EE:FF -c FF:FF:FF:FF:FF:FF wlan0mon");
    EXPECT_TRUE(runner.spawnOptions()[0].capture_output);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "Sending DeAuth (code 7) to broadcast -- BSSID: [AA:BB:CC:DD:EE:FF]");
}

TEST_F(SessionControllerTest, AttackWithSpecificClient) {
    runner.spawnExitedChildren(0);
    SessionController sessions(runner, locks, config);

    auto result = sessions.startAttack("wlan0mon", kBssid, "00:11:22:33:44:55", 0, nullptr);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.message, "Deauthentication attack completed");
    EXPECT_EQ(runner.spawned()[0], "aireplay-ng -0 0 -a AA:BB:CC:DD:EE:FF -c 00:11:22:33:44:55 wlan0mon");

    result = sessions.startAttack("wlan0mon", kBssid, "nobody", 1, nullptr);
    EXPECT_EQ(result.status, SessionStatus::FAILED);
    EXPECT_EQ(runner.spawned().size(), 1u);
}

TEST_F(SessionControllerTest, AttackFailureCarriesExitCode) {
    runner.spawnExitedChildren(1);
    runner.setSpawnOutput("wlan0mon is on channel 1, but the AP uses channel 6\n");
    SessionController sessions(runner, locks, config);

    auto result = sessions.startAttack("wlan0mon", kBssid, "", 3, nullptr);

    EXPECT_EQ(result.status, SessionStatus::FAILED);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.message.find("Error: aireplay-ng exited with code 1"), std::string::npos);
    EXPECT_NE(result.message.find("the AP uses channel 6"), std::string::npos);
}

TEST_F(SessionControllerTest, InterruptFromAnotherThread) {
    SessionController sessions(runner, locks, config);
    EXPECT_FALSE(sessions.interrupt());

    std::thread interrupter([&] {
        waitFor([&] { return runner.spawned().size() == 1; });
        waitFor([&] { return sessions.interrupt(); });
    });

    auto result = sessions.startAttack("wlan0mon", kBssid, "broadcast", 0, nullptr);
    interrupter.join();

    EXPECT_EQ(result.status, SessionStatus::INTERRUPTED);
    EXPECT_EQ(result.message, "Deauthentication attack stopped by user");
    EXPECT_EQ(runner.child(0)->terminate_calls, 1);
    EXPECT_FALSE(sessions.interrupt());
}

TEST_F(SessionControllerTest, OneForegroundRunAtATime) {
    SessionController sessions(runner, locks, config);

    SessionResult first;
    std::thread worker([&] {
        first = sessions.runForeground(SessionKind::SCAN, "wlan0mon", {"airodump-ng", "wlan0mon"}, 0, nullptr);
    });
    ASSERT_TRUE(waitFor([&] { return runner.spawned().size() == 1; }));

    auto second = sessions.runForeground(SessionKind::ATTACK, "wlan0mon", {"aireplay-ng", "-0", "1"}, 0, nullptr);
    EXPECT_EQ(second.status, SessionStatus::ALREADY_ACTIVE);
    EXPECT_EQ(second.message, "Another foreground operation is already running");

    EXPECT_TRUE(sessions.interrupt());
    worker.join();
    EXPECT_EQ(first.status, SessionStatus::INTERRUPTED);
    EXPECT_EQ(runner.spawned().size(), 1u);
}

TEST_F(SessionControllerTest, TimedRunEndsWithOk) {
    SessionController sessions(runner, locks, config);

    auto result = sessions.runForeground(SessionKind::SCAN, "wlan0mon", {"airodump-ng", "wlan0mon"}, 1, nullptr);

    EXPECT_EQ(result.status, SessionStatus::OK);
    EXPECT_EQ(result.message, "Command executed successfully.");
    EXPECT_EQ(runner.child(0)->terminate_calls, 1);
}

TEST_F(SessionControllerTest, ForegroundToolMissing) {
    runner.setMissing("aireplay-ng");
    SessionController sessions(runner, locks, config);

    auto result = sessions.startAttack("wlan0mon", kBssid, "broadcast", 1, nullptr);

    EXPECT_EQ(result.status, SessionStatus::TOOL_UNAVAILABLE);
    EXPECT_EQ(result.message, "aireplay-ng is not installed. Install with: sudo apt-get install aircrack-ng");
    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(SessionControllerTest, TerminateAllStopsEverything) {
    SessionController sessions(runner, locks, config);
    recordSummaries(sessions);
    ASSERT_TRUE(sessions.startCapture("wlan0mon", kBssid, "6").ok());

    SessionResult attack;
    std::thread worker([&] {
        attack = sessions.startAttack("wlan1mon", kBssid, "broadcast", 0, nullptr);
    });
    ASSERT_TRUE(waitFor([&] { return runner.spawned().size() == 2; }));

    sessions.terminateAll();
    worker.join();

    EXPECT_EQ(attack.status, SessionStatus::INTERRUPTED);
    EXPECT_FALSE(sessions.isActive());
    EXPECT_EQ(runner.child(0)->terminate_calls, 1);
    EXPECT_EQ(runner.child(1)->terminate_calls, 1);
    ASSERT_EQ(summaryCount(), 1u);
    EXPECT_EQ(summaries[0].reason, "shutdown");
}

TEST_F(SessionControllerTest, NothingStartsAfterTerminateAll) {
    SessionController sessions(runner, locks, config);
    EXPECT_FALSE(sessions.isShuttingDown());

    sessions.interrupt();
    sessions.terminateAll();
    EXPECT_TRUE(sessions.isShuttingDown());

    auto capture = sessions.startCapture("wlan0mon", kBssid, "6");
    EXPECT_EQ(capture.status, SessionStatus::SHUTTING_DOWN);
    EXPECT_EQ(capture.message, "Shutting down: capture not started");
    EXPECT_FALSE(sessions.isActive());

    auto attack = sessions.startAttack("wlan0mon", kBssid, "broadcast", 0, nullptr);
    EXPECT_EQ(attack.status, SessionStatus::SHUTTING_DOWN);
    EXPECT_EQ(attack.message, "Shutting down: aireplay-ng not started");

    auto scan = sessions.runForeground(SessionKind::SCAN, "wlan0mon", {"airodump-ng", "wlan0mon"}, 1, nullptr);
    EXPECT_EQ(scan.status, SessionStatus::SHUTTING_DOWN);

    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(SessionControllerTest, TerminateAllDuringSettleKillsNewCapture) {
    config.capture_settle_ms = 5000;
    SessionController sessions(runner, locks, config);
    recordSummaries(sessions);

    SessionResult started;
    std::thread starter([&] {
        started = sessions.startCapture("wlan0mon", kBssid, "6");
    });
    ASSERT_TRUE(waitFor([&] { return runner.spawned().size() == 1; }));

    // The settle wait does not hold the session lock
    EXPECT_EQ(sessions.status(), "No active capture session");
    EXPECT_FALSE(sessions.interrupt());

    auto begin = std::chrono::steady_clock::now();
    sessions.terminateAll();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    starter.join();

    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
    EXPECT_EQ(started.status, SessionStatus::SHUTTING_DOWN);
    EXPECT_EQ(runner.child(0)->terminate_calls, 1);
    EXPECT_FALSE(sessions.isActive());
    EXPECT_EQ(summaryCount(), 0u);
}

TEST_F(SessionControllerTest, WaitForCaptureEnd) {
    SessionController sessions(runner, locks, config);
    EXPECT_TRUE(sessions.waitForCaptureEnd(10));

    ASSERT_TRUE(sessions.startCapture("wlan0mon", kBssid, "6").ok());
    EXPECT_FALSE(sessions.waitForCaptureEnd(50));

    std::thread ender([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        paw::fakes::finishChild(runner.child(0), 0);
    });
    EXPECT_TRUE(sessions.waitForCaptureEnd(3000));
    ender.join();
    EXPECT_FALSE(sessions.isActive());
}

TEST_F(SessionControllerTest, DestructorKillsCapture) {
    std::shared_ptr<paw::fakes::FakeChildState> child;
    {
        SessionController sessions(runner, locks, config);
        ASSERT_TRUE(sessions.startCapture("wlan0mon", kBssid, "6").ok());
        child = runner.child(0);
    }
    EXPECT_EQ(child->terminate_calls, 1);
}

TEST(SessionControllerStaticTest, NewestCaptureFile) {
    TempDir dir;
    std::string prefix = dir.path() + "/capture_AABBCCDDEEFF";
    EXPECT_EQ(SessionController::newestCaptureFile(prefix), prefix);

    dir.write("capture_AABBCCDDEEFF-01.cap", "");
    dir.write("capture_AABBCCDDEEFF-02.cap", "");
    dir.write("capture_AABBCCDDEEFF-10.cap", "");
    dir.write("capture_AABBCCDDEEFF-11.csv", "");
    dir.write("capture_AABBCCDDEEFF-ab.cap", "");
    dir.write("capture_112233445566-99.cap", "");

    EXPECT_EQ(SessionController::newestCaptureFile(prefix), prefix + "-10.cap");
}

TEST(SessionControllerStaticTest, PrefixAndClient) {
    EXPECT_EQ(SessionController::capturePrefix("/tmp/caps/", "aa:bb:cc:dd:ee:ff"), "/tmp/caps/capture_AABBCCDDEEFF");
    EXPECT_EQ(SessionController::capturePrefix("", "aa-bb-cc-dd-ee-ff"), "./capture_AABBCCDDEEFF");

    EXPECT_EQ(SessionController::resolveClient(""), "FF:FF:FF:FF:FF:FF");
    EXPECT_EQ(SessionController::resolveClient("Broadcast"), "FF:FF:FF:FF:FF:FF");
    EXPECT_EQ(SessionController::resolveClient("*"), "FF:FF:FF:FF:FF:FF");
    EXPECT_EQ(SessionController::resolveClient("00:11:22:aa:bb:cc"), "00:11:22:AA:BB:CC");
}
