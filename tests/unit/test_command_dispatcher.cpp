#include <gtest/gtest.h>
#include "paw-suite/command_dispatcher.h"
#include "fake_command_runner.h"
#include "fake_console.h"
#include "temp_dir.h"
#include <chrono>
#include <memory>
#include <thread>

using namespace paw;
using paw::fakes::FakeCommandRunner;
using paw::fakes::RecordingOutput;
using paw::fakes::ScriptedPrompt;
using paw::fakes::CannedAdvisor;
using paw::fakes::TempDir;

namespace {

const char* kManagedWlan0 = "phy#0\n\tInterface wlan0\n\t\taddr 9c:b6:d0:11:22:33\n\t\ttype managed\n";
const char* kMonitorWlan0mon = "phy#0\n\tInterface wlan0mon\n\t\taddr 9c:b6:d0:11:22:33\n\t\ttype monitor\n";

const char* kStartOutput =
    "PHY\tInterface\tDriver\t\tChipset\n\n"
    "phy0\twlan0\t\tath9k_htc\tAtheros Communications, Inc. AR9271\n\n"
    "\t\t(mac80211 monitor mode vif enabled for [phy0]wlan0 on [phy0]wlan0mon)\n";

const char* kScanCsv =
    "BSSID, First time seen, Last time seen, channel, Speed, Privacy, Cipher, Authentication, Power, "
    "# beacons, # IV, LAN IP, ID-length, ESSID, Key\n"
    "AA:BB:CC:DD:EE:FF, 2024-05-01 10:00:00, 2024-05-01 10:00:14,  6,  54, WPA2, CCMP, PSK, -42,"
    "       31,        4,   0.  0.  0.  0,   7, HomeNet, \n"
    "11:22:33:44:55:66, 2024-05-01 10:00:02, 2024-05-01 10:00:13, 11, 130, WPA2, CCMP, PSK, -71,"
    "        9,        0,   0.  0.  0.  0,   3, Lab, \n"
    "\n"
    "Station MAC, First time seen, Last time seen, Power, # packets, BSSID, Probed ESSIDs\n"
    "00:11:22:AA:BB:CC, 2024-05-01 10:00:03, 2024-05-01 10:00:12, -55,       40, AA:BB:CC:DD:EE:FF, HomeNet\n";

} // namespace

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.capture_dir = dir.path();
        config.capture_settle_ms = 0;
        config.terminate_grace_ms = 50;
        config.restart_network_manager = false;

        ASSERT_TRUE(database.open(dir.file("paw.db")));

        probe = std::make_unique<InterfaceProbe>(runner, Platform::LINUX);
        modes = std::make_unique<ModeController>(runner, *probe, locks, config);
        macs = std::make_unique<MacChanger>(runner, locks, config);
        sessions = std::make_unique<SessionController>(runner, locks, config);
        scanner = std::make_unique<NetworkScanner>(*sessions, config);
        dispatcher = std::make_unique<CommandDispatcher>(*probe, *modes, *macs, *sessions, *scanner, inspector,
                                                         database, output, prompt, advisor);
    }

    void TearDown() override {
        dispatcher.reset();
        sessions.reset();
    }

    std::string prefix() const {
        return dir.path() + "/capture_AABBCCDDEEFF";
    }

    TempDir dir;
    FakeCommandRunner runner;
    InterfaceLocks locks;
    Config config;
    CaptureInspector inspector;
    NetworkDatabase database;
    RecordingOutput output;
    ScriptedPrompt prompt;
    CannedAdvisor advisor;

    std::unique_ptr<InterfaceProbe> probe;
    std::unique_ptr<ModeController> modes;
    std::unique_ptr<MacChanger> macs;
    std::unique_ptr<SessionController> sessions;
    std::unique_ptr<NetworkScanner> scanner;
    std::unique_ptr<CommandDispatcher> dispatcher;
};

TEST_F(CommandDispatcherTest, DecliningMonitorModeRunsNothing) {
    runner.respond("iw dev", FakeCommandRunner::ok(kManagedWlan0));
    prompt.answer(false);

    EXPECT_TRUE(dispatcher->handleLine("capture start wlan0 aa:bb:cc:dd:ee:ff 6"));

    auto displays = output.displays();
    ASSERT_EQ(displays.size(), 1u);
    EXPECT_EQ(displays[0].title, "Capture");
    EXPECT_EQ(displays[0].text, "Operation cancelled: wlan0 is not in monitor mode.");
    ASSERT_EQ(prompt.questions().size(), 1u);
    EXPECT_EQ(prompt.questions()[0], "Interface wlan0 is not in monitor mode (managed). Enable monitor mode now?");
    EXPECT_FALSE(runner.wasCalled("airmon-ng"));
    EXPECT_TRUE(runner.spawned().empty());
    EXPECT_FALSE(sessions->isActive());
}

TEST_F(CommandDispatcherTest, AcceptingMonitorModeContinuesOnNewName) {
    runner.respond("iw dev", FakeCommandRunner::ok(kManagedWlan0));
    runner.respond("airmon-ng start wlan0", FakeCommandRunner::ok(kStartOutput));
    prompt.answer(true);

    dispatcher->handleLine("capture start wlan0 aa:bb:cc:dd:ee:ff 6");

    auto spawned = runner.spawned();
    ASSERT_EQ(spawned.size(), 1u);
    EXPECT_EQ(spawned[0], "airodump-ng -c 6 --bssid AA:BB:CC:DD:EE:FF -w " + prefix() + " wlan0mon");

    auto shown = output.last();
    EXPECT_EQ(shown.title, "Capture");
    EXPECT_NE(shown.text.find("Monitor mode enabled on wlan0mon"), std::string::npos);
    EXPECT_NE(shown.text.find("Capture started on wlan0mon"), std::string::npos);
    EXPECT_EQ(output.displays().size(), 1u);

    auto networks = database.listNetworks();
    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0].channel, 6);
}

TEST_F(CommandDispatcherTest, NoMonitorSwitchOnceShuttingDown) {
    runner.respond("iw dev", FakeCommandRunner::ok(kManagedWlan0));
    runner.respond("airmon-ng start wlan0", FakeCommandRunner::ok(kStartOutput));
    prompt.answer(true);
    sessions->terminateAll();

    dispatcher->handleLine("attack deauth wlan0 aa:bb:cc:dd:ee:ff broadcast 0");

    EXPECT_EQ(output.last().text, "Shutting down: monitor mode not enabled on wlan0");
    EXPECT_FALSE(runner.wasCalled("airmon-ng"));
    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(CommandDispatcherTest, FailedMonitorSwitchStopsTheCommand) {
    runner.respond("iw dev", FakeCommandRunner::ok(kManagedWlan0));
    runner.respond("airmon-ng start wlan0", FakeCommandRunner::failed(1, "wlan0 does not exist"));
    prompt.answer(true);

    dispatcher->handleLine("attack deauth wlan0 aa:bb:cc:dd:ee:ff");

    EXPECT_EQ(output.last().text, "Error enabling monitor mode on wlan0: wlan0 does not exist");
    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(CommandDispatcherTest, MonitorInterfaceIsNotQuestioned) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));
    runner.spawnExitedChildren(0);
    std::vector<std::string> streamed;
    dispatcher->setLineOutput([&streamed](const std::string& line) { streamed.push_back(line); });
    runner.setSpawnOutput("Sending 64 directed DeAuth (code 7). STMAC: [00:11:22:AA:BB:CC]\n");

    dispatcher->handleLine("attack deauth wlan0mon aa:bb:cc:dd:ee:ff 00:11:22:aa:bb:cc 3");

    EXPECT_TRUE(prompt.questions().empty());
    ASSERT_EQ(runner.spawned().size(), 1u);
    EXPECT_EQ(runner.spawned()[0], "aireplay-ng -0 3 -a AA:BB:CC:DD:EE:FF -c 00:11:22:AA:BB:CC wlan0mon");
    EXPECT_EQ(output.last().title, "Deauthentication Attack");
    EXPECT_EQ(output.last().text.find("Deauthentication attack completed"), 0u);
    EXPECT_EQ(streamed.size(), 1u);
}

TEST_F(CommandDispatcherTest, BroadcastDeauthUsesDefaultCount) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));
    runner.spawnExitedChildren(0);

    dispatcher->handleLine("attack deauth wlan0mon aa:bb:cc:dd:ee:ff");

    ASSERT_EQ(runner.spawned().size(), 1u);
    EXPECT_EQ(runner.spawned()[0], "aireplay-ng -0 " + std::to_string(kDefaultDeauthCount) +
                                   " -a AA:BB:CC:DD:EE:FF -c FF:FF:FF:FF:FF:FF wlan0mon");
}

TEST_F(CommandDispatcherTest, InvalidCommandInvokesNothing) {
    EXPECT_TRUE(dispatcher->handleLine("capture start wlan0mon nope 6"));

    auto displays = output.displays();
    ASSERT_EQ(displays.size(), 1u);
    EXPECT_EQ(displays[0].title, "Error");
    EXPECT_EQ(displays[0].text, "Error: invalid BSSID: nope");
    EXPECT_TRUE(runner.calls().empty());
    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(CommandDispatcherTest, EmptyLineAndExit) {
    EXPECT_TRUE(dispatcher->handleLine("   "));
    EXPECT_FALSE(dispatcher->handleLine("exit"));
    EXPECT_TRUE(output.displays().empty());
}

TEST_F(CommandDispatcherTest, EveryCommandDisplaysOnce) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));

    const std::vector<std::string> lines = {
        "interface list", "help", "capture status", "capture stop", "db", "interface check", "what now"
    };
    for (const auto& line : lines) {
        EXPECT_TRUE(dispatcher->handleLine(line));
    }

    auto displays = output.displays();
    ASSERT_EQ(displays.size(), lines.size());
    EXPECT_EQ(displays[0].title, "Wireless Interfaces");
    EXPECT_EQ(displays[1].title, "Help");
    EXPECT_EQ(displays[2].title, "Capture Status");
    EXPECT_EQ(displays[2].text, "No active capture session");
    EXPECT_EQ(displays[3].title, "Capture Stopped");
    EXPECT_EQ(displays[3].text, "No active capture session");
    EXPECT_EQ(displays[4].title, "Database");
    EXPECT_EQ(displays[4].text, "No networks in database");
    EXPECT_EQ(displays[5].title, "Interference Check");
    EXPECT_EQ(displays[6].title, "Suggestion");
    EXPECT_EQ(displays[6].text, "Unknown command: what. Type 'help' for available commands.");
    EXPECT_EQ(dispatcher->previousOutput(), displays[6].text);
}

TEST_F(CommandDispatcherTest, AdvisorSeesPreviousOutput) {
    advisor.setAdvice("Try 'capture stop' when you have the handshake.");

    dispatcher->handleLine("help");
    dispatcher->handleLine("now what?");

    ASSERT_EQ(advisor.asked().size(), 1u);
    EXPECT_EQ(advisor.asked()[0], "now what?");
    EXPECT_EQ(advisor.previous()[0], CommandParser::helpText());
    EXPECT_EQ(output.last().text, "Try 'capture stop' when you have the handshake.");
}

TEST_F(CommandDispatcherTest, StopCaptureReportsAndRecords) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));
    dispatcher->handleLine("capture start wlan0mon aa:bb:cc:dd:ee:ff 6");
    ASSERT_TRUE(sessions->isActive());
    dir.write("capture_AABBCCDDEEFF-01.cap", "not really a pcap file");

    dispatcher->handleLine("capture stop");

    auto shown = output.last();
    EXPECT_EQ(shown.title, "Capture Stopped");
    EXPECT_EQ(shown.text.find("Capture stopped. Packets saved to " + prefix() + "-01.cap"), 0u);
    EXPECT_NE(shown.text.find("Could not inspect " + prefix() + "-01.cap"), std::string::npos);

    auto captures = database.listCaptures();
    ASSERT_EQ(captures.size(), 1u);
    EXPECT_EQ(captures[0].file, prefix() + "-01.cap");
    EXPECT_EQ(captures[0].bssid, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(captures[0].sha256.size(), 64u);
    EXPECT_FALSE(captures[0].handshake);
}

TEST_F(CommandDispatcherTest, OneShotCaptureRunsUntilAirodumpExits) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));
    std::vector<std::string> lines;
    dispatcher->setLineOutput([&lines](const std::string& line) { lines.push_back(line); });

    std::thread ender([this] {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!runner.child(0) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (runner.child(0)) {
            paw::fakes::finishChild(runner.child(0), 0);
        }
    });
    dispatcher->runOnce("capture start wlan0mon aa:bb:cc:dd:ee:ff 6");
    ender.join();

    EXPECT_FALSE(sessions->isActive());
    EXPECT_EQ(runner.child(0)->terminate_calls, 0);
    ASSERT_EQ(output.displays().size(), 1u);
    EXPECT_EQ(output.displays()[0].title, "Capture");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "Capture running. Press Ctrl+C to stop it and restore the interface.");
}

TEST_F(CommandDispatcherTest, OneShotCaptureEndsOnShutdown) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));

    std::thread stopper([this] {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!sessions->isActive() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        sessions->terminateAll();
    });
    dispatcher->runOnce("capture start wlan0mon aa:bb:cc:dd:ee:ff 6");
    stopper.join();

    EXPECT_FALSE(sessions->isActive());
    EXPECT_EQ(runner.child(0)->terminate_calls, 1);
}

TEST_F(CommandDispatcherTest, OneShotCommandDoesNotWait) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));

    dispatcher->runOnce("interface list");

    ASSERT_EQ(output.displays().size(), 1u);
    EXPECT_TRUE(runner.spawned().empty());
}

TEST_F(CommandDispatcherTest, SecondCaptureIsRefused) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));
    dispatcher->handleLine("capture start wlan0mon aa:bb:cc:dd:ee:ff 6");
    dispatcher->handleLine("capture start wlan0mon 11:22:33:44:55:66 11");

    EXPECT_NE(output.last().text.find("already active"), std::string::npos);
    EXPECT_EQ(runner.spawned().size(), 1u);
}

TEST_F(CommandDispatcherTest, ScanStoresResults) {
    runner.respond("iw dev", FakeCommandRunner::ok(kMonitorWlan0mon));
    runner.spawnExitedChildren(0);
    runner.onSpawn([](const std::vector<std::string>& argv) {
        for (size_t i = 0; i + 1 < argv.size(); ++i) {
            if (argv[i] == "-w") TempDir::writeFile(argv[i + 1] + "-01.csv", kScanCsv);
        }
    });

    dispatcher->handleLine("scan networks wlan0mon 2");

    auto shown = output.last();
    EXPECT_EQ(shown.title, "Network Scan");
    EXPECT_EQ(shown.text.find("Found 2 network(s) and 1 client(s)"), 0u);
    EXPECT_NE(shown.text.find("Saved 2 network(s) to " + dir.file("paw.db")), std::string::npos);
    EXPECT_EQ(database.listNetworks().size(), 2u);
    EXPECT_EQ(database.listClients("AA:BB:CC:DD:EE:FF").size(), 1u);
}

TEST_F(CommandDispatcherTest, DatabaseCommands) {
    dispatcher->handleLine("db add aa:bb:cc:dd:ee:ff HomeNet 6");
    EXPECT_EQ(output.last().text, "Network AA:BB:CC:DD:EE:FF saved");

    dispatcher->handleLine("db networks");
    EXPECT_NE(output.last().text.find("HomeNet"), std::string::npos);

    dispatcher->handleLine("db export " + dir.file("out"));
    EXPECT_EQ(output.last().text, "Exported 1 networks to " + dir.file("out.csv"));

    dispatcher->handleLine("db remove aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(output.last().text, "Network AA:BB:CC:DD:EE:FF removed");
    dispatcher->handleLine("db remove aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(output.last().text, "Network AA:BB:CC:DD:EE:FF not found");

    dispatcher->handleLine("db captures");
    EXPECT_EQ(output.last().text, "No captures recorded");
}

TEST_F(CommandDispatcherTest, DatabaseUnavailable) {
    database.close();
    dispatcher->handleLine("db networks");
    EXPECT_EQ(output.last().title, "Database");
    EXPECT_EQ(output.last().text, "Database is not available");
}

TEST_F(CommandDispatcherTest, MacChangerCommand) {
    runner.respond("macchanger -r wlan0", FakeCommandRunner::ok("New MAC:       02:ab:cd:ef:01:23 (unknown)\n"));

    dispatcher->handleLine("macchanger wlan0");

    EXPECT_EQ(output.last().title, "MAC Address");
    EXPECT_EQ(output.last().text, "MAC address of wlan0 changed to 02:AB:CD:EF:01:23");
}

TEST_F(CommandDispatcherTest, ModeCommandsGoStraightToController) {
    runner.respond("airmon-ng start wlan0", FakeCommandRunner::ok(kStartOutput));

    dispatcher->handleLine("interface monitor wlan0");

    EXPECT_EQ(output.last().title, "Monitor Mode");
    EXPECT_EQ(output.last().text.find("Monitor mode enabled on wlan0mon"), 0u);
    EXPECT_TRUE(prompt.questions().empty());
}
