#ifndef PAW_COMMAND_DISPATCHER_H
#define PAW_COMMAND_DISPATCHER_H

#include <string>
#include <mutex>
#include "paw-suite/command_parser.h"
#include "paw-suite/console.h"
#include "paw-mon/interface_probe.h"
#include "paw-mon/mode_controller.h"
#include "paw-mon/mac_changer.h"
#include "paw-dump/session_controller.h"
#include "paw-dump/network_scanner.h"
#include "paw-dump/capture_inspector.h"
#include "paw-lib/network_database.h"

namespace paw {

struct DispatchResult {
    std::string text;
    std::string title;
    bool exit_requested = false;
};

class CommandDispatcher {
public:
    CommandDispatcher(InterfaceProbe& probe, ModeController& modes, MacChanger& macs,
                      SessionController& sessions, NetworkScanner& scanner, CaptureInspector& inspector,
                      NetworkDatabase& database, OutputSink& output, ConfirmationPrompt& prompt,
                      KeywordAdvisor& advisor);
    ~CommandDispatcher();

    // Parses and runs one line, writing exactly one titled result to the
    // output sink. Returns false once the user asked to exit.
    bool handleLine(const std::string& line);

    // One-shot mode: runs a single line. A capture it started keeps running
    // until airodump-ng exits or a signal shuts paw down.
    void runOnce(const std::string& line);

    DispatchResult dispatch(const ParsedCommand& command);

    // Receives tool output line by line while an attack or scan runs
    void setLineOutput(OutputCallback on_line) { on_line_ = on_line; }

    const std::string& previousOutput() const { return previous_output_; }

private:
    InterfaceProbe& probe_;
    ModeController& modes_;
    MacChanger& macs_;
    SessionController& sessions_;
    NetworkScanner& scanner_;
    CaptureInspector& inspector_;
    NetworkDatabase& database_;
    OutputSink& output_;
    ConfirmationPrompt& prompt_;
    KeywordAdvisor& advisor_;
    CommandParser parser_;
    OutputCallback on_line_;
    std::string previous_output_;

    std::mutex report_mutex_;
    HandshakeReport last_report_;

    // Asks before switching; interface is updated to the post-switch name
    bool ensureMonitorMode(std::string& interface, std::string& notes, std::string& error);

    void onCaptureFinished(const SessionSummary& summary);

    DispatchResult listInterfaces();
    DispatchResult setMonitorMode(const ParsedCommand& command);
    DispatchResult setManagedMode(const ParsedCommand& command);
    DispatchResult scanNetworks(const ParsedCommand& command);
    DispatchResult startCapture(const ParsedCommand& command);
    DispatchResult stopCapture();
    DispatchResult deauthAttack(const ParsedCommand& command);
    DispatchResult changeMac(const ParsedCommand& command);
    DispatchResult database(const ParsedCommand& command);
    DispatchResult unknown(const ParsedCommand& command);
};

} // namespace paw

#endif // PAW_COMMAND_DISPATCHER_H
