#ifndef PAW_MODE_CONTROLLER_H
#define PAW_MODE_CONTROLLER_H

#include <string>
#include "common/types.h"
#include "common/command_runner.h"
#include "common/interface_locks.h"
#include "paw-mon/interface_probe.h"

namespace paw {

enum class ModeOutcome {
    CONFIRMED,
    UNCERTAIN,
    FAILED,
    TOOL_UNAVAILABLE
};

struct ModeChangeResult {
    std::string new_name;
    std::string message;
    ModeOutcome outcome = ModeOutcome::UNCERTAIN;

    bool changed() const { return outcome == ModeOutcome::CONFIRMED || outcome == ModeOutcome::UNCERTAIN; }
};

class ModeController {
public:
    ModeController(CommandRunner& runner, InterfaceProbe& probe, InterfaceLocks& locks, const Config& config);
    virtual ~ModeController() = default;

    // Mode transitions. Neither throws; failures come back as messages.
    virtual ModeChangeResult enableMonitorMode(const std::string& interface);
    virtual ModeChangeResult setManagedMode(const std::string& interface);

    // airmon-ng check: processes that would interfere with monitor mode
    std::string checkInterference();

private:
    CommandRunner& runner_;
    InterfaceProbe& probe_;
    InterfaceLocks& locks_;
    std::string airmon_;
    bool restart_network_manager_;

    ModeChangeResult toolMissing(const std::string& interface) const;
    ModeChangeResult doEnableMonitor(const std::string& interface);
    ModeChangeResult doSetManaged(const std::string& interface);
    void restartNetworkManager();
    std::string describeAddress(const std::string& interface);
};

} // namespace paw

#endif // PAW_MODE_CONTROLLER_H
