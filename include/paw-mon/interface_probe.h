#ifndef PAW_INTERFACE_PROBE_H
#define PAW_INTERFACE_PROBE_H

#include <string>
#include <vector>
#include "common/types.h"
#include "common/command_runner.h"

namespace paw {

class InterfaceProbe {
public:
    explicit InterfaceProbe(CommandRunner& runner);
    InterfaceProbe(CommandRunner& runner, Platform platform);
    virtual ~InterfaceProbe() = default;

    // Interface discovery. Never throws; an empty list when nothing is found
    // or every utility failed.
    virtual std::vector<Interface> listInterfaces();

    bool findInterface(const std::string& name, Interface& out);
    InterfaceMode modeOf(const std::string& name);

    void setProcNetDevPath(const std::string& path) { proc_net_dev_path_ = path; }
    void setMacchangerBinary(const std::string& binary) { macchanger_binary_ = binary; }

    // Display functions
    static std::string formatTable(const std::vector<Interface>& interfaces);

private:
    CommandRunner& runner_;
    Platform platform_;
    std::string proc_net_dev_path_;
    std::string macchanger_binary_;

    std::vector<Interface> discoverLinux();
    std::vector<Interface> discoverWindows();
    std::vector<Interface> discoverFromLinkList();

    // macchanger -s, then ifconfig, then whatever discovery already saw
    void resolveHardwareAddress(Interface& iface);
};

} // namespace paw

#endif // PAW_INTERFACE_PROBE_H
