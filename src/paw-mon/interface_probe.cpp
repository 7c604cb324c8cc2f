#include "paw-mon/interface_probe.h"
#include "paw-mon/probe_parsers.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <fstream>
#include <sstream>
#include <iomanip>

namespace paw {

InterfaceProbe::InterfaceProbe(CommandRunner& runner)
    : InterfaceProbe(runner, currentPlatform()) {
}

InterfaceProbe::InterfaceProbe(CommandRunner& runner, Platform platform)
    : runner_(runner), platform_(platform),
      proc_net_dev_path_("/proc/net/dev"), macchanger_binary_("macchanger") {
}

std::vector<Interface> InterfaceProbe::listInterfaces() {
    std::vector<Interface> interfaces;

    try {
        if (platform_ == Platform::WINDOWS) {
            interfaces = discoverWindows();
        } else {
            interfaces = discoverLinux();
            for (auto& iface : interfaces) {
                resolveHardwareAddress(iface);
            }
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warning(std::string("Couldn't get wireless interfaces: ") + e.what());
        interfaces.clear();
    }

    Logger::getInstance().debug("Discovered " + std::to_string(interfaces.size()) + " wireless interface(s)");
    return interfaces;
}

std::vector<Interface> InterfaceProbe::discoverLinux() {
    CommandResult iw = runner_.run({"iw", "dev"});
    if (iw.succeeded()) {
        auto interfaces = parseIwDev(iw.output);
        if (!interfaces.empty()) {
            return interfaces;
        }
        Logger::getInstance().debug("iw dev reported no interfaces, falling back to link list");
    } else {
        Logger::getInstance().debug("iw dev failed: " + trim(iw.error));
    }

    return discoverFromLinkList();
}

std::vector<Interface> InterfaceProbe::discoverFromLinkList() {
    CommandResult ip = runner_.run({"ip", "link", "show"});
    if (ip.succeeded()) {
        return parseIpLink(ip.output);
    }
    Logger::getInstance().debug("ip link show failed: " + trim(ip.error));

    std::ifstream file(proc_net_dev_path_);
    if (!file.is_open()) {
        Logger::getInstance().warning("Couldn't get wireless interfaces: no discovery utility succeeded");
        return {};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseProcNetDev(buffer.str());
}

std::vector<Interface> InterfaceProbe::discoverWindows() {
    CommandResult netsh = runner_.run({"netsh", "wlan", "show", "interfaces"});
    if (!netsh.succeeded()) {
        Logger::getInstance().warning("netsh wlan show interfaces failed: " + trim(netsh.error));
        return {};
    }
    return parseNetshInterfaces(netsh.output);
}

void InterfaceProbe::resolveHardwareAddress(Interface& iface) {
    CommandResult mc = runner_.run({macchanger_binary_, "-s", iface.name});
    if (mc.succeeded()) {
        std::string current;
        std::string permanent;
        if (parseMacchangerShow(mc.output, current, permanent)) {
            iface.hardware_address = current;
            iface.permanent_address = permanent;
            return;
        }
    }

    CommandResult ifc = runner_.run({"ifconfig", iface.name});
    if (ifc.succeeded()) {
        std::string mac = parseIfconfigAddress(ifc.output);
        if (!mac.empty()) {
            iface.hardware_address = mac;
            return;
        }
    }

    // Keep the address discovery saw, if any; absence is not an error
}

bool InterfaceProbe::findInterface(const std::string& name, Interface& out) {
    for (const auto& iface : listInterfaces()) {
        if (iface.name == name) {
            out = iface;
            return true;
        }
    }
    return false;
}

InterfaceMode InterfaceProbe::modeOf(const std::string& name) {
    Interface iface;
    if (findInterface(name, iface)) {
        return iface.mode;
    }
    return InterfaceMode::UNKNOWN;
}

std::string InterfaceProbe::formatTable(const std::vector<Interface>& interfaces) {
    if (interfaces.empty()) {
        return "No wireless interfaces found.";
    }

    std::ostringstream out;
    out << std::left;
    out << std::setw(16) << "Interface"
        << std::setw(10) << "Mode"
        << std::setw(20) << "MAC Address"
        << "Note\n";
    out << std::string(60, '-') << "\n";

    for (const auto& iface : interfaces) {
        std::string note;
        if (!iface.permanent_address.empty() && !iface.hardware_address.empty() &&
            iface.permanent_address != iface.hardware_address) {
            note = "changed (permanent " + iface.permanent_address + ")";
        }
        out << std::setw(16) << iface.name
            << std::setw(10) << modeToString(iface.mode)
            << std::setw(20) << (iface.hardware_address.empty() ? "Unknown" : iface.hardware_address)
            << note << "\n";
    }

    std::string text = out.str();
    if (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

} // namespace paw
