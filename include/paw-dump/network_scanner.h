#ifndef PAW_NETWORK_SCANNER_H
#define PAW_NETWORK_SCANNER_H

#include <string>
#include <vector>
#include "common/types.h"
#include "paw-dump/session_controller.h"

namespace paw {

struct ScannedNetwork {
    std::string bssid;
    std::string essid;
    int channel = 0;
    std::string privacy;
    int power = 0;
};

struct ScannedClient {
    std::string mac;
    std::string bssid;   // empty when not associated
    int power = 0;
    std::string probed_essids;
};

struct ScanResult {
    bool ok = false;
    std::string message;
    std::vector<ScannedNetwork> networks;
    std::vector<ScannedClient> clients;
};

// Parses an airodump-ng CSV file: access points first, then stations
bool parseAirodumpCsv(const std::string& content, std::vector<ScannedNetwork>& networks,
                      std::vector<ScannedClient>& clients);

class NetworkScanner {
public:
    NetworkScanner(SessionController& sessions, const Config& config);

    ScanResult scan(const std::string& interface, int seconds, OutputCallback on_output = nullptr);

    static std::string formatResult(const ScanResult& result);

private:
    SessionController& sessions_;
    Config config_;
};

} // namespace paw

#endif // PAW_NETWORK_SCANNER_H
