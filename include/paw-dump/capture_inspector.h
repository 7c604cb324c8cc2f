#ifndef PAW_CAPTURE_INSPECTOR_H
#define PAW_CAPTURE_INSPECTOR_H

#include <string>
#include <cstdint>
#include <cstddef>
#include "common/types.h"

namespace paw {

struct HandshakeReport {
    std::string file;
    uint64_t packets = 0;
    uint64_t beacons = 0;
    uint64_t messages[4] = {0, 0, 0, 0};   // EAPOL-Key messages 1..4
    bool complete = false;
    std::string error;

    uint64_t eapolFrames() const { return messages[0] + messages[1] + messages[2] + messages[3]; }
};

// Reads an airodump-ng capture offline and looks for the WPA four-way handshake
class CaptureInspector {
public:
    CaptureInspector() = default;

    // bssid may be empty to count every network in the file
    HandshakeReport inspect(const std::string& cap_file, const std::string& bssid = "");

    static std::string formatReport(const HandshakeReport& report);

    // 1..4 for an EAPOL-Key frame body starting at the LLC header, 0 otherwise
    static int classifyEapol(const uint8_t* llc, size_t length);

private:
    void processFrame(const uint8_t* frame, size_t length, const MacAddress* filter, HandshakeReport& report);
};

} // namespace paw

#endif // PAW_CAPTURE_INSPECTOR_H
