#include "paw-dump/capture_inspector.h"
#include "common/logger.h"
#include <pcap.h>
#include <sstream>

namespace paw {

namespace {

const uint8_t kEapolSnap[8] = {0xAA, 0xAA, 0x03, 0x00, 0x00, 0x00, 0x88, 0x8E};

// Key information bits
const uint16_t kKeyPairwise = 0x0008;
const uint16_t kKeyInstall = 0x0040;
const uint16_t kKeyAck = 0x0080;
const uint16_t kKeyMic = 0x0100;
const uint16_t kKeySecure = 0x0200;

bool frameMentions(const uint8_t* frame, size_t length, const MacAddress& bssid) {
    for (size_t offset = 4; offset + 6 <= 22 && offset + 6 <= length; offset += 6) {
        if (MacAddress(frame + offset) == bssid) {
            return true;
        }
    }
    return false;
}

} // namespace

int CaptureInspector::classifyEapol(const uint8_t* llc, size_t length) {
    // SNAP(8) + version(1) + type(1) + length(2) + descriptor(1) + key info(2)
    if (length < 15) return 0;
    for (int i = 0; i < 8; ++i) {
        if (llc[i] != kEapolSnap[i]) return 0;
    }

    const uint8_t* eapol = llc + 8;
    if (eapol[1] != 0x03) return 0;   // EAPOL-Key

    uint16_t key_info = static_cast<uint16_t>((eapol[5] << 8) | eapol[6]);
    if (!(key_info & kKeyPairwise)) return 0;   // group key handshake

    bool ack = key_info & kKeyAck;
    bool mic = key_info & kKeyMic;
    bool install = key_info & kKeyInstall;
    bool secure = key_info & kKeySecure;

    if (ack && !mic) return 1;
    if (!ack && mic && !secure) return 2;
    if (ack && mic && install) return 3;
    if (!ack && mic && secure) return 4;
    return 0;
}

void CaptureInspector::processFrame(const uint8_t* frame, size_t length, const MacAddress* filter,
                                    HandshakeReport& report) {
    if (length < 24) return;

    uint8_t fc0 = frame[0];
    uint8_t fc1 = frame[1];
    uint8_t type = (fc0 & 0x0C) >> 2;
    uint8_t subtype = (fc0 & 0xF0) >> 4;

    if (filter && !frameMentions(frame, length, *filter)) {
        return;
    }

    if (type == 0 && subtype == 8) {
        report.beacons++;
        return;
    }
    if (type != 2) return;

    size_t header_len = 24;
    bool to_ds = fc1 & 0x01;
    bool from_ds = fc1 & 0x02;
    if (to_ds && from_ds) header_len += 6;   // addr4
    if (subtype & 0x08) {
        header_len += 2;                     // QoS control
        if (fc1 & 0x80) header_len += 4;     // HT control
    }
    if (length <= header_len) return;

    int message = classifyEapol(frame + header_len, length - header_len);
    if (message > 0) {
        report.messages[message - 1]++;
    }
}

HandshakeReport CaptureInspector::inspect(const std::string& cap_file, const std::string& bssid) {
    HandshakeReport report;
    report.file = cap_file;

    MacAddress filter;
    bool use_filter = false;
    if (!bssid.empty()) {
        if (!MacAddress::parse(bssid, filter)) {
            report.error = "invalid BSSID: " + bssid;
            return report;
        }
        use_filter = true;
    }

    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_t* handle = pcap_open_offline(cap_file.c_str(), errbuf);
    if (!handle) {
        report.error = errbuf;
        Logger::getInstance().debug("Cannot open capture " + cap_file + ": " + report.error);
        return report;
    }

    int link_type = pcap_datalink(handle);
    if (link_type != DLT_IEEE802_11_RADIO && link_type != DLT_IEEE802_11) {
        report.error = "unsupported link type " + std::to_string(link_type);
        pcap_close(handle);
        return report;
    }

    struct pcap_pkthdr* header;
    const u_char* packet;
    int rc;
    while ((rc = pcap_next_ex(handle, &header, &packet)) == 1) {
        report.packets++;

        const uint8_t* frame = packet;
        size_t length = header->caplen;

        if (link_type == DLT_IEEE802_11_RADIO) {
            if (length < 4) continue;
            size_t rt_len = static_cast<size_t>(packet[2] | (packet[3] << 8));
            if (rt_len >= length) continue;
            frame += rt_len;
            length -= rt_len;
        }

        processFrame(frame, length, use_filter ? &filter : nullptr, report);
    }

    if (rc == -1) {
        report.error = pcap_geterr(handle);
    }
    pcap_close(handle);

    report.complete = (report.messages[0] && report.messages[1]) ||
                      (report.messages[1] && report.messages[2]);

    Logger::getInstance().debug("Inspected " + cap_file + ": " + std::to_string(report.packets) +
                                " packets, " + std::to_string(report.eapolFrames()) + " EAPOL frames");
    return report;
}

std::string CaptureInspector::formatReport(const HandshakeReport& report) {
    std::ostringstream out;
    if (!report.error.empty() && report.packets == 0) {
        out << "Could not inspect " << report.file << ": " << report.error;
        return out.str();
    }

    out << "Packets: " << report.packets << ", beacons: " << report.beacons
        << ", EAPOL messages: " << report.messages[0] << "/" << report.messages[1] << "/"
        << report.messages[2] << "/" << report.messages[3] << "\n";
    if (report.complete) {
        out << "WPA handshake captured";
    } else if (report.eapolFrames() > 0) {
        out << "Partial handshake only";
    } else {
        out << "No handshake captured";
    }
    return out.str();
}

} // namespace paw
