#ifndef PAW_NETWORK_DATABASE_H
#define PAW_NETWORK_DATABASE_H

#include <string>
#include <vector>
#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include "common/types.h"

namespace paw {

struct NetworkRecord {
    std::string bssid;
    std::string essid;
    int channel = 0;
    std::string encryption;
    int power = 0;
    std::string first_seen;
    std::string last_seen;
    std::string notes;
};

struct ClientRecord {
    std::string mac;
    std::string bssid;
    int power = 0;
    std::string probed_essids;
    std::string first_seen;
    std::string last_seen;
};

struct CaptureRecord {
    int64_t id = 0;
    std::string interface_name;
    std::string bssid;
    std::string channel;
    std::string file;
    std::string sha256;
    bool handshake = false;
    std::string started_at;
    std::string ended_at;
};

class NetworkDatabase {
public:
    NetworkDatabase();
    ~NetworkDatabase();

    // Database management
    bool open(const std::string& db_path);
    bool close();
    bool isOpen() const { return is_open_; }
    const std::string& path() const { return db_path_; }

    // Networks and clients; empty fields never overwrite stored values
    bool upsertNetwork(const NetworkRecord& network);
    bool upsertClient(const ClientRecord& client);
    bool removeNetwork(const std::string& bssid);
    std::vector<NetworkRecord> listNetworks();
    std::vector<ClientRecord> listClients(const std::string& bssid = "");

    // Capture ledger
    bool recordCapture(const CaptureRecord& capture);
    std::vector<CaptureRecord> listCaptures();

    // Writes all networks as CSV; ".csv" is appended when missing
    bool exportCsv(const std::string& path, std::string& message);

    // Hex SHA-256 of a file, empty when it cannot be read
    static std::string sha256File(const std::string& path);

    // Display functions
    static std::string formatNetworks(const std::vector<NetworkRecord>& networks);
    static std::string formatClients(const std::vector<ClientRecord>& clients);
    static std::string formatCaptures(const std::vector<CaptureRecord>& captures);

private:
    sqlite3* db_;
    std::string db_path_;
    bool is_open_;
    std::mutex mutex_;

    bool createTables();
    bool executeSQL(const std::string& sql);
    bool prepareStatement(const std::string& sql, sqlite3_stmt** stmt);
    std::string getLastError();
};

} // namespace paw

#endif // PAW_NETWORK_DATABASE_H
