#include "paw-lib/network_database.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>

namespace paw {

namespace {

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

} // namespace

NetworkDatabase::NetworkDatabase() : db_(nullptr), is_open_(false) {}

NetworkDatabase::~NetworkDatabase() {
    if (is_open_) {
        close();
    }
}

bool NetworkDatabase::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_open_) {
        sqlite3_close(db_);
        db_ = nullptr;
        is_open_ = false;
    }

    db_path_ = db_path;
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        Logger::getInstance().error("Cannot open database: " + getLastError());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    is_open_ = true;
    if (!createTables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        is_open_ = false;
        return false;
    }

    Logger::getInstance().info("Database opened: " + db_path);
    return true;
}

bool NetworkDatabase::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    is_open_ = false;
    return true;
}

bool NetworkDatabase::createTables() {
    std::vector<std::string> create_queries = {
        "CREATE TABLE IF NOT EXISTS networks ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "bssid TEXT UNIQUE NOT NULL,"
        "essid TEXT DEFAULT '',"
        "channel INTEGER DEFAULT 0,"
        "encryption TEXT DEFAULT '',"
        "power INTEGER DEFAULT 0,"
        "first_seen TEXT DEFAULT (datetime('now','localtime')),"
        "last_seen TEXT DEFAULT (datetime('now','localtime')),"
        "notes TEXT DEFAULT ''"
        ");",

        "CREATE TABLE IF NOT EXISTS clients ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "mac TEXT UNIQUE NOT NULL,"
        "bssid TEXT DEFAULT '',"
        "power INTEGER DEFAULT 0,"
        "probed_essids TEXT DEFAULT '',"
        "first_seen TEXT DEFAULT (datetime('now','localtime')),"
        "last_seen TEXT DEFAULT (datetime('now','localtime'))"
        ");",

        "CREATE TABLE IF NOT EXISTS captures ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "interface TEXT NOT NULL,"
        "bssid TEXT NOT NULL,"
        "channel TEXT DEFAULT '',"
        "file TEXT NOT NULL,"
        "sha256 TEXT DEFAULT '',"
        "handshake INTEGER DEFAULT 0,"
        "started_at TEXT,"
        "ended_at TEXT"
        ");",

        "CREATE INDEX IF NOT EXISTS idx_clients_bssid ON clients(bssid);",
        "CREATE INDEX IF NOT EXISTS idx_captures_bssid ON captures(bssid);"
    };

    for (const auto& query : create_queries) {
        if (!executeSQL(query)) {
            return false;
        }
    }
    return true;
}

bool NetworkDatabase::executeSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        Logger::getInstance().error("SQL error: " + error);
        if (error_msg) sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool NetworkDatabase::prepareStatement(const std::string& sql, sqlite3_stmt** stmt) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr);
    if (rc != SQLITE_OK) {
        Logger::getInstance().error("Failed to prepare statement: " + getLastError());
        return false;
    }
    return true;
}

std::string NetworkDatabase::getLastError() {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool NetworkDatabase::upsertNetwork(const NetworkRecord& network) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) return false;

    MacAddress bssid;
    if (!MacAddress::parse(network.bssid, bssid)) {
        Logger::getInstance().warning("Not storing network with invalid BSSID " + network.bssid);
        return false;
    }

    std::string sql =
        "INSERT INTO networks (bssid, essid, channel, encryption, power, notes) "
        "VALUES (?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(bssid) DO UPDATE SET "
        "essid = CASE WHEN excluded.essid != '' THEN excluded.essid ELSE essid END, "
        "channel = CASE WHEN excluded.channel != 0 THEN excluded.channel ELSE channel END, "
        "encryption = CASE WHEN excluded.encryption != '' THEN excluded.encryption ELSE encryption END, "
        "power = CASE WHEN excluded.power != 0 THEN excluded.power ELSE power END, "
        "notes = CASE WHEN excluded.notes != '' THEN excluded.notes ELSE notes END, "
        "last_seen = datetime('now','localtime');";
    sqlite3_stmt* stmt;

    if (!prepareStatement(sql, &stmt)) {
        return false;
    }

    std::string key = bssid.toString();
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, network.essid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, network.channel);
    sqlite3_bind_text(stmt, 4, network.encryption.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, network.power);
    sqlite3_bind_text(stmt, 6, network.notes.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        Logger::getInstance().error("Failed to store network " + key + ": " + getLastError());
        return false;
    }
    return true;
}

bool NetworkDatabase::upsertClient(const ClientRecord& client) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) return false;

    MacAddress mac;
    if (!MacAddress::parse(client.mac, mac)) {
        Logger::getInstance().warning("Not storing client with invalid MAC " + client.mac);
        return false;
    }

    std::string sql =
        "INSERT INTO clients (mac, bssid, power, probed_essids) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(mac) DO UPDATE SET "
        "bssid = CASE WHEN excluded.bssid != '' THEN excluded.bssid ELSE bssid END, "
        "power = CASE WHEN excluded.power != 0 THEN excluded.power ELSE power END, "
        "probed_essids = CASE WHEN excluded.probed_essids != '' THEN excluded.probed_essids "
        "ELSE probed_essids END, "
        "last_seen = datetime('now','localtime');";
    sqlite3_stmt* stmt;

    if (!prepareStatement(sql, &stmt)) {
        return false;
    }

    std::string key = mac.toString();
    std::string bssid = client.bssid.empty() ? "" : normalizeMacAddress(client.bssid);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, bssid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, client.power);
    sqlite3_bind_text(stmt, 4, client.probed_essids.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        Logger::getInstance().error("Failed to store client " + key + ": " + getLastError());
        return false;
    }
    return true;
}

bool NetworkDatabase::removeNetwork(const std::string& bssid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) return false;

    std::string sql = "DELETE FROM networks WHERE bssid = ?;";
    sqlite3_stmt* stmt;

    if (!prepareStatement(sql, &stmt)) {
        return false;
    }

    std::string key = normalizeMacAddress(bssid);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

std::vector<NetworkRecord> NetworkDatabase::listNetworks() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NetworkRecord> networks;
    if (!is_open_) return networks;

    std::string sql = "SELECT bssid, essid, channel, encryption, power, first_seen, last_seen, notes "
                      "FROM networks ORDER BY last_seen DESC, bssid;";
    sqlite3_stmt* stmt;

    if (!prepareStatement(sql, &stmt)) {
        return networks;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        NetworkRecord network;
        network.bssid = columnText(stmt, 0);
        network.essid = columnText(stmt, 1);
        network.channel = sqlite3_column_int(stmt, 2);
        network.encryption = columnText(stmt, 3);
        network.power = sqlite3_column_int(stmt, 4);
        network.first_seen = columnText(stmt, 5);
        network.last_seen = columnText(stmt, 6);
        network.notes = columnText(stmt, 7);
        networks.push_back(network);
    }

    sqlite3_finalize(stmt);
    return networks;
}

std::vector<ClientRecord> NetworkDatabase::listClients(const std::string& bssid) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientRecord> clients;
    if (!is_open_) return clients;

    std::string sql = "SELECT mac, bssid, power, probed_essids, first_seen, last_seen FROM clients";
    if (!bssid.empty()) {
        sql += " WHERE bssid = ?";
    }
    sql += " ORDER BY last_seen DESC, mac;";
    sqlite3_stmt* stmt;

    if (!prepareStatement(sql, &stmt)) {
        return clients;
    }

    std::string key = normalizeMacAddress(bssid);
    if (!bssid.empty()) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ClientRecord client;
        client.mac = columnText(stmt, 0);
        client.bssid = columnText(stmt, 1);
        client.power = sqlite3_column_int(stmt, 2);
        client.probed_essids = columnText(stmt, 3);
        client.first_seen = columnText(stmt, 4);
        client.last_seen = columnText(stmt, 5);
        clients.push_back(client);
    }

    sqlite3_finalize(stmt);
    return clients;
}

bool NetworkDatabase::recordCapture(const CaptureRecord& capture) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) return false;

    std::string sql = "INSERT INTO captures (interface, bssid, channel, file, sha256, handshake, "
                      "started_at, ended_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (!prepareStatement(sql, &stmt)) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, capture.interface_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, capture.bssid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, capture.channel.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, capture.file.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, capture.sha256.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 6, capture.handshake ? 1 : 0);
    sqlite3_bind_text(stmt, 7, capture.started_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, capture.ended_at.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        Logger::getInstance().error("Failed to record capture " + capture.file + ": " + getLastError());
        return false;
    }
    Logger::getInstance().info("Recorded capture " + capture.file);
    return true;
}

std::vector<CaptureRecord> NetworkDatabase::listCaptures() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CaptureRecord> captures;
    if (!is_open_) return captures;

    std::string sql = "SELECT id, interface, bssid, channel, file, sha256, handshake, started_at, ended_at "
                      "FROM captures ORDER BY id;";
    sqlite3_stmt* stmt;

    if (!prepareStatement(sql, &stmt)) {
        return captures;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CaptureRecord capture;
        capture.id = sqlite3_column_int64(stmt, 0);
        capture.interface_name = columnText(stmt, 1);
        capture.bssid = columnText(stmt, 2);
        capture.channel = columnText(stmt, 3);
        capture.file = columnText(stmt, 4);
        capture.sha256 = columnText(stmt, 5);
        capture.handshake = sqlite3_column_int(stmt, 6) != 0;
        capture.started_at = columnText(stmt, 7);
        capture.ended_at = columnText(stmt, 8);
        captures.push_back(capture);
    }

    sqlite3_finalize(stmt);
    return captures;
}

bool NetworkDatabase::exportCsv(const std::string& path, std::string& message) {
    std::string filename = path;
    if (!endsWith(toLower(filename), ".csv")) {
        filename += ".csv";
    }

    std::vector<NetworkRecord> networks = listNetworks();
    if (networks.empty()) {
        message = "No networks to export";
        return false;
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        message = "Error exporting to CSV: cannot write " + filename;
        Logger::getInstance().error(message);
        return false;
    }

    file << "bssid,essid,channel,encryption,power,first_seen,last_seen,notes\n";
    for (const auto& network : networks) {
        file << csvField(network.bssid) << ","
             << csvField(network.essid) << ","
             << network.channel << ","
             << csvField(network.encryption) << ","
             << network.power << ","
             << csvField(network.first_seen) << ","
             << csvField(network.last_seen) << ","
             << csvField(network.notes) << "\n";
    }

    if (!file.good()) {
        message = "Error exporting to CSV: write to " + filename + " failed";
        Logger::getInstance().error(message);
        return false;
    }

    message = "Exported " + std::to_string(networks.size()) + " networks to " + filename;
    return true;
}

std::string NetworkDatabase::sha256File(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    char buffer[65536];
    while (file) {
        file.read(buffer, sizeof(buffer));
        std::streamsize n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(n)) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    int ok = EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);
    if (ok != 1) return "";

    std::ostringstream hex;
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string NetworkDatabase::formatNetworks(const std::vector<NetworkRecord>& networks) {
    if (networks.empty()) {
        return "No networks in database";
    }

    std::ostringstream out;
    out << std::left
        << std::setw(19) << "BSSID"
        << std::setw(5) << "CH"
        << std::setw(12) << "ENC"
        << std::setw(21) << "Last seen"
        << "ESSID\n"
        << std::string(70, '-');
    for (const auto& network : networks) {
        out << "\n" << std::setw(19) << network.bssid
            << std::setw(5) << network.channel
            << std::setw(12) << (network.encryption.empty() ? "?" : network.encryption)
            << std::setw(21) << network.last_seen
            << (network.essid.empty() ? "<hidden>" : network.essid);
        if (!network.notes.empty()) {
            out << " (" << network.notes << ")";
        }
    }
    return out.str();
}

std::string NetworkDatabase::formatClients(const std::vector<ClientRecord>& clients) {
    if (clients.empty()) {
        return "No clients in database";
    }

    std::ostringstream out;
    out << std::left
        << std::setw(19) << "Client"
        << std::setw(19) << "BSSID"
        << std::setw(21) << "Last seen"
        << "Probes\n"
        << std::string(70, '-');
    for (const auto& client : clients) {
        out << "\n" << std::setw(19) << client.mac
            << std::setw(19) << (client.bssid.empty() ? "-" : client.bssid)
            << std::setw(21) << client.last_seen
            << client.probed_essids;
    }
    return out.str();
}

std::string NetworkDatabase::formatCaptures(const std::vector<CaptureRecord>& captures) {
    if (captures.empty()) {
        return "No captures recorded";
    }

    std::ostringstream out;
    for (const auto& capture : captures) {
        out << "#" << capture.id << " " << capture.bssid << " ch " << capture.channel
            << " on " << capture.interface_name << "\n"
            << "    file: " << capture.file << (capture.handshake ? " [handshake]" : "") << "\n"
            << "    " << capture.started_at << " -> " << capture.ended_at;
        if (!capture.sha256.empty()) {
            out << "\n    sha256: " << capture.sha256;
        }
        out << "\n";
    }
    std::string text = out.str();
    text.pop_back();
    return text;
}

} // namespace paw
