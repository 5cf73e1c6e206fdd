#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace duckdb {
namespace nuban {

// One institution from the bank list
struct BankRecord {
    std::string name;
    std::string code;       // Short (CBN) code, usually 3 digits
    std::string long_code;  // Longer code; only 5-digit values are usable for NUBAN

    BankRecord() {}
    BankRecord(const std::string& name_p, const std::string& code_p, const std::string& long_code_p)
        : name(name_p), code(code_p), long_code(long_code_p) {}
};

enum class BankListStatus {
    OK,
    FETCH_FAILED,  // Network, HTTP or file read error
    PARSE_FAILED   // Document is not a JSON array of objects
};

struct BankListResult {
    BankListStatus status = BankListStatus::OK;
    std::string error;
    std::vector<BankRecord> banks;

    bool ok() const { return status == BankListStatus::OK; }
};

const char* BankListStatusToString(BankListStatus status);

// Process-wide bank list, loaded lazily from a URL or local file
class BankDirectory {
public:
    static BankDirectory& GetInstance();

    // Returns the cached list, loading it on first use.
    // Failed loads are not cached.
    BankListResult ListBanks();

    // Configurable source (http(s) URL, file:// URL or plain path)
    void SetSource(const std::string& source);
    std::string GetSource() const;

    // Drop the in-memory list so the next ListBanks() reloads it
    void Reset();

    // Parse a JSON array of bank objects
    static BankListResult ParseBanksJson(const std::string& json);

    // Fetch and parse from an explicit source, bypassing the cache
    static BankListResult LoadFromSource(const std::string& source);

private:
    BankDirectory();
    BankDirectory(const BankDirectory&) = delete;
    BankDirectory& operator=(const BankDirectory&) = delete;

    static bool IsHttpSource(const std::string& source);
    static BankListResult FetchHttp(const std::string& url);
    static BankListResult ReadFile(const std::string& path);

    mutable std::mutex lock_;
    std::string source_;
    std::vector<BankRecord> banks_;
    bool loaded_ = false;
};

} // namespace nuban
} // namespace duckdb
