#include "bank_directory.hpp"
#include "curl_utils.hpp"
#include "yyjson.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <cstdlib>

namespace duckdb {
namespace nuban {

using namespace duckdb_yyjson; // NOLINT

static const char* const DEFAULT_BANK_SOURCE =
    "https://raw.githubusercontent.com/Chidiebube-Onah/BanksInNigeria/main/BanksInNigeria.min.json";

const char* BankListStatusToString(BankListStatus status) {
    switch (status) {
        case BankListStatus::OK:
            return "OK";
        case BankListStatus::FETCH_FAILED:
            return "FETCH_FAILED";
        case BankListStatus::PARSE_FAILED:
            return "PARSE_FAILED";
        default:
            return "UNKNOWN";
    }
}

namespace {

// Reads name/code/longcode from one bank object. Numbers arrive as raw
// literal text, null and missing keys become "".
bool ReadBankField(yyjson_val *obj, const char *key, std::string &out, std::string &error) {
    yyjson_val *val = yyjson_obj_get(obj, key);
    if (!val || yyjson_is_null(val)) {
        out.clear();
        return true;
    }
    if (yyjson_is_str(val)) {
        out.assign(yyjson_get_str(val), yyjson_get_len(val));
        return true;
    }
    if (yyjson_is_raw(val)) {
        out.assign(yyjson_get_raw(val), yyjson_get_len(val));
        return true;
    }
    error = std::string("'") + key + "' must be a string, number or null";
    return false;
}

} // namespace

BankDirectory::BankDirectory() : source_(DEFAULT_BANK_SOURCE) {
    const char* env_source = std::getenv("NUBAN_BANK_SOURCE");
    if (env_source && *env_source) {
        source_ = env_source;
    }
}

BankDirectory& BankDirectory::GetInstance() {
    static BankDirectory instance;
    return instance;
}

void BankDirectory::SetSource(const std::string& source) {
    std::lock_guard<std::mutex> guard(lock_);
    if (source != source_) {
        source_ = source;
        banks_.clear();
        loaded_ = false;
    }
}

std::string BankDirectory::GetSource() const {
    std::lock_guard<std::mutex> guard(lock_);
    return source_;
}

void BankDirectory::Reset() {
    std::lock_guard<std::mutex> guard(lock_);
    banks_.clear();
    loaded_ = false;
}

BankListResult BankDirectory::ListBanks() {
    std::string source;
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (loaded_) {
            BankListResult cached;
            cached.banks = banks_;
            return cached;
        }
        source = source_;
    }

    // Fetch outside the lock so GetSource/SetSource stay responsive
    BankListResult result = LoadFromSource(source);
    if (result.ok()) {
        std::lock_guard<std::mutex> guard(lock_);
        // Source changed mid-load: the list belongs to the old source
        if (source == source_) {
            banks_ = result.banks;
            loaded_ = true;
        }
    }
    return result;
}

BankListResult BankDirectory::ParseBanksJson(const std::string& json) {
    BankListResult result;

    yyjson_read_err err;
    yyjson_doc *doc = yyjson_read_opts(const_cast<char *>(json.c_str()), json.length(),
                                       YYJSON_READ_NUMBER_AS_RAW, nullptr, &err);
    if (!doc) {
        result.status = BankListStatus::PARSE_FAILED;
        result.error = std::string("Invalid bank list JSON: ") + err.msg + " at position " +
                       std::to_string(err.pos);
        return result;
    }

    yyjson_val *root = yyjson_doc_get_root(doc);
    std::string error;
    if (!yyjson_is_arr(root)) {
        error = "expected an array of bank objects";
    } else {
        size_t idx = 0;
        yyjson_arr_iter iter;
        yyjson_arr_iter_init(root, &iter);
        yyjson_val *item;
        while (error.empty() && (item = yyjson_arr_iter_next(&iter))) {
            if (!yyjson_is_obj(item)) {
                error = "element " + std::to_string(idx) + " is not an object";
                break;
            }
            BankRecord bank;
            if (ReadBankField(item, "name", bank.name, error) &&
                ReadBankField(item, "code", bank.code, error) &&
                ReadBankField(item, "longcode", bank.long_code, error)) {
                result.banks.push_back(bank);
            } else {
                error = "element " + std::to_string(idx) + ": " + error;
            }
            idx++;
        }
    }
    yyjson_doc_free(doc);

    if (!error.empty()) {
        result.status = BankListStatus::PARSE_FAILED;
        result.error = "Invalid bank list JSON: " + error;
        result.banks.clear();
    }
    return result;
}

bool BankDirectory::IsHttpSource(const std::string& source) {
    return source.compare(0, 7, "http://") == 0 || source.compare(0, 8, "https://") == 0;
}

BankListResult BankDirectory::FetchHttp(const std::string& url) {
    BankListResult result;

    CurlHeaders headers;
    headers.append("Accept: application/json");

    long http_code = 0;
    std::string body = curl_get(url, headers, &http_code);
    if (is_curl_error(body)) {
        result.status = BankListStatus::FETCH_FAILED;
        result.error = body.substr(7);
        return result;
    }

    return ParseBanksJson(body);
}

BankListResult BankDirectory::ReadFile(const std::string& path) {
    BankListResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.status = BankListStatus::FETCH_FAILED;
        result.error = "Failed to open bank list file: " + path;
        return result;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return ParseBanksJson(contents.str());
}

BankListResult BankDirectory::LoadFromSource(const std::string& source) {
    std::cout << "Loading bank list from " << source << "..." << std::endl;

    BankListResult result;
    if (IsHttpSource(source)) {
        result = FetchHttp(source);
    } else if (source.compare(0, 7, "file://") == 0) {
        result = ReadFile(source.substr(7));
    } else {
        result = ReadFile(source);
    }

    if (result.ok()) {
        std::cout << "Loaded " << result.banks.size() << " banks" << std::endl;
    } else {
        std::cerr << "Failed to load bank list (" << BankListStatusToString(result.status)
                  << "): " << result.error << std::endl;
    }
    return result;
}

} // namespace nuban
} // namespace duckdb
