#include "curl_utils.hpp"
#include <sstream>
#include <fstream>
#include <cstdlib>

namespace duckdb {
namespace nuban {

// Request timeout for bank list downloads
static const long GET_TIMEOUT_SECONDS = 30L;

static bool FileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Configure SSL options for curl handle
static void ConfigureSSL(CURL* curl) {
#ifdef _WIN32
    // Schannel uses the Windows certificate store; revocation checks
    // often fail behind corporate proxies
    curl_easy_setopt(curl, CURLOPT_SSL_OPTIONS, CURLSSLOPT_NO_REVOKE);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Custom CA bundle (e.g. corporate proxy with its own CA)
    const char* env_ca = std::getenv("CURL_CA_BUNDLE");
    if (!env_ca) {
        env_ca = std::getenv("SSL_CERT_FILE");
    }
    if (env_ca && FileExists(env_ca)) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, env_ca);
    }

#else
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
#endif
}

// ============================================================================
// CurlHandle
// ============================================================================

CurlHandle::CurlHandle() {
    curl = curl_easy_init();
}

CurlHandle::~CurlHandle() {
    if (curl) {
        curl_easy_cleanup(curl);
    }
}

// ============================================================================
// CurlHeaders
// ============================================================================

CurlHeaders::~CurlHeaders() {
    if (headers) {
        curl_slist_free_all(headers);
    }
}

void CurlHeaders::append(const std::string& header) {
    headers = curl_slist_append(headers, header.c_str());
}

// ============================================================================
// Callback and GET function
// ============================================================================

size_t curl_write_to_string(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append((char*)contents, total_size);
    return total_size;
}

bool is_curl_error(const std::string& response) {
    return response.compare(0, 6, "ERROR:") == 0;
}

std::string curl_get(const std::string& url,
                     const CurlHeaders& headers,
                     long* http_code_out) {
    CurlHandle handle;
    if (!handle.handle()) {
        return "ERROR: Failed to initialize curl";
    }

    std::string response;

    curl_easy_setopt(handle.handle(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.handle(), CURLOPT_HTTPHEADER, headers.list());
    curl_easy_setopt(handle.handle(), CURLOPT_WRITEFUNCTION, curl_write_to_string);
    curl_easy_setopt(handle.handle(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle.handle(), CURLOPT_TIMEOUT, GET_TIMEOUT_SECONDS);
    curl_easy_setopt(handle.handle(), CURLOPT_FOLLOWLOCATION, 1L);

    ConfigureSSL(handle.handle());

    CURLcode res = curl_easy_perform(handle.handle());

    if (res != CURLE_OK) {
        std::ostringstream err;
        err << "ERROR: curl request failed: " << curl_easy_strerror(res);
        return err.str();
    }

    long http_code = 0;
    curl_easy_getinfo(handle.handle(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code_out) {
        *http_code_out = http_code;
    }

    if (http_code < 200 || http_code >= 300) {
        std::ostringstream err;
        err << "ERROR: HTTP " << http_code << " - " << response;
        return err.str();
    }

    return response;
}

} // namespace nuban
} // namespace duckdb
