#define DUCKDB_EXTENSION_MAIN
#include "nuban_extension.hpp"
#include "nuban_validation.hpp"
#include "bank_functions.hpp"
#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <curl/curl.h>
#include <iostream>

namespace duckdb {

void NubanExtension::Load(ExtensionLoader &loader) {
    // curl_easy_init() would do this lazily, but not thread-safely
    CURLcode curl_status = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (curl_status != CURLE_OK) {
        std::cerr << "curl_global_init failed: " << curl_easy_strerror(curl_status)
                  << ", bank list downloads will not work" << std::endl;
    }

    // Register NUBAN check digit functions
    nuban::RegisterNubanValidationFunctions(loader);

    // Register bank directory and inference functions
    nuban::RegisterBankFunctions(loader);
}

std::string NubanExtension::Name() {
    return "nuban";
}

std::string NubanExtension::Version() const {
#ifdef EXT_VERSION_NUBAN
    return EXT_VERSION_NUBAN;
#else
    return "v1.0.0";
#endif
}

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(nuban, loader) {
    duckdb::NubanExtension ext;
    ext.Load(loader);
}
}
