#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace nuban {

// Register NUBAN generation and validation scalar functions
void RegisterNubanValidationFunctions(ExtensionLoader &loader);

} // namespace nuban
} // namespace duckdb
