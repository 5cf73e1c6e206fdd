#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace nuban {

// Register bank directory table functions (nuban_banks, nuban_infer_banks)
// and the bank source setters
void RegisterBankFunctions(ExtensionLoader &loader);

} // namespace nuban
} // namespace duckdb
