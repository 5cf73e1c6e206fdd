#pragma once

#include "bank_directory.hpp"
#include <string>
#include <vector>

namespace duckdb {
namespace nuban {

struct InferredBank {
    BankRecord bank;
    std::string matched_code;  // The code (short or long) that validated
};

// Banks whose short or long code validates account_number, in input order.
// Codes that are not 3 or 5 digits are skipped; a malformed account matches nothing.
std::vector<InferredBank> InferBanks(const std::string& account_number, const std::vector<BankRecord>& banks);

} // namespace nuban
} // namespace duckdb
