#include "bank_inferrer.hpp"
#include "checksum/checksum_engine.hpp"

namespace duckdb {
namespace nuban {

using checksum::ChecksumEngine;

static bool MatchesCode(const std::string& account_number, const std::string& code) {
    return ChecksumEngine::IsValidBankCode(code) && ChecksumEngine::Validate(account_number, code);
}

std::vector<InferredBank> InferBanks(const std::string& account_number, const std::vector<BankRecord>& banks) {
    std::vector<InferredBank> matches;

    for (const auto& bank : banks) {
        InferredBank inferred;
        if (MatchesCode(account_number, bank.code)) {
            inferred.matched_code = bank.code;
        } else if (MatchesCode(account_number, bank.long_code)) {
            inferred.matched_code = bank.long_code;
        } else {
            continue;
        }
        inferred.bank = bank;
        matches.push_back(inferred);
    }

    return matches;
}

} // namespace nuban
} // namespace duckdb
