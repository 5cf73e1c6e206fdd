#pragma once

#include <string>
#include <stdexcept>

namespace duckdb {
namespace nuban {
namespace checksum {

// Error codes raised by Generate / Validate
enum class ErrorCode {
    INVALID_BANK_CODE,      // Bank code is not 3 or 5 digits
    SERIAL_NUMBER_TOO_LONG, // Serial number exceeds 9 digits
    INVALID_INPUT           // Serial number contains non-digit characters
};

class ChecksumException : public std::runtime_error {
public:
    ChecksumException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Detailed verdict for an account number
enum class CheckResult {
    OK = 1,                   // Check digit matches
    INVALID_CHECK_DIGIT = 0,  // Well-formed, but check digit does not match
    INVALID_LENGTH = -1,      // Account number is not 10 characters
    INVALID_CHARACTERS = -2,  // Account number contains non-digits
    INVALID_BANK_CODE = -3    // Bank code is not 3 or 5 digits
};

const char* CheckResultToString(CheckResult result);

// NUBAN check digit computation
// Based on CBN revised standard for NUBAN (2020)
class ChecksumEngine {
public:
    // Builds a 10-digit account number: padded serial + check digit.
    // Throws ChecksumException on a bad serial number or bank code.
    static std::string Generate(const std::string& serial_number, const std::string& bank_code);

    // True if the last digit of account_number is the check digit for its
    // first 9 digits under bank_code. Malformed account numbers yield false;
    // only a malformed bank code throws.
    static bool Validate(const std::string& account_number, const std::string& bank_code);

    // Non-throwing variant of Validate with a detailed result
    static CheckResult CheckAccount(const std::string& account_number, const std::string& bank_code);

    static int GenerateCheckDigit(const std::string& serial_number, const std::string& bank_code);

    // 3-digit codes are padded with '0', 5-digit codes with '9', to 6 digits
    static std::string NormalizeBankCode(const std::string& bank_code);

    static bool IsValidBankCode(const std::string& bank_code);

private:
    static bool IsAllDigits(const std::string& value);
};

} // namespace checksum
} // namespace nuban
} // namespace duckdb
