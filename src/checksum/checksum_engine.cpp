#include "checksum_engine.hpp"
#include <algorithm>
#include <cctype>

namespace duckdb {
namespace nuban {
namespace checksum {

namespace {

// Weights applied position by position to the 15-digit cipher
constexpr const char SEED[] = "373373373373373";
constexpr size_t SEED_LENGTH = sizeof(SEED) - 1;

constexpr size_t SERIAL_NUMBER_LENGTH = 9;
constexpr size_t NUBAN_LENGTH = 10;
constexpr size_t NORMALIZED_BANK_CODE_LENGTH = 6;

constexpr size_t SHORT_BANK_CODE_LENGTH = 3;
constexpr size_t LONG_BANK_CODE_LENGTH = 5;

} // namespace

const char* CheckResultToString(CheckResult result) {
    switch (result) {
        case CheckResult::OK:
            return "OK";
        case CheckResult::INVALID_CHECK_DIGIT:
            return "INVALID_CHECK_DIGIT";
        case CheckResult::INVALID_LENGTH:
            return "INVALID_LENGTH";
        case CheckResult::INVALID_CHARACTERS:
            return "INVALID_CHARACTERS";
        case CheckResult::INVALID_BANK_CODE:
            return "INVALID_BANK_CODE";
        default:
            return "UNKNOWN";
    }
}

bool ChecksumEngine::IsAllDigits(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

bool ChecksumEngine::IsValidBankCode(const std::string& bank_code) {
    if (bank_code.length() != SHORT_BANK_CODE_LENGTH && bank_code.length() != LONG_BANK_CODE_LENGTH) {
        return false;
    }
    return IsAllDigits(bank_code);
}

std::string ChecksumEngine::NormalizeBankCode(const std::string& bank_code) {
    if (!IsValidBankCode(bank_code)) {
        throw ChecksumException(ErrorCode::INVALID_BANK_CODE,
                                "Bank code must be either 3 or 5 digits, got '" + bank_code + "'");
    }

    // Short and long codes land in disjoint 6-digit ranges
    char pad = (bank_code.length() == SHORT_BANK_CODE_LENGTH) ? '0' : '9';
    return std::string(NORMALIZED_BANK_CODE_LENGTH - bank_code.length(), pad) + bank_code;
}

int ChecksumEngine::GenerateCheckDigit(const std::string& serial_number, const std::string& bank_code) {
    if (serial_number.length() > SERIAL_NUMBER_LENGTH) {
        throw ChecksumException(ErrorCode::SERIAL_NUMBER_TOO_LONG,
                                "Serial number should be at most 9 digits long, got " +
                                std::to_string(serial_number.length()));
    }
    if (!IsAllDigits(serial_number)) {
        throw ChecksumException(ErrorCode::INVALID_INPUT,
                                "Serial number must contain only digits, got '" + serial_number + "'");
    }

    std::string cipher = NormalizeBankCode(bank_code) +
                         std::string(SERIAL_NUMBER_LENGTH - serial_number.length(), '0') + serial_number;

    int sum = 0;
    for (size_t i = 0; i < SEED_LENGTH; i++) {
        sum += (cipher[i] - '0') * (SEED[i] - '0');
    }

    int check_digit = 10 - (sum % 10);
    return (check_digit == 10) ? 0 : check_digit;
}

std::string ChecksumEngine::Generate(const std::string& serial_number, const std::string& bank_code) {
    int check_digit = GenerateCheckDigit(serial_number, bank_code);

    std::string nuban(SERIAL_NUMBER_LENGTH - serial_number.length(), '0');
    nuban += serial_number;
    nuban += static_cast<char>('0' + check_digit);
    return nuban;
}

CheckResult ChecksumEngine::CheckAccount(const std::string& account_number, const std::string& bank_code) {
    if (!IsValidBankCode(bank_code)) {
        return CheckResult::INVALID_BANK_CODE;
    }
    if (account_number.length() != NUBAN_LENGTH) {
        return CheckResult::INVALID_LENGTH;
    }
    if (!IsAllDigits(account_number)) {
        return CheckResult::INVALID_CHARACTERS;
    }

    int check_digit = GenerateCheckDigit(account_number.substr(0, SERIAL_NUMBER_LENGTH), bank_code);
    int expected = account_number[NUBAN_LENGTH - 1] - '0';

    return (check_digit == expected) ? CheckResult::OK : CheckResult::INVALID_CHECK_DIGIT;
}

bool ChecksumEngine::Validate(const std::string& account_number, const std::string& bank_code) {
    auto result = CheckAccount(account_number, bank_code);

    // Bank code errors propagate; everything else about the account is a plain "no"
    if (result == CheckResult::INVALID_BANK_CODE) {
        throw ChecksumException(ErrorCode::INVALID_BANK_CODE,
                                "Bank code must be either 3 or 5 digits, got '" + bank_code + "'");
    }
    return result == CheckResult::OK;
}

} // namespace checksum
} // namespace nuban
} // namespace duckdb
