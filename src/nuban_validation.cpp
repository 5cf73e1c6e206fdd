#include "include/nuban_validation.hpp"
#include "checksum/checksum_engine.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace nuban {

using checksum::ChecksumEngine;
using checksum::ChecksumException;

// nuban_generate(serial VARCHAR, bank_code VARCHAR) -> VARCHAR
static void NubanGenerateFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t serial, string_t bank_code) -> string_t {
            try {
                std::string nuban = ChecksumEngine::Generate(serial.GetString(), bank_code.GetString());
                return StringVector::AddString(result, nuban);
            } catch (const ChecksumException &e) {
                throw InvalidInputException("nuban_generate: %s", e.what());
            }
        });
}

// nuban_generate(serial BIGINT, bank_code VARCHAR) -> VARCHAR
static void NubanGenerateFromIntegerFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<int64_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](int64_t serial, string_t bank_code) -> string_t {
            if (serial < 0) {
                throw InvalidInputException("nuban_generate: Serial number must not be negative, got %lld",
                                            static_cast<long long>(serial));
            }
            try {
                std::string nuban = ChecksumEngine::Generate(std::to_string(serial), bank_code.GetString());
                return StringVector::AddString(result, nuban);
            } catch (const ChecksumException &e) {
                throw InvalidInputException("nuban_generate: %s", e.what());
            }
        });
}

// nuban_is_valid(account VARCHAR, bank_code VARCHAR) -> BOOLEAN
static void NubanIsValidFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, bool>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t account, string_t bank_code) -> bool {
            try {
                return ChecksumEngine::Validate(account.GetString(), bank_code.GetString());
            } catch (const ChecksumException &e) {
                throw InvalidInputException("nuban_is_valid: %s", e.what());
            }
        });
}

// nuban_validate_result(account VARCHAR, bank_code VARCHAR) -> VARCHAR
// Returns: 'OK', 'INVALID_CHECK_DIGIT', 'INVALID_LENGTH', 'INVALID_CHARACTERS', 'INVALID_BANK_CODE'
static void NubanValidateResultFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t account, string_t bank_code) -> string_t {
            auto check_result = ChecksumEngine::CheckAccount(account.GetString(), bank_code.GetString());
            return StringVector::AddString(result, checksum::CheckResultToString(check_result));
        });
}

// nuban_check_digit(serial VARCHAR, bank_code VARCHAR) -> INTEGER
static void NubanCheckDigitFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, int32_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t serial, string_t bank_code) -> int32_t {
            try {
                return static_cast<int32_t>(
                    ChecksumEngine::GenerateCheckDigit(serial.GetString(), bank_code.GetString()));
            } catch (const ChecksumException &e) {
                throw InvalidInputException("nuban_check_digit: %s", e.what());
            }
        });
}

// nuban_normalize_bank_code(bank_code VARCHAR) -> VARCHAR
static void NubanNormalizeBankCodeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t bank_code) -> string_t {
            try {
                return StringVector::AddString(result, ChecksumEngine::NormalizeBankCode(bank_code.GetString()));
            } catch (const ChecksumException &e) {
                throw InvalidInputException("nuban_normalize_bank_code: %s", e.what());
            }
        });
}

void RegisterNubanValidationFunctions(ExtensionLoader &loader) {
    // nuban_generate(serial, bank_code) - serial as text or as a non-negative integer
    ScalarFunctionSet generate_set("nuban_generate");
    generate_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                            LogicalType::VARCHAR,
                                            NubanGenerateFunction));
    generate_set.AddFunction(ScalarFunction({LogicalType::BIGINT, LogicalType::VARCHAR},
                                            LogicalType::VARCHAR,
                                            NubanGenerateFromIntegerFunction));
    loader.RegisterFunction(generate_set);

    ScalarFunctionSet is_valid_set("nuban_is_valid");
    is_valid_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                            LogicalType::BOOLEAN,
                                            NubanIsValidFunction));
    loader.RegisterFunction(is_valid_set);

    ScalarFunctionSet validate_result_set("nuban_validate_result");
    validate_result_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                                   LogicalType::VARCHAR,
                                                   NubanValidateResultFunction));
    loader.RegisterFunction(validate_result_set);

    ScalarFunctionSet check_digit_set("nuban_check_digit");
    check_digit_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                               LogicalType::INTEGER,
                                               NubanCheckDigitFunction));
    loader.RegisterFunction(check_digit_set);

    ScalarFunctionSet normalize_set("nuban_normalize_bank_code");
    normalize_set.AddFunction(ScalarFunction({LogicalType::VARCHAR},
                                             LogicalType::VARCHAR,
                                             NubanNormalizeBankCodeFunction));
    loader.RegisterFunction(normalize_set);
}

} // namespace nuban
} // namespace duckdb
