#include "test.hpp"
#include "checksum/checksum_engine.hpp"

using namespace duckdb::nuban::checksum;

TEST(TestChecksumEngine, GenerateKnownVectors)
{
    EXPECT_EQ(ChecksumEngine::Generate("123456789", "044"), "1234567895");
    EXPECT_EQ(ChecksumEngine::Generate("123456789", "058"), "1234567896");
    EXPECT_EQ(ChecksumEngine::Generate("123456789", "12345"), "1234567893");
    EXPECT_EQ(ChecksumEngine::Generate("000000000", "044"), "0000000000");
}

TEST(TestChecksumEngine, GeneratePadsShortSerials)
{
    EXPECT_EQ(ChecksumEngine::Generate("1", "044"), "0000000017");
    EXPECT_EQ(ChecksumEngine::Generate("1", "044"), ChecksumEngine::Generate("000000001", "044"));
    EXPECT_EQ(ChecksumEngine::Generate("42", "12345"), ChecksumEngine::Generate("000000042", "12345"));
    EXPECT_EQ(ChecksumEngine::Generate("", "044"), "0000000000");
}

TEST(TestChecksumEngine, GenerateIsDeterministic)
{
    std::string first = ChecksumEngine::Generate("98765", "058");
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(ChecksumEngine::Generate("98765", "058"), first);
    }
    EXPECT_EQ(first.size(), 10u);
}

TEST(TestChecksumEngine, GenerateRejectsLongSerial)
{
    try {
        ChecksumEngine::Generate("1234567890", "044");
        FAIL() << "expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.code(), ErrorCode::SERIAL_NUMBER_TOO_LONG);
    }
}

TEST(TestChecksumEngine, GenerateRejectsNonDigitSerial)
{
    try {
        ChecksumEngine::Generate("12345678A", "044");
        FAIL() << "expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_INPUT);
    }
}

TEST(TestChecksumEngine, GenerateRejectsBadBankCode)
{
    for (const char* code : {"12", "1234", "123456", "", "04A", "1234B"}) {
        try {
            ChecksumEngine::Generate("123456789", code);
            FAIL() << "expected ChecksumException for bank code '" << code << "'";
        } catch (const ChecksumException& e) {
            EXPECT_EQ(e.code(), ErrorCode::INVALID_BANK_CODE) << code;
        }
    }

    EXPECT_NO_THROW(ChecksumEngine::Generate("123456789", "12345"));
}

TEST(TestChecksumEngine, NormalizeBankCode)
{
    EXPECT_EQ(ChecksumEngine::NormalizeBankCode("044"), "000044");
    EXPECT_EQ(ChecksumEngine::NormalizeBankCode("12345"), "912345");
    EXPECT_EQ(ChecksumEngine::NormalizeBankCode("000"), "000000");
    EXPECT_THROW(ChecksumEngine::NormalizeBankCode("0044"), ChecksumException);
}

TEST(TestChecksumEngine, IsValidBankCode)
{
    EXPECT_TRUE(ChecksumEngine::IsValidBankCode("044"));
    EXPECT_TRUE(ChecksumEngine::IsValidBankCode("50211"));
    EXPECT_FALSE(ChecksumEngine::IsValidBankCode(""));
    EXPECT_FALSE(ChecksumEngine::IsValidBankCode("44"));
    EXPECT_FALSE(ChecksumEngine::IsValidBankCode("999992"));
    EXPECT_FALSE(ChecksumEngine::IsValidBankCode("ABC"));
}

TEST(TestChecksumEngine, CheckDigit)
{
    EXPECT_EQ(ChecksumEngine::GenerateCheckDigit("123456789", "044"), 5);
    // Weighted sum of 40 leaves no remainder, so the digit wraps to 0
    EXPECT_EQ(ChecksumEngine::GenerateCheckDigit("000000000", "044"), 0);
    EXPECT_EQ(ChecksumEngine::GenerateCheckDigit("000000000", "058"), 1);
}

TEST(TestChecksumEngine, ValidateKnownVectors)
{
    EXPECT_TRUE(ChecksumEngine::Validate("1234567895", "044"));
    EXPECT_TRUE(ChecksumEngine::Validate("1234567893", "12345"));
    EXPECT_TRUE(ChecksumEngine::Validate("0000000000", "044"));
    EXPECT_FALSE(ChecksumEngine::Validate("0000000000", "058"));
    EXPECT_TRUE(ChecksumEngine::Validate("0000000001", "058"));
    EXPECT_FALSE(ChecksumEngine::Validate("1234567895", "058"));
}

TEST(TestChecksumEngine, ValidateMalformedAccountIsFalse)
{
    EXPECT_FALSE(ChecksumEngine::Validate("", "044"));
    EXPECT_FALSE(ChecksumEngine::Validate("123", "044"));
    EXPECT_FALSE(ChecksumEngine::Validate("12345678950", "044"));
    EXPECT_FALSE(ChecksumEngine::Validate("12345678 5", "044"));
    EXPECT_FALSE(ChecksumEngine::Validate("123456789X", "044"));
}

TEST(TestChecksumEngine, ValidateRejectsBadBankCode)
{
    EXPECT_THROW(ChecksumEngine::Validate("1234567895", "12"), ChecksumException);
    // Bank code is checked even when the account is malformed
    EXPECT_THROW(ChecksumEngine::Validate("", "1234"), ChecksumException);
}

TEST(TestChecksumEngine, RoundTrip)
{
    const char* codes[] = {"000", "044", "058", "999", "00000", "12345", "50211", "99999"};
    const char* serials[] = {"0", "7", "42", "123", "9999", "31337", "100200", "8765432", "12345678", "999999999"};

    for (const char* code : codes) {
        for (const char* serial : serials) {
            std::string account = ChecksumEngine::Generate(serial, code);
            EXPECT_EQ(account.size(), 10u);
            EXPECT_TRUE(ChecksumEngine::Validate(account, code)) << serial << " / " << code;
        }
    }
}

TEST(TestChecksumEngine, DetectsEverySingleDigitSubstitution)
{
    // Seed weights 3 and 7 are coprime with 10, so no substitution slips through
    const char* codes[] = {"044", "058", "12345"};
    for (const char* code : codes) {
        std::string account = ChecksumEngine::Generate("123456789", code);
        for (size_t pos = 0; pos < account.size(); pos++) {
            for (char digit = '0'; digit <= '9'; digit++) {
                if (digit == account[pos]) {
                    continue;
                }
                std::string tampered = account;
                tampered[pos] = digit;
                EXPECT_FALSE(ChecksumEngine::Validate(tampered, code)) << tampered << " / " << code;
            }
        }
    }
}

TEST(TestChecksumEngine, CheckAccountResults)
{
    EXPECT_EQ(ChecksumEngine::CheckAccount("1234567895", "044"), CheckResult::OK);
    EXPECT_EQ(ChecksumEngine::CheckAccount("1234567894", "044"), CheckResult::INVALID_CHECK_DIGIT);
    EXPECT_EQ(ChecksumEngine::CheckAccount("123", "044"), CheckResult::INVALID_LENGTH);
    EXPECT_EQ(ChecksumEngine::CheckAccount("12345678X5", "044"), CheckResult::INVALID_CHARACTERS);
    EXPECT_EQ(ChecksumEngine::CheckAccount("1234567895", "44"), CheckResult::INVALID_BANK_CODE);

    EXPECT_STREQ(CheckResultToString(CheckResult::INVALID_LENGTH), "INVALID_LENGTH");
}
