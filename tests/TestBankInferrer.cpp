#include "test.hpp"
#include "bank_inferrer.hpp"
#include "checksum/checksum_engine.hpp"

using namespace duckdb::nuban;

namespace {

std::vector<BankRecord> FixtureBanks()
{
    auto result = BankDirectory::ParseBanksJson(BANKS_FIXTURE_JSON);
    EXPECT_TRUE(result.ok()) << result.error;
    return result.banks;
}

} // namespace

TEST(TestBankInferrer, MatchesShortCode)
{
    auto matches = InferBanks("1234567895", FixtureBanks());
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].bank.name, "Access Bank");
    EXPECT_EQ(matches[0].matched_code, "044");
}

TEST(TestBankInferrer, MatchesFiveDigitShortCode)
{
    auto matches = InferBanks("1234567897", FixtureBanks());
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].bank.name, "Kuda Microfinance Bank");
    EXPECT_EQ(matches[0].matched_code, "50211");
}

TEST(TestBankInferrer, MatchesLongCodeIndependently)
{
    auto matches = InferBanks("1234567893", FixtureBanks());
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].bank.name, "Kuda Microfinance Bank");
    EXPECT_EQ(matches[0].matched_code, "12345");
}

TEST(TestBankInferrer, KeepsEveryMatchInOrder)
{
    // Consecutive matches must all survive
    std::vector<BankRecord> banks;
    banks.push_back(BankRecord("First", "044", ""));
    banks.push_back(BankRecord("Second", "044", ""));
    banks.push_back(BankRecord("Third", "058", ""));
    banks.push_back(BankRecord("Fourth", "999", "044"));

    auto matches = InferBanks("1234567895", banks);
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].bank.name, "First");
    EXPECT_EQ(matches[1].bank.name, "Second");
    EXPECT_EQ(matches[2].bank.name, "Fourth");
    EXPECT_EQ(matches[2].matched_code, "044");
}

TEST(TestBankInferrer, SkipsUnusableCodes)
{
    std::vector<BankRecord> banks;
    banks.push_back(BankRecord("Six digits", "999992", "044150149"));
    banks.push_back(BankRecord("Letters", "ABC", "04A"));
    banks.push_back(BankRecord("Empty", "", ""));

    EXPECT_NO_THROW(InferBanks("1234567895", banks));
    EXPECT_TRUE(InferBanks("1234567895", banks).empty());
}

TEST(TestBankInferrer, MalformedAccountMatchesNothing)
{
    auto banks = FixtureBanks();
    EXPECT_TRUE(InferBanks("", banks).empty());
    EXPECT_TRUE(InferBanks("123", banks).empty());
    EXPECT_TRUE(InferBanks("12345678AB", banks).empty());
}

TEST(TestBankInferrer, EveryMatchValidates)
{
    auto banks = FixtureBanks();
    for (const char* account : {"0000000000", "0000000001", "1234567895", "1234567893"}) {
        for (const auto& match : InferBanks(account, banks)) {
            EXPECT_TRUE(checksum::ChecksumEngine::Validate(account, match.matched_code)) << account;
        }
    }
}
