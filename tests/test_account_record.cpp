#include "svm/account_record.h"
#include "validation/account.h"
#include <gtest/gtest.h>
#include <sstream>

using namespace solcore::svm;
using solcore::common::Bytes;
using solcore::common::CodecErrorKind;

namespace {

const Bytes kUsdcRecord = {1, 0, 0, 0, 255, 255, 255, 255, 5, 0, 0, 0,
                           83, 79, 76, 47, 85, 83, 68, 67};

} // namespace

TEST(AccountRecordTest, ParsesFixedLayout) {
    auto parsed = AccountRecordParser::parse(kUsdcRecord);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();

    const AccountRecord& record = parsed.value();
    EXPECT_EQ(record.type_tag, 1);
    EXPECT_EQ(record.lamports, 4294967295u);
    EXPECT_EQ(record.name_length, 5);
    EXPECT_EQ(record.name, "SOL/U");
}

TEST(AccountRecordTest, BytesAfterNameAreNotRead) {
    // "SDC" follows the 5 declared name bytes and must not leak into the name
    auto parsed = AccountRecordParser::parse(kUsdcRecord);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().name.size(), 5u);
}

TEST(AccountRecordTest, ShortHeaderIsTruncated) {
    for (size_t len = 0; len < AccountRecordParser::HEADER_SIZE; ++len) {
        Bytes shorter(kUsdcRecord.begin(), kUsdcRecord.begin() + len);
        auto parsed = AccountRecordParser::parse(shorter);
        ASSERT_TRUE(parsed.is_err()) << "len=" << len;
        EXPECT_EQ(parsed.error().kind, CodecErrorKind::TruncatedInput);
        EXPECT_EQ(parsed.error().expected, AccountRecordParser::HEADER_SIZE);
        EXPECT_EQ(parsed.error().actual, len);
    }
}

TEST(AccountRecordTest, NameLengthOverrunIsTruncated) {
    Bytes record = {2, 0, 0, 0, 10, 0, 0, 0, 9, 0, 0, 0, 'a', 'b', 'c'};
    auto parsed = AccountRecordParser::parse(record);
    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().kind, CodecErrorKind::TruncatedInput);
    EXPECT_EQ(parsed.error().expected, 21u);
    EXPECT_EQ(parsed.error().actual, record.size());
    EXPECT_EQ(parsed.error().field, "name");
}

TEST(AccountRecordTest, InvalidUtf8NameIsRejected) {
    Bytes record = {1, 0, 0, 0, 1, 0, 0, 0, 2, 0, 0, 0, 0xC3, 0x28};
    auto parsed = AccountRecordParser::parse(record);
    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().kind, CodecErrorKind::InvalidEncoding);
    EXPECT_EQ(parsed.error().field, "name");
}

TEST(AccountRecordTest, EmptyNameIsAllowed) {
    Bytes record = {2, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
    auto parsed = AccountRecordParser::parse(record);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().name.empty());
}

TEST(AccountRecordTest, Utf8Validation) {
    const std::string good = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_TRUE(is_valid_utf8(reinterpret_cast<const uint8_t*>(good.data()), good.size()));

    const uint8_t overlong[] = {0xC0, 0xAF};
    EXPECT_FALSE(is_valid_utf8(overlong, sizeof(overlong)));

    const uint8_t surrogate[] = {0xED, 0xA0, 0x80};
    EXPECT_FALSE(is_valid_utf8(surrogate, sizeof(surrogate)));

    const uint8_t too_large[] = {0xF4, 0x90, 0x80, 0x80};
    EXPECT_FALSE(is_valid_utf8(too_large, sizeof(too_large)));

    const uint8_t cut_short[] = {0xE2, 0x82};
    EXPECT_FALSE(is_valid_utf8(cut_short, sizeof(cut_short)));
}

TEST(AccountRecordTest, SerializeWritesParseableRecord) {
    AccountRecord record;
    record.type_tag = 1;
    record.lamports = 4294967295u;
    record.name = "SOL/U";
    record.name_length = 5;

    auto bytes = AccountRecordParser::serialize(record);
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value(), Bytes(kUsdcRecord.begin(), kUsdcRecord.begin() + 17));

    auto reparsed = AccountRecordParser::parse(bytes.value());
    ASSERT_TRUE(reparsed.is_ok());
    EXPECT_EQ(reparsed.value(), record);
}

TEST(AccountRecordTest, SerializeRejectsOversizedName) {
    AccountRecord record;
    record.type_tag = 1;
    record.name = std::string(256, 'x');

    auto bytes = AccountRecordParser::serialize(record);
    ASSERT_TRUE(bytes.is_err());
    EXPECT_EQ(bytes.error().kind, CodecErrorKind::InvalidEncoding);
}

TEST(AccountRecordTest, UserRecordBecomesUserAccount) {
    auto parsed = AccountRecordParser::parse(kUsdcRecord);
    ASSERT_TRUE(parsed.is_ok());

    auto account = AccountRecordParser::to_account(parsed.value());
    ASSERT_TRUE(account.is_ok());
    EXPECT_EQ(account.value()->kind(), "user");
    EXPECT_EQ(account.value()->lamports(), 4294967295u);
    EXPECT_TRUE(account.value()->is_rent_exempt());

    std::ostringstream out;
    account.value()->display_info(out);
    EXPECT_EQ(out.str(), "User Account: SOL/U, Balance: 4294967295 lamports\n");
}

TEST(AccountRecordTest, ProgramRecordBecomesExecutableProgram) {
    AccountRecord record;
    record.type_tag = static_cast<uint8_t>(AccountType::Program);
    record.lamports = 5;
    record.name = "Token";
    record.name_length = 5;

    auto account = AccountRecordParser::to_account(record);
    ASSERT_TRUE(account.is_ok());
    EXPECT_EQ(account.value()->kind(), "program");
    EXPECT_EQ(account.value()->lamports(),
              solcore::validation::ProgramAccount::PROGRAM_ACCOUNT_LAMPORTS);
}

TEST(AccountRecordTest, UnknownTypeTagIsRejected) {
    AccountRecord record;
    record.type_tag = 7;

    auto account = AccountRecordParser::to_account(record);
    ASSERT_TRUE(account.is_err());
    EXPECT_EQ(account.error().kind, CodecErrorKind::InvalidEncoding);
    EXPECT_EQ(account.error().field, "type_tag");
}
