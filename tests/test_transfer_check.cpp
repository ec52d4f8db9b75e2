#include "svm/transfer_check.h"
#include <gtest/gtest.h>
#include <limits>

using namespace solcore::svm;
using solcore::common::CompositeError;
using solcore::common::DomainError;

class TransferCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(directory_.add("alice", 1, 1000));
        ASSERT_TRUE(directory_.add("bob", 2, 50));
    }

    TransferRequest request(const std::string& from, const std::string& to,
                            Lamports amount, const std::string& signer) const {
        TransferRequest req;
        req.from = from;
        req.to = to;
        req.amount = amount;
        req.signer = signer;
        return req;
    }

    AccountDirectory directory_;
};

TEST_F(TransferCheckTest, ValidTransferProducesReceipt) {
    auto result = transfer_tokens(directory_, request("alice", "bob", 100, "alice"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().tx_id, "tx-alice-bob-100");
    EXPECT_EQ(result.value().source_balance_after, 900u);
    EXPECT_EQ(result.value().destination_balance_after, 150u);
}

TEST_F(TransferCheckTest, DirectoryIsNotMutated) {
    ASSERT_TRUE(transfer_tokens(directory_, request("alice", "bob", 100, "alice")).is_ok());
    EXPECT_EQ(directory_.find_account("alice")->balance, 1000u);
    EXPECT_EQ(directory_.find_account("bob")->balance, 50u);
}

TEST_F(TransferCheckTest, ExactBalanceIsAllowed) {
    auto result = transfer_tokens(directory_, request("bob", "alice", 50, "bob"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().source_balance_after, 0u);
}

TEST_F(TransferCheckTest, EachFailureMapsToItsDomainError) {
    EXPECT_EQ(transfer_tokens(directory_, request("zed", "bob", 10, "zed")).error(),
              DomainError::AccountNotFound);
    EXPECT_EQ(transfer_tokens(directory_, request("alice", "zed", 10, "alice")).error(),
              DomainError::AccountNotFound);
    EXPECT_EQ(transfer_tokens(directory_, request("alice", "bob", 10, "bob")).error(),
              DomainError::UnauthorizedSigner);
    EXPECT_EQ(transfer_tokens(directory_, request("alice", "bob", 0, "alice")).error(),
              DomainError::InvalidAmount);
    EXPECT_EQ(transfer_tokens(directory_, request("bob", "alice", 51, "bob")).error(),
              DomainError::InsufficientBalance);
}

TEST_F(TransferCheckTest, ChecksRunInFixedOrder) {
    // Missing destination is reported before the bad signer and zero amount
    auto missing = transfer_tokens(directory_, request("alice", "zed", 0, "mallory"));
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error(), DomainError::AccountNotFound);

    // Bad signer is reported before the overdraft
    auto unauthorized = transfer_tokens(directory_, request("bob", "alice", 9999, "alice"));
    ASSERT_TRUE(unauthorized.is_err());
    EXPECT_EQ(unauthorized.error(), DomainError::UnauthorizedSigner);
}

TEST_F(TransferCheckTest, SelfTransferKeepsBalance) {
    auto result = transfer_tokens(directory_, request("alice", "alice", 10, "alice"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().source_balance_after, 1000u);
    EXPECT_EQ(result.value().destination_balance_after, 1000u);
}

TEST_F(TransferCheckTest, ProcessTransferWrapsDomainErrors) {
    auto result = process_transfer(directory_, request("bob", "alice", 51, "bob"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind(), CompositeError::Kind::Domain);
    EXPECT_EQ(result.error().domain_error(), DomainError::InsufficientBalance);

    auto ok = process_transfer(directory_, request("alice", "bob", 1, "alice"));
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().tx_id, "tx-alice-bob-1");
}

TEST(TransferOverflowTest, DestinationBalanceOverflowIsRejected) {
    constexpr Lamports kMax = std::numeric_limits<Lamports>::max();

    AccountDirectory directory;
    ASSERT_TRUE(directory.add("alice", 1, 1000));
    ASSERT_TRUE(directory.add("bob", 2, kMax));
    ASSERT_TRUE(directory.add("carol", 3, kMax - 5));

    TransferRequest req;
    req.from = "alice";
    req.to = "bob";
    req.amount = 5;
    req.signer = "alice";

    auto overflow = transfer_tokens(directory, req);
    ASSERT_TRUE(overflow.is_err());
    EXPECT_EQ(overflow.error(), DomainError::InvalidAmount);

    // Landing exactly on the maximum is still allowed
    req.to = "carol";
    auto exact = transfer_tokens(directory, req);
    ASSERT_TRUE(exact.is_ok());
    EXPECT_EQ(exact.value().destination_balance_after, kMax);
    EXPECT_EQ(exact.value().source_balance_after, 995u);
}

TEST(TransferOverflowTest, SelfTransferAtMaximumBalance) {
    constexpr Lamports kMax = std::numeric_limits<Lamports>::max();

    AccountDirectory directory;
    ASSERT_TRUE(directory.add("whale", 1, kMax));

    TransferRequest req;
    req.from = "whale";
    req.to = "whale";
    req.amount = 10;
    req.signer = "whale";

    auto result = transfer_tokens(directory, req);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().destination_balance_after, kMax);
}

TEST(AccountDirectoryTest, RejectsDuplicatesAndFindsById) {
    AccountDirectory directory;
    EXPECT_TRUE(directory.add("alice", 1, 10));
    EXPECT_FALSE(directory.add("alice", 2, 10));
    EXPECT_FALSE(directory.add("bob", 1, 10));
    EXPECT_EQ(directory.size(), 1u);

    auto by_id = directory.find_account(static_cast<solcore::common::AccountId>(1));
    ASSERT_TRUE(by_id.has_value());
    EXPECT_EQ(by_id->name, "alice");
    EXPECT_TRUE(directory.contains(1));
    EXPECT_FALSE(directory.contains(2));
    EXPECT_FALSE(directory.find_account("bob").has_value());
}
