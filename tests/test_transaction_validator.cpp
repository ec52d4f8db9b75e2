/**
 * Unit tests for the transaction capability interface
 *
 * Tests:
 * - Default validity rule (verify && amount > 0)
 * - NFT transfer overriding the default rule
 * - validate_all reporting every entry in input order
 * - Deterministic SHA-256 digests
 */

#include "validation/transaction.h"
#include <gtest/gtest.h>

using namespace solcore::validation;

// ============================================================================
// TokenTransfer
// ============================================================================

TEST(TokenTransferTest, ValidWithPrefixedSignatureAndAmount) {
    TokenTransfer tx("alice", "bob", 100, "0xabc");
    EXPECT_TRUE(tx.verify());
    EXPECT_TRUE(tx.is_valid());
    EXPECT_EQ(tx.amount(), 100u);
    EXPECT_EQ(tx.signature(), "0xabc");
}

TEST(TokenTransferTest, ZeroAmountFailsDefaultRule) {
    TokenTransfer tx("alice", "bob", 0, "0xabc");
    EXPECT_TRUE(tx.verify());
    EXPECT_FALSE(tx.is_valid());
}

TEST(TokenTransferTest, UnprefixedSignatureFailsVerify) {
    TokenTransfer tx("alice", "bob", 100, "abc");
    EXPECT_FALSE(tx.verify());
    EXPECT_FALSE(tx.is_valid());

    TokenTransfer empty_sig("alice", "bob", 100, "");
    EXPECT_FALSE(empty_sig.verify());
}

// ============================================================================
// NFTTransfer
// ============================================================================

TEST(NFTTransferTest, AuthoritySignedTransferIsValid) {
    NFTTransfer tx("punks", 42, "carol", "authority", "sig");
    EXPECT_EQ(tx.amount(), 1u);
    EXPECT_TRUE(tx.verify());
    EXPECT_TRUE(tx.is_valid());
}

TEST(NFTTransferTest, OverrideRejectsZeroTokenId) {
    NFTTransfer tx("punks", 0, "carol", "authority", "sig");
    EXPECT_TRUE(tx.verify());
    EXPECT_GT(tx.amount(), 0u);
    EXPECT_FALSE(tx.is_valid());
}

TEST(NFTTransferTest, OverrideRejectsEmptyCollection) {
    NFTTransfer tx("", 42, "carol", "authority", "sig");
    EXPECT_FALSE(tx.is_valid());
}

TEST(NFTTransferTest, WrongSignerFailsVerify) {
    NFTTransfer tx("punks", 42, "carol", "mallory", "sig");
    EXPECT_FALSE(tx.verify());
    EXPECT_FALSE(tx.is_valid());

    NFTTransfer unsigned_tx("punks", 42, "carol", "authority", "");
    EXPECT_FALSE(unsigned_tx.verify());
}

// ============================================================================
// Batch validation
// ============================================================================

TEST(ValidateAllTest, ReportsEveryEntryInOrder) {
    std::vector<std::unique_ptr<Transaction>> batch;
    batch.push_back(std::make_unique<TokenTransfer>("alice", "bob", 0, "0x1"));
    batch.push_back(std::make_unique<NFTTransfer>("punks", 7, "carol", "authority", "sig"));
    batch.push_back(std::make_unique<TokenTransfer>("bob", "alice", 5, "nope"));
    batch.push_back(std::make_unique<TokenTransfer>("bob", "alice", 5, "0x2"));

    auto report = validate_all(batch);
    ASSERT_EQ(report.size(), 4u);

    const bool expected[] = {false, true, false, true};
    for (size_t i = 0; i < report.size(); ++i) {
        EXPECT_EQ(report[i].index, i);
        EXPECT_EQ(report[i].valid, expected[i]) << "entry " << i;
    }
}

TEST(ValidateAllTest, NullEntryIsReportedInvalid) {
    std::vector<std::unique_ptr<Transaction>> batch;
    batch.push_back(std::make_unique<TokenTransfer>("alice", "bob", 5, "0x1"));
    batch.push_back(nullptr);
    batch.push_back(std::make_unique<TokenTransfer>("bob", "alice", 5, "0x2"));

    auto report = validate_all(batch);
    ASSERT_EQ(report.size(), 3u);
    EXPECT_TRUE(report[0].valid);
    EXPECT_EQ(report[1].index, 1u);
    EXPECT_FALSE(report[1].valid);
    EXPECT_TRUE(report[1].digest.empty());
    EXPECT_TRUE(report[2].valid);
}

TEST(ValidateAllTest, EmptyBatch) {
    std::vector<std::unique_ptr<Transaction>> batch;
    EXPECT_TRUE(validate_all(batch).empty());
}

// ============================================================================
// Digest and rendering
// ============================================================================

TEST(TransactionDigestTest, DeterministicSha256) {
    TokenTransfer a("alice", "bob", 100, "0xabc");
    TokenTransfer b("dave", "erin", 100, "0xabc");
    TokenTransfer c("alice", "bob", 101, "0xabc");

    Hash digest_a = transaction_digest(a);
    ASSERT_EQ(digest_a.size(), 32u);
    EXPECT_EQ(digest_a, transaction_digest(b));
    EXPECT_NE(digest_a, transaction_digest(c));

    std::vector<std::unique_ptr<Transaction>> batch;
    batch.push_back(std::make_unique<TokenTransfer>("alice", "bob", 100, "0xabc"));
    auto report = validate_all(batch);
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report[0].digest.size(), 64u);
    EXPECT_EQ(report[0].digest, to_hex(digest_a));
}

TEST(TransactionDigestTest, KindSeparatesDigests) {
    TokenTransfer token("alice", "bob", 1, "sig");
    NFTTransfer nft("punks", 1, "carol", "authority", "sig");
    EXPECT_NE(transaction_digest(token), transaction_digest(nft));
}

TEST(DescribeTest, RendersKindSignatureAmountAndValidity) {
    TokenTransfer tx("alice", "bob", 100, "0xabc");
    EXPECT_EQ(describe(tx), "token_transfer signature=0xabc amount=100 valid=true");

    NFTTransfer nft("punks", 0, "carol", "authority", "sig");
    EXPECT_EQ(describe(nft), "nft_transfer signature=sig amount=1 valid=false");
}
