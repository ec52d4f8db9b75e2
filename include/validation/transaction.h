#pragma once

#include "common/types.h"
#include <memory>
#include <string>
#include <vector>

namespace solcore {
namespace validation {

using namespace solcore::common;

/**
 * Transaction capability interface
 *
 * Signature checking is stubbed per kind: verify() applies a structural
 * test, not cryptography. The default validity rule is
 * `verify() && amount() > 0`; a kind may replace it.
 */
class Transaction {
public:
    virtual ~Transaction() = default;

    virtual std::string signature() const = 0;
    virtual uint64_t amount() const = 0;
    virtual bool verify() const = 0;

    virtual bool is_valid() const {
        return verify() && amount() > 0;
    }

    /// Short kind name ("token_transfer", "nft_transfer")
    virtual std::string kind() const = 0;
};

/**
 * Fungible token transfer, signed with a 0x-prefixed signature
 */
class TokenTransfer : public Transaction {
public:
    static constexpr const char* SIGNATURE_PREFIX = "0x";

    TokenTransfer(std::string from, std::string to, uint64_t amount_lamports, std::string sig)
        : from_(std::move(from)), to_(std::move(to)),
          amount_lamports_(amount_lamports), sig_(std::move(sig)) {}

    std::string signature() const override { return sig_; }
    uint64_t amount() const override { return amount_lamports_; }
    bool verify() const override;
    std::string kind() const override { return "token_transfer"; }

    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

private:
    std::string from_;
    std::string to_;
    uint64_t amount_lamports_;
    std::string sig_;
};

/**
 * Single-token NFT transfer authorised by the collection authority
 */
class NFTTransfer : public Transaction {
public:
    static constexpr const char* COLLECTION_AUTHORITY = "authority";

    NFTTransfer(std::string collection, uint64_t token_id, std::string new_owner,
                std::string signed_by, std::string sig)
        : collection_(std::move(collection)), token_id_(token_id),
          new_owner_(std::move(new_owner)), signed_by_(std::move(signed_by)),
          sig_(std::move(sig)) {}

    std::string signature() const override { return sig_; }
    uint64_t amount() const override { return 1; }
    bool verify() const override;

    // Replaces the default rule; amount() is always 1 here
    bool is_valid() const override;

    std::string kind() const override { return "nft_transfer"; }

    const std::string& collection() const { return collection_; }
    uint64_t token_id() const { return token_id_; }
    const std::string& new_owner() const { return new_owner_; }
    const std::string& signed_by() const { return signed_by_; }

private:
    std::string collection_;
    uint64_t token_id_;
    std::string new_owner_;
    std::string signed_by_;
    std::string sig_;
};

struct ValidationEntry {
    size_t index;
    bool valid;
    std::string digest; ///< hex SHA-256 of kind, signature and amount
};

/**
 * Validity of every transaction, in input order
 *
 * A full report: evaluation never stops at the first invalid entry. A null
 * element is reported as invalid with an empty digest.
 */
std::vector<ValidationEntry> validate_all(
    const std::vector<std::unique_ptr<Transaction>>& transactions
);

/**
 * Identifier for a transaction: SHA-256 over kind, signature and the
 * little-endian amount. Empty when the digest could not be computed.
 */
Hash transaction_digest(const Transaction& tx);

/**
 * One-line rendering for the CLI
 */
std::string describe(const Transaction& tx);

} // namespace validation
} // namespace solcore
