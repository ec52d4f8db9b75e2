#include "validation/transaction.h"
#include "common/logging.h"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>

namespace solcore {
namespace validation {

bool TokenTransfer::verify() const {
    // Structural stand-in for signature verification
    return sig_.rfind(SIGNATURE_PREFIX, 0) == 0;
}

bool NFTTransfer::verify() const {
    return !sig_.empty() && signed_by_ == COLLECTION_AUTHORITY;
}

bool NFTTransfer::is_valid() const {
    return verify() && token_id_ > 0 && !collection_.empty();
}

Hash transaction_digest(const Transaction& tx) {
    Hash hash(SHA256_DIGEST_LENGTH);

    std::string kind = tx.kind();
    std::string sig = tx.signature();
    uint8_t amount_le[8];
    uint64_t amount = tx.amount();
    for (int i = 0; i < 8; ++i) {
        amount_le[i] = static_cast<uint8_t>((amount >> (i * 8)) & 0xFF);
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return {};
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, kind.data(), kind.size()) == 1 &&
              EVP_DigestUpdate(ctx, sig.data(), sig.size()) == 1 &&
              EVP_DigestUpdate(ctx, amount_le, sizeof(amount_le)) == 1;

    unsigned int len = SHA256_DIGEST_LENGTH;
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, hash.data(), &len) == 1;
    }

    EVP_MD_CTX_free(ctx);
    if (!ok) {
        LOG_WARN("validation", "SHA-256 digest failed for ", kind);
        return {};
    }
    return hash;
}

std::vector<ValidationEntry> validate_all(
    const std::vector<std::unique_ptr<Transaction>>& transactions) {

    std::vector<ValidationEntry> report;
    report.reserve(transactions.size());

    size_t valid_count = 0;
    for (size_t i = 0; i < transactions.size(); ++i) {
        const auto& tx = transactions[i];
        if (!tx) {
            LOG_REJECTION("validation", "Null transaction entry", "INVALID_TRANSACTION",
                          {{"index", std::to_string(i)}});
            report.push_back(ValidationEntry{i, false, ""});
            continue;
        }

        bool valid = tx->is_valid();
        if (valid) {
            ++valid_count;
        } else {
            LOG_REJECTION("validation", "Transaction failed validation", "INVALID_TRANSACTION",
                          {{"index", std::to_string(i)}, {"kind", tx->kind()}});
        }
        report.push_back(ValidationEntry{i, valid, to_hex(transaction_digest(*tx))});
    }

    LOG_DEBUG("validation", "Validated ", transactions.size(), " transactions, ",
              valid_count, " valid");
    return report;
}

std::string describe(const Transaction& tx) {
    std::ostringstream oss;
    oss << tx.kind() << " signature=" << tx.signature() << " amount=" << tx.amount()
        << " valid=" << (tx.is_valid() ? "true" : "false");
    return oss.str();
}

} // namespace validation
} // namespace solcore
