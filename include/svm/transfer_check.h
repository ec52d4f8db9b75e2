#pragma once

#include "common/errors.h"
#include "common/types.h"
#include <map>
#include <optional>
#include <string>

namespace solcore {
namespace svm {

using namespace solcore::common;

/**
 * Read-only snapshot of known accounts and their balances
 *
 * Built once by the caller and then only queried, so a single directory can
 * be shared by concurrent checks without locking.
 */
class AccountDirectory {
public:
    struct Entry {
        std::string name;
        AccountId id;
        Lamports balance;
    };

    AccountDirectory() = default;

    /// Register an account; returns false if the name or id is already taken
    bool add(const std::string& name, AccountId id, Lamports balance);

    std::optional<Entry> find_account(const std::string& name) const;
    std::optional<Entry> find_account(AccountId id) const;

    bool contains(AccountId id) const { return by_id_.count(id) > 0; }
    size_t size() const { return by_name_.size(); }

private:
    std::map<std::string, Entry> by_name_;
    std::map<AccountId, std::string> by_id_;
};

struct TransferRequest {
    std::string from;
    std::string to;
    Lamports amount = 0;
    std::string signer;
};

struct TransferReceipt {
    std::string tx_id;
    Lamports source_balance_after = 0;
    Lamports destination_balance_after = 0;
};

/**
 * Check a transfer against the directory without mutating it
 *
 * Checks in order: source exists, destination exists, signer is the source,
 * amount is non-zero, source balance covers the amount, destination balance
 * would not overflow (InvalidAmount). The first failure is returned as its
 * DomainError.
 */
Result<TransferReceipt, DomainError> transfer_tokens(
    const AccountDirectory& directory,
    const TransferRequest& request
);

/**
 * transfer_tokens() lifted into the composite layer via to_composite()
 */
Result<TransferReceipt, CompositeError> process_transfer(
    const AccountDirectory& directory,
    const TransferRequest& request
);

} // namespace svm
} // namespace solcore
