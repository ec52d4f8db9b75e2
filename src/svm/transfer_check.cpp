#include "svm/transfer_check.h"
#include "common/logging.h"
#include <limits>

namespace solcore {
namespace svm {

bool AccountDirectory::add(const std::string& name, AccountId id, Lamports balance) {
    if (by_name_.count(name) > 0 || by_id_.count(id) > 0) {
        return false;
    }
    by_name_.emplace(name, Entry{name, id, balance});
    by_id_.emplace(id, name);
    return true;
}

std::optional<AccountDirectory::Entry> AccountDirectory::find_account(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AccountDirectory::Entry> AccountDirectory::find_account(AccountId id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return std::nullopt;
    }
    return find_account(it->second);
}

Result<TransferReceipt, DomainError> transfer_tokens(
    const AccountDirectory& directory,
    const TransferRequest& request) {

    using TransferResult = Result<TransferReceipt, DomainError>;

    auto reject = [&request](DomainError error) {
        LOG_REJECTION("transfer", "Transfer rejected", error_code(error),
                      {{"from", request.from}, {"to", request.to},
                       {"amount", std::to_string(request.amount)}});
        return TransferResult::failure(error);
    };

    auto source = directory.find_account(request.from);
    if (!source) {
        return reject(DomainError::AccountNotFound);
    }

    auto destination = directory.find_account(request.to);
    if (!destination) {
        return reject(DomainError::AccountNotFound);
    }

    if (request.signer != request.from) {
        return reject(DomainError::UnauthorizedSigner);
    }

    if (request.amount == 0) {
        return reject(DomainError::InvalidAmount);
    }

    if (request.amount > source->balance) {
        return reject(DomainError::InsufficientBalance);
    }

    bool self_transfer = source->id == destination->id;
    if (!self_transfer &&
        request.amount > std::numeric_limits<Lamports>::max() - destination->balance) {
        return reject(DomainError::InvalidAmount);
    }

    TransferReceipt receipt;
    receipt.tx_id = "tx-" + request.from + "-" + request.to + "-" + std::to_string(request.amount);
    if (self_transfer) {
        // Self-transfer leaves the balance where it was
        receipt.source_balance_after = source->balance;
        receipt.destination_balance_after = source->balance;
    } else {
        receipt.source_balance_after = source->balance - request.amount;
        receipt.destination_balance_after = destination->balance + request.amount;
    }
    return TransferResult(std::move(receipt));
}

Result<TransferReceipt, CompositeError> process_transfer(
    const AccountDirectory& directory,
    const TransferRequest& request) {

    return transfer_tokens(directory, request).map_error(
        [](DomainError error) { return to_composite(error); });
}

} // namespace svm
} // namespace solcore
