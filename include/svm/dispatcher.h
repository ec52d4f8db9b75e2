#pragma once

#include "common/config.h"
#include "common/errors.h"
#include "common/types.h"
#include "svm/instruction_codec.h"
#include <optional>
#include <string>

namespace solcore {
namespace svm {

using namespace solcore::common;

class AccountDirectory;

/**
 * Operation selected by an instruction discriminator
 */
enum class OperationKind {
    Initialize,
    CreateAccount,
    Transfer,
    Mint,
    Burn,
    Unknown
};

enum class OperationStatus {
    Accepted, ///< instruction routed and passed its checks
    Skipped   ///< informational no-op (short Transfer under the Report policy)
};

struct OperationResult {
    OperationKind kind = OperationKind::Unknown;
    OperationStatus status = OperationStatus::Accepted;
    std::optional<Instruction> instruction; ///< absent when Skipped
    std::string summary;

    bool is_accepted() const { return status == OperationStatus::Accepted; }
};

std::string to_string(OperationKind kind);

/**
 * Routes decoded instructions to their operation handlers
 *
 * Stateless apart from its construction-time settings, so one instance may
 * serve any number of threads. The optional directory is borrowed and must
 * outlive the dispatcher.
 */
class Dispatcher {
public:
    explicit Dispatcher(
        TruncatedTransferPolicy transfer_policy = TruncatedTransferPolicy::Reject,
        const AccountDirectory* directory = nullptr
    );

    /**
     * Total mapping from a discriminator byte to an operation kind
     */
    static OperationKind route(uint8_t discriminator);

    /**
     * Run the per-operation checks on an already decoded instruction
     *
     * Transfer, Mint and Burn with a zero amount fail with InvalidAmount.
     * With a directory, Transfer and Mint to an unregistered recipient fail
     * with AccountNotFound.
     */
    Result<OperationResult, CompositeError> dispatch(const Instruction& instruction) const;

    /**
     * Decode then dispatch
     *
     * Codec failures come back as Serialization composites carrying the
     * CodecError. A Transfer shorter than its layout is rejected, or under
     * TruncatedTransferPolicy::Report answered with a Skipped result.
     */
    Result<OperationResult, CompositeError> dispatch_raw(const uint8_t* data, size_t size) const;
    Result<OperationResult, CompositeError> dispatch_raw(const Bytes& buffer) const {
        return dispatch_raw(buffer.data(), buffer.size());
    }

    TruncatedTransferPolicy transfer_policy() const { return transfer_policy_; }

private:
    using DispatchResult = Result<OperationResult, CompositeError>;

    DispatchResult handle_initialize(const InitializeInstruction& ix) const;
    DispatchResult handle_create_account(const CreateAccountInstruction& ix) const;
    DispatchResult handle_transfer(const TransferInstruction& ix) const;
    DispatchResult handle_mint(const MintInstruction& ix) const;
    DispatchResult handle_burn(const BurnInstruction& ix) const;

    std::optional<CompositeError> check_amount_and_recipient(
        OperationKind kind, uint32_t amount, std::optional<AccountId> recipient) const;

    TruncatedTransferPolicy transfer_policy_;
    const AccountDirectory* directory_;
};

} // namespace svm
} // namespace solcore
