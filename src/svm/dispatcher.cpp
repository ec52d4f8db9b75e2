#include "svm/dispatcher.h"
#include "common/logging.h"
#include "svm/transfer_check.h"
#include <sstream>

namespace solcore {
namespace svm {

std::string to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::Initialize:
            return "Initialize";
        case OperationKind::CreateAccount:
            return "CreateAccount";
        case OperationKind::Transfer:
            return "Transfer";
        case OperationKind::Mint:
            return "Mint";
        case OperationKind::Burn:
            return "Burn";
        case OperationKind::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

Dispatcher::Dispatcher(TruncatedTransferPolicy transfer_policy, const AccountDirectory* directory)
    : transfer_policy_(transfer_policy), directory_(directory) {}

OperationKind Dispatcher::route(uint8_t discriminator) {
    switch (discriminator) {
        case static_cast<uint8_t>(Opcode::Initialize):
            return OperationKind::Initialize;
        case static_cast<uint8_t>(Opcode::CreateAccount):
            return OperationKind::CreateAccount;
        case static_cast<uint8_t>(Opcode::Transfer):
            return OperationKind::Transfer;
        case static_cast<uint8_t>(Opcode::Mint):
            return OperationKind::Mint;
        case static_cast<uint8_t>(Opcode::Burn):
            return OperationKind::Burn;
        default:
            return OperationKind::Unknown;
    }
}

Result<OperationResult, CompositeError> Dispatcher::dispatch(const Instruction& instruction) const {
    switch (opcode_of(instruction)) {
        case Opcode::Initialize:
            return handle_initialize(std::get<InitializeInstruction>(instruction));
        case Opcode::CreateAccount:
            return handle_create_account(std::get<CreateAccountInstruction>(instruction));
        case Opcode::Transfer:
            return handle_transfer(std::get<TransferInstruction>(instruction));
        case Opcode::Mint:
            return handle_mint(std::get<MintInstruction>(instruction));
        case Opcode::Burn:
            return handle_burn(std::get<BurnInstruction>(instruction));
    }
    return DispatchResult::failure(
        to_composite(CodecError::unknown_instruction(static_cast<uint8_t>(instruction.index()))));
}

Result<OperationResult, CompositeError> Dispatcher::dispatch_raw(const uint8_t* data, size_t size) const {
    if (size == 0) {
        LOG_REJECTION("dispatcher", "Invalid instruction: empty",
                      error_code(CodecErrorKind::TruncatedInput));
        return DispatchResult::failure(
            to_composite(CodecError::truncated(InstructionCodec::HEADER_SIZE, 0, "opcode")));
    }

    uint8_t discriminator = data[0];
    OperationKind kind = route(discriminator);
    if (kind == OperationKind::Unknown) {
        LOG_REJECTION("dispatcher", "Unknown instruction type",
                      error_code(CodecErrorKind::UnknownInstruction),
                      {{"byte", std::to_string(discriminator)}});
        return DispatchResult::failure(to_composite(CodecError::unknown_instruction(discriminator)));
    }

    // Only a complete header with a short payload is reportable; anything
    // shorter falls through to decode and fails as truncated.
    size_t transfer_min = InstructionCodec::minimum_size(Opcode::Transfer);
    if (kind == OperationKind::Transfer && transfer_policy_ == TruncatedTransferPolicy::Report &&
        size >= InstructionCodec::HEADER_SIZE && size < transfer_min) {
        std::ostringstream summary;
        summary << "Transfer instruction: payload too short (" << size << " of "
                << transfer_min << " bytes), amount and recipient not read";

        LOG_INFO("dispatcher", summary.str());

        OperationResult result;
        result.kind = OperationKind::Transfer;
        result.status = OperationStatus::Skipped;
        result.summary = summary.str();
        return DispatchResult(std::move(result));
    }

    auto decoded = InstructionCodec::decode(data, size);
    if (decoded.is_err()) {
        return DispatchResult::failure(to_composite(decoded.error()));
    }
    return dispatch(decoded.value());
}

std::optional<CompositeError> Dispatcher::check_amount_and_recipient(
    OperationKind kind, uint32_t amount, std::optional<AccountId> recipient) const {

    if (amount == 0) {
        LOG_REJECTION("dispatcher", to_string(kind) + " with zero amount",
                      error_code(DomainError::InvalidAmount));
        return to_composite(DomainError::InvalidAmount);
    }

    if (recipient && directory_ != nullptr && !directory_->contains(*recipient)) {
        LOG_REJECTION("dispatcher", to_string(kind) + " to unknown recipient",
                      error_code(DomainError::AccountNotFound),
                      {{"recipient", std::to_string(*recipient)}});
        return to_composite(DomainError::AccountNotFound);
    }

    return std::nullopt;
}

Dispatcher::DispatchResult Dispatcher::handle_initialize(const InitializeInstruction& ix) const {
    OperationResult result;
    result.kind = OperationKind::Initialize;
    result.instruction = ix;
    result.summary = "Initialize instruction";
    return DispatchResult(std::move(result));
}

Dispatcher::DispatchResult Dispatcher::handle_create_account(const CreateAccountInstruction& ix) const {
    std::ostringstream summary;
    summary << "Create account instruction: owner=" << ix.owner_id
            << ", lamports=" << ix.lamports;

    OperationResult result;
    result.kind = OperationKind::CreateAccount;
    result.instruction = ix;
    result.summary = summary.str();
    return DispatchResult(std::move(result));
}

Dispatcher::DispatchResult Dispatcher::handle_transfer(const TransferInstruction& ix) const {
    if (auto error = check_amount_and_recipient(OperationKind::Transfer, ix.amount, ix.recipient_id)) {
        return DispatchResult::failure(*error);
    }

    std::ostringstream summary;
    summary << "Transfer instruction: amount=" << ix.amount
            << ", recipient=" << ix.recipient_id;

    OperationResult result;
    result.kind = OperationKind::Transfer;
    result.instruction = ix;
    result.summary = summary.str();
    return DispatchResult(std::move(result));
}

Dispatcher::DispatchResult Dispatcher::handle_mint(const MintInstruction& ix) const {
    if (auto error = check_amount_and_recipient(OperationKind::Mint, ix.amount, ix.recipient_id)) {
        return DispatchResult::failure(*error);
    }

    std::ostringstream summary;
    summary << "Mint instruction: amount=" << ix.amount
            << ", recipient=" << ix.recipient_id;

    OperationResult result;
    result.kind = OperationKind::Mint;
    result.instruction = ix;
    result.summary = summary.str();
    return DispatchResult(std::move(result));
}

Dispatcher::DispatchResult Dispatcher::handle_burn(const BurnInstruction& ix) const {
    if (auto error = check_amount_and_recipient(OperationKind::Burn, ix.amount, std::nullopt)) {
        return DispatchResult::failure(*error);
    }

    OperationResult result;
    result.kind = OperationKind::Burn;
    result.instruction = ix;
    result.summary = "Burn instruction: amount=" + std::to_string(ix.amount);
    return DispatchResult(std::move(result));
}

} // namespace svm
} // namespace solcore
