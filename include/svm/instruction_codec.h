#pragma once

#include "common/errors.h"
#include "common/types.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace solcore {
namespace svm {

using namespace solcore::common;

/**
 * Instruction discriminators as they appear in byte 0 of the wire format
 */
enum class Opcode : uint8_t {
    Initialize = 0,
    CreateAccount = 1,
    Transfer = 2,
    Mint = 3,
    Burn = 4
};

struct InitializeInstruction {
    bool operator==(const InitializeInstruction&) const { return true; }
};

struct CreateAccountInstruction {
    AccountId owner_id = 0;
    uint32_t lamports = 0;

    bool operator==(const CreateAccountInstruction& other) const {
        return owner_id == other.owner_id && lamports == other.lamports;
    }
};

struct TransferInstruction {
    uint32_t amount = 0;
    AccountId recipient_id = 0;

    bool operator==(const TransferInstruction& other) const {
        return amount == other.amount && recipient_id == other.recipient_id;
    }
};

struct MintInstruction {
    uint32_t amount = 0;
    AccountId recipient_id = 0;

    bool operator==(const MintInstruction& other) const {
        return amount == other.amount && recipient_id == other.recipient_id;
    }
};

struct BurnInstruction {
    uint32_t amount = 0;

    bool operator==(const BurnInstruction& other) const {
        return amount == other.amount;
    }
};

/**
 * Typed instruction. Alternative order matches Opcode values, so
 * `index()` is the discriminator.
 */
using Instruction = std::variant<
    InitializeInstruction,
    CreateAccountInstruction,
    TransferInstruction,
    MintInstruction,
    BurnInstruction
>;

Opcode opcode_of(const Instruction& instruction);

/**
 * Per-opcode wire layout: header (opcode + 3 reserved bytes) followed by
 * `field_count` little-endian u32 fields.
 */
struct InstructionLayout {
    Opcode opcode;
    const char* name;
    size_t field_count;
    size_t min_size;
};

/**
 * Binary codec for instruction data
 *
 * All functions are pure: they read only their arguments and never keep
 * references to the input buffer.
 */
class InstructionCodec {
public:
    static constexpr size_t HEADER_SIZE = 4;
    static constexpr size_t FIELD_SIZE = 4;

    static constexpr std::array<InstructionLayout, 5> LAYOUTS = {{
        {Opcode::Initialize, "Initialize", 0, HEADER_SIZE},
        {Opcode::CreateAccount, "CreateAccount", 2, HEADER_SIZE + 2 * FIELD_SIZE},
        {Opcode::Transfer, "Transfer", 2, HEADER_SIZE + 2 * FIELD_SIZE},
        {Opcode::Mint, "Mint", 2, HEADER_SIZE + 2 * FIELD_SIZE},
        {Opcode::Burn, "Burn", 1, HEADER_SIZE + FIELD_SIZE},
    }};

    /**
     * Map a raw discriminator to a known opcode
     */
    static std::optional<Opcode> opcode_from_byte(uint8_t byte);

    static const InstructionLayout& layout(Opcode opcode);
    static size_t minimum_size(Opcode opcode) { return layout(opcode).min_size; }
    static const char* opcode_name(Opcode opcode) { return layout(opcode).name; }

    /**
     * Serialize a typed instruction. Reserved header bytes are written as zero.
     */
    static Bytes encode(const Instruction& instruction);

    /**
     * Serialize from a raw opcode byte and its field values
     *
     * Fails with UnknownInstruction for an unrecognised opcode and with
     * FieldCountMismatch when `fields` does not match the opcode's layout.
     */
    static Result<Bytes, CodecError> encode_fields(
        uint8_t opcode,
        const std::vector<uint32_t>& fields
    );

    /**
     * Parse untrusted instruction data
     *
     * Errors, in the order they are checked:
     *  - TruncatedInput when the buffer is empty
     *  - UnknownInstruction(byte) when byte 0 is not a known opcode
     *  - TruncatedInput when the buffer is shorter than the opcode's layout
     * Bytes past the layout are ignored.
     */
    static Result<Instruction, CodecError> decode(const uint8_t* data, size_t size);
    static Result<Instruction, CodecError> decode(const Bytes& buffer) {
        return decode(buffer.data(), buffer.size());
    }

    /**
     * Field values of an instruction in wire order
     */
    static std::vector<uint32_t> fields_of(const Instruction& instruction);
};

} // namespace svm
} // namespace solcore
