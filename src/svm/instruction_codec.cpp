#include "svm/instruction_codec.h"
#include "common/logging.h"
#include "svm/byte_io.h"

namespace solcore {
namespace svm {

namespace {

struct FieldCollector {
    std::vector<uint32_t> operator()(const InitializeInstruction&) const {
        return {};
    }
    std::vector<uint32_t> operator()(const CreateAccountInstruction& ix) const {
        return {ix.owner_id, ix.lamports};
    }
    std::vector<uint32_t> operator()(const TransferInstruction& ix) const {
        return {ix.amount, ix.recipient_id};
    }
    std::vector<uint32_t> operator()(const MintInstruction& ix) const {
        return {ix.amount, ix.recipient_id};
    }
    std::vector<uint32_t> operator()(const BurnInstruction& ix) const {
        return {ix.amount};
    }
};

// `fields` has already been checked against the layout's field_count
Instruction build_instruction(Opcode opcode, const std::vector<uint32_t>& fields) {
    switch (opcode) {
        case Opcode::Initialize:
            return InitializeInstruction{};
        case Opcode::CreateAccount:
            return CreateAccountInstruction{fields[0], fields[1]};
        case Opcode::Transfer:
            return TransferInstruction{fields[0], fields[1]};
        case Opcode::Mint:
            return MintInstruction{fields[0], fields[1]};
        case Opcode::Burn:
            return BurnInstruction{fields[0]};
    }
    return InitializeInstruction{};
}

Bytes write_wire(Opcode opcode, const std::vector<uint32_t>& fields) {
    Bytes out;
    out.reserve(InstructionCodec::HEADER_SIZE + fields.size() * InstructionCodec::FIELD_SIZE);

    out.push_back(static_cast<uint8_t>(opcode));
    out.insert(out.end(), InstructionCodec::HEADER_SIZE - 1, 0);

    for (uint32_t field : fields) {
        byte_io::append_u32_le(out, field);
    }
    return out;
}

} // namespace

Opcode opcode_of(const Instruction& instruction) {
    return static_cast<Opcode>(instruction.index());
}

std::optional<Opcode> InstructionCodec::opcode_from_byte(uint8_t byte) {
    for (const auto& entry : LAYOUTS) {
        if (static_cast<uint8_t>(entry.opcode) == byte) {
            return entry.opcode;
        }
    }
    return std::nullopt;
}

const InstructionLayout& InstructionCodec::layout(Opcode opcode) {
    return LAYOUTS[static_cast<size_t>(opcode)];
}

Bytes InstructionCodec::encode(const Instruction& instruction) {
    return write_wire(opcode_of(instruction), fields_of(instruction));
}

Result<Bytes, CodecError> InstructionCodec::encode_fields(
    uint8_t opcode_byte,
    const std::vector<uint32_t>& fields) {

    auto opcode = opcode_from_byte(opcode_byte);
    if (!opcode) {
        return Result<Bytes, CodecError>::failure(CodecError::unknown_instruction(opcode_byte));
    }

    const auto& entry = layout(*opcode);
    if (fields.size() != entry.field_count) {
        return Result<Bytes, CodecError>::failure(
            CodecError::field_count_mismatch(entry.field_count, fields.size()));
    }

    return Result<Bytes, CodecError>(write_wire(*opcode, fields));
}

Result<Instruction, CodecError> InstructionCodec::decode(const uint8_t* data, size_t size) {
    using DecodeResult = Result<Instruction, CodecError>;

    uint8_t discriminator = 0;
    if (!byte_io::read_u8(data, size, 0, discriminator)) {
        LOG_REJECTION("codec", "Empty instruction data", error_code(CodecErrorKind::TruncatedInput));
        return DecodeResult::failure(CodecError::truncated(HEADER_SIZE, size, "opcode"));
    }

    auto opcode = opcode_from_byte(discriminator);
    if (!opcode) {
        LOG_REJECTION("codec", "Unknown instruction type",
                      error_code(CodecErrorKind::UnknownInstruction),
                      {{"byte", std::to_string(discriminator)}});
        return DecodeResult::failure(CodecError::unknown_instruction(discriminator));
    }

    const auto& entry = layout(*opcode);
    if (size < entry.min_size) {
        LOG_REJECTION("codec", std::string(entry.name) + " instruction too short",
                      error_code(CodecErrorKind::TruncatedInput),
                      {{"expected", std::to_string(entry.min_size)},
                       {"actual", std::to_string(size)}});
        return DecodeResult::failure(CodecError::truncated(entry.min_size, size, entry.name));
    }

    std::vector<uint32_t> fields;
    fields.reserve(entry.field_count);
    for (size_t i = 0; i < entry.field_count; ++i) {
        uint32_t value = 0;
        if (!byte_io::read_u32_le(data, size, HEADER_SIZE + i * FIELD_SIZE, value)) {
            return DecodeResult::failure(CodecError::truncated(entry.min_size, size, entry.name));
        }
        fields.push_back(value);
    }

    return DecodeResult(build_instruction(*opcode, fields));
}

std::vector<uint32_t> InstructionCodec::fields_of(const Instruction& instruction) {
    return std::visit(FieldCollector{}, instruction);
}

} // namespace svm
} // namespace solcore
