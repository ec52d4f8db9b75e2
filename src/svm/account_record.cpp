#include "svm/account_record.h"
#include "common/logging.h"
#include "svm/byte_io.h"
#include "validation/account.h"

namespace solcore {
namespace svm {

bool is_valid_utf8(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint8_t lead = data[i];
        size_t extra = 0;
        uint32_t code_point = 0;
        uint32_t min_value = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
            min_value = 0x10000;
        } else {
            return false;
        }

        if (!byte_io::in_bounds(size, i + 1, extra)) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        if (code_point < min_value || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

Result<AccountRecord, CodecError> AccountRecordParser::parse(const uint8_t* data, size_t size) {
    using ParseResult = Result<AccountRecord, CodecError>;

    if (size < HEADER_SIZE) {
        LOG_REJECTION("account", "Account record shorter than header",
                      error_code(CodecErrorKind::TruncatedInput),
                      {{"expected", std::to_string(HEADER_SIZE)}, {"actual", std::to_string(size)}});
        return ParseResult::failure(CodecError::truncated(HEADER_SIZE, size, "header"));
    }

    AccountRecord record;
    if (!byte_io::read_u8(data, size, TYPE_TAG_OFFSET, record.type_tag) ||
        !byte_io::read_u32_le(data, size, LAMPORTS_OFFSET, record.lamports) ||
        !byte_io::read_u8(data, size, NAME_LENGTH_OFFSET, record.name_length)) {
        return ParseResult::failure(CodecError::truncated(HEADER_SIZE, size, "header"));
    }

    if (!byte_io::in_bounds(size, NAME_OFFSET, record.name_length)) {
        LOG_REJECTION("account", "Declared name length overruns buffer",
                      error_code(CodecErrorKind::TruncatedInput),
                      {{"name_length", std::to_string(record.name_length)},
                       {"actual", std::to_string(size)}});
        return ParseResult::failure(
            CodecError::truncated(NAME_OFFSET + record.name_length, size, "name"));
    }

    const uint8_t* name_bytes = data + NAME_OFFSET;
    if (!is_valid_utf8(name_bytes, record.name_length)) {
        LOG_REJECTION("account", "Account name is not valid UTF-8",
                      error_code(CodecErrorKind::InvalidEncoding));
        return ParseResult::failure(CodecError::invalid_encoding("name"));
    }

    record.name.assign(reinterpret_cast<const char*>(name_bytes), record.name_length);
    return ParseResult(std::move(record));
}

Result<Bytes, CodecError> AccountRecordParser::serialize(const AccountRecord& record) {
    if (record.name.size() > 0xFF) {
        return Result<Bytes, CodecError>::failure(CodecError::invalid_encoding("name"));
    }
    const auto* name_bytes = reinterpret_cast<const uint8_t*>(record.name.data());
    if (!is_valid_utf8(name_bytes, record.name.size())) {
        return Result<Bytes, CodecError>::failure(CodecError::invalid_encoding("name"));
    }

    Bytes out;
    out.reserve(HEADER_SIZE + record.name.size());
    out.push_back(record.type_tag);
    out.insert(out.end(), LAMPORTS_OFFSET - 1, 0);
    byte_io::append_u32_le(out, record.lamports);
    out.push_back(static_cast<uint8_t>(record.name.size()));
    out.insert(out.end(), NAME_OFFSET - NAME_LENGTH_OFFSET - 1, 0);
    out.insert(out.end(), name_bytes, name_bytes + record.name.size());

    return Result<Bytes, CodecError>(std::move(out));
}

Result<std::unique_ptr<validation::Account>, CodecError> AccountRecordParser::to_account(
    const AccountRecord& record) {

    using AccountResult = Result<std::unique_ptr<validation::Account>, CodecError>;

    switch (static_cast<AccountType>(record.type_tag)) {
        case AccountType::User:
            return AccountResult(std::make_unique<validation::UserAccount>(
                record.name, static_cast<Lamports>(record.lamports)));
        case AccountType::Program:
            return AccountResult(std::make_unique<validation::ProgramAccount>(record.name, true));
    }

    LOG_REJECTION("account", "Unknown account type tag",
                  error_code(CodecErrorKind::InvalidEncoding),
                  {{"type_tag", std::to_string(record.type_tag)}});
    return AccountResult::failure(CodecError::invalid_encoding("type_tag"));
}

} // namespace svm
} // namespace solcore
