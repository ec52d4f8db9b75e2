#pragma once

#include "common/errors.h"
#include "common/types.h"
#include <memory>
#include <string>

namespace solcore {
namespace validation {
class Account;
}

namespace svm {

using namespace solcore::common;

/**
 * Account type tags carried in byte 0 of an account record
 */
enum class AccountType : uint8_t {
    User = 1,
    Program = 2
};

/**
 * Decoded account record
 *
 * Layout (little-endian):
 *   [0]      type tag
 *   [1..4)   reserved
 *   [4..8)   lamports (u32)
 *   [8]      name length N
 *   [9..12)  reserved
 *   [12..12+N) UTF-8 name
 */
struct AccountRecord {
    uint8_t type_tag = 0;
    uint32_t lamports = 0;
    uint8_t name_length = 0;
    std::string name;

    bool operator==(const AccountRecord& other) const {
        return type_tag == other.type_tag && lamports == other.lamports &&
               name_length == other.name_length && name == other.name;
    }
};

class AccountRecordParser {
public:
    static constexpr size_t TYPE_TAG_OFFSET = 0;
    static constexpr size_t LAMPORTS_OFFSET = 4;
    static constexpr size_t NAME_LENGTH_OFFSET = 8;
    static constexpr size_t NAME_OFFSET = 12;
    static constexpr size_t HEADER_SIZE = NAME_OFFSET;

    /**
     * Parse an account record buffer
     *
     * Fails with TruncatedInput when the buffer is shorter than the header or
     * the declared name length runs past the end, and with InvalidEncoding
     * when the name bytes are not valid UTF-8. Bytes after the name are
     * never read.
     */
    static Result<AccountRecord, CodecError> parse(const uint8_t* data, size_t size);
    static Result<AccountRecord, CodecError> parse(const Bytes& buffer) {
        return parse(buffer.data(), buffer.size());
    }

    /**
     * Serialize a record; `name_length` is taken from `name.size()`
     *
     * Fails with InvalidEncoding when the name is longer than 255 bytes or
     * is not valid UTF-8.
     */
    static Result<Bytes, CodecError> serialize(const AccountRecord& record);

    /**
     * Reconstruct the account entity a record describes
     *
     * User records become UserAccount(name, lamports); Program records become
     * an executable ProgramAccount(name). Other tags fail with
     * InvalidEncoding on field "type_tag".
     */
    static Result<std::unique_ptr<validation::Account>, CodecError> to_account(
        const AccountRecord& record
    );
};

/**
 * Strict UTF-8 check (rejects overlongs, surrogates and values past U+10FFFF)
 */
bool is_valid_utf8(const uint8_t* data, size_t size);

} // namespace svm
} // namespace solcore
