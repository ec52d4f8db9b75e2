#include "common/errors.h"
#include <sstream>

namespace solcore {
namespace common {

CodecError CodecError::truncated(size_t expected, size_t actual,
                                 std::string field) {
  CodecError error;
  error.kind = CodecErrorKind::TruncatedInput;
  error.expected = expected;
  error.actual = actual;
  error.field = std::move(field);
  return error;
}

CodecError CodecError::unknown_instruction(uint8_t byte) {
  CodecError error;
  error.kind = CodecErrorKind::UnknownInstruction;
  error.byte = byte;
  return error;
}

CodecError CodecError::invalid_encoding(std::string field) {
  CodecError error;
  error.kind = CodecErrorKind::InvalidEncoding;
  error.field = std::move(field);
  return error;
}

CodecError CodecError::field_count_mismatch(size_t expected, size_t actual) {
  CodecError error;
  error.kind = CodecErrorKind::FieldCountMismatch;
  error.expected = expected;
  error.actual = actual;
  return error;
}

bool CodecError::operator==(const CodecError &other) const {
  return kind == other.kind && byte == other.byte &&
         expected == other.expected && actual == other.actual &&
         field == other.field;
}

CompositeError::Kind CompositeError::kind() const noexcept {
  switch (value_.index()) {
  case 0:
    return Kind::Domain;
  case 1:
    return Kind::Network;
  default:
    return Kind::Serialization;
  }
}

std::optional<DomainError> CompositeError::domain_error() const {
  if (const auto *domain = std::get_if<DomainError>(&value_)) {
    return *domain;
  }
  return std::nullopt;
}

std::optional<CodecError> CompositeError::codec_error() const {
  if (const auto *serialization = std::get_if<SerializationError>(&value_)) {
    return serialization->cause;
  }
  return std::nullopt;
}

std::optional<std::string> CompositeError::network_message() const {
  if (const auto *network = std::get_if<NetworkError>(&value_)) {
    return network->message;
  }
  return std::nullopt;
}

CompositeError to_composite(DomainError error) { return CompositeError(error); }

CompositeError to_composite(const CodecError &error) {
  return CompositeError(SerializationError{error});
}

const char *error_code(DomainError error) {
  switch (error) {
  case DomainError::InsufficientBalance:
    return "INSUFFICIENT_BALANCE";
  case DomainError::AccountNotFound:
    return "ACCOUNT_NOT_FOUND";
  case DomainError::UnauthorizedSigner:
    return "UNAUTHORIZED_SIGNER";
  case DomainError::InvalidAmount:
    return "INVALID_AMOUNT";
  }
  return "UNKNOWN_DOMAIN_ERROR";
}

const char *error_code(CodecErrorKind kind) {
  switch (kind) {
  case CodecErrorKind::TruncatedInput:
    return "TRUNCATED_INPUT";
  case CodecErrorKind::UnknownInstruction:
    return "UNKNOWN_INSTRUCTION";
  case CodecErrorKind::InvalidEncoding:
    return "INVALID_ENCODING";
  case CodecErrorKind::FieldCountMismatch:
    return "FIELD_COUNT_MISMATCH";
  }
  return "UNKNOWN_CODEC_ERROR";
}

const char *error_code(CompositeError::Kind kind) {
  switch (kind) {
  case CompositeError::Kind::Domain:
    return "DOMAIN";
  case CompositeError::Kind::Network:
    return "NETWORK";
  case CompositeError::Kind::Serialization:
    return "SERIALIZATION";
  }
  return "UNKNOWN";
}

std::string to_string(DomainError error) {
  switch (error) {
  case DomainError::InsufficientBalance:
    return "insufficient balance";
  case DomainError::AccountNotFound:
    return "account not found";
  case DomainError::UnauthorizedSigner:
    return "unauthorized signer";
  case DomainError::InvalidAmount:
    return "invalid amount";
  }
  return "unknown domain error";
}

std::string to_string(const CodecError &error) {
  std::ostringstream oss;
  switch (error.kind) {
  case CodecErrorKind::TruncatedInput:
    oss << "truncated input";
    if (!error.field.empty()) {
      oss << " reading " << error.field;
    }
    oss << ": need " << error.expected << " bytes, have " << error.actual;
    break;
  case CodecErrorKind::UnknownInstruction:
    oss << "unknown instruction type: " << static_cast<int>(error.byte);
    break;
  case CodecErrorKind::InvalidEncoding:
    oss << "invalid encoding in field '" << error.field << "'";
    break;
  case CodecErrorKind::FieldCountMismatch:
    oss << "field count mismatch: expected " << error.expected << ", got "
        << error.actual;
    break;
  }
  return oss.str();
}

std::string to_string(const CompositeError &error) {
  switch (error.kind()) {
  case CompositeError::Kind::Domain:
    return "domain error: " + to_string(*error.domain_error());
  case CompositeError::Kind::Network:
    return "network error: " + *error.network_message();
  case CompositeError::Kind::Serialization: {
    auto cause = error.codec_error();
    if (cause) {
      return "serialization error: " + to_string(*cause);
    }
    return "serialization error";
  }
  }
  return "unknown error";
}

std::ostream &operator<<(std::ostream &os, DomainError error) {
  return os << to_string(error);
}

std::ostream &operator<<(std::ostream &os, const CodecError &error) {
  return os << to_string(error);
}

std::ostream &operator<<(std::ostream &os, const CompositeError &error) {
  return os << to_string(error);
}

} // namespace common
} // namespace solcore
