#pragma once

#include "common/types.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace solcore {
namespace common {

/**
 * @file errors.h
 * @brief Layered error taxonomy for the codec, domain and composite layers
 *
 * Errors travel as typed values. Each layer either handles an error locally
 * or hands it upward unchanged or wrapped by composition. Conversion to text
 * happens only through to_string() at the CLI boundary.
 */

/**
 * @brief Business-rule failures raised by ledger operations
 */
enum class DomainError : uint8_t {
  InsufficientBalance,
  AccountNotFound,
  UnauthorizedSigner,
  InvalidAmount
};

/// @brief Every DomainError, in declaration order
constexpr std::array<DomainError, 4> ALL_DOMAIN_ERRORS = {
    DomainError::InsufficientBalance, DomainError::AccountNotFound,
    DomainError::UnauthorizedSigner, DomainError::InvalidAmount};

/**
 * @brief Failure kinds produced while encoding or decoding wire bytes
 */
enum class CodecErrorKind : uint8_t {
  TruncatedInput,     ///< buffer shorter than the layout requires
  UnknownInstruction, ///< discriminator outside the known opcode set
  InvalidEncoding,    ///< field present but its contents are malformed
  FieldCountMismatch  ///< untyped encode given the wrong number of fields
};

/**
 * @brief Codec-layer error with the context needed to report it
 *
 * Only the members relevant to the kind are meaningful: `byte` for
 * UnknownInstruction, `expected`/`actual` for TruncatedInput and
 * FieldCountMismatch, `field` for InvalidEncoding and TruncatedInput.
 */
struct CodecError {
  CodecErrorKind kind = CodecErrorKind::TruncatedInput;
  uint8_t byte = 0;
  size_t expected = 0;
  size_t actual = 0;
  std::string field;

  static CodecError truncated(size_t expected, size_t actual,
                              std::string field = "");
  static CodecError unknown_instruction(uint8_t byte);
  static CodecError invalid_encoding(std::string field);
  static CodecError field_count_mismatch(size_t expected, size_t actual);

  bool operator==(const CodecError &other) const;
  bool operator!=(const CodecError &other) const { return !(*this == other); }
};

/// @brief Transport-layer failure carried as its message
struct NetworkError {
  std::string message;

  bool operator==(const NetworkError &other) const {
    return message == other.message;
  }
};

/// @brief Serialization failure, optionally carrying the codec cause
struct SerializationError {
  std::optional<CodecError> cause;

  bool operator==(const SerializationError &other) const {
    return cause == other.cause;
  }
};

/**
 * @brief Top-level error: one of the lower layers, held by composition
 */
class CompositeError {
public:
  enum class Kind : uint8_t { Domain, Network, Serialization };

  explicit CompositeError(DomainError error) : value_(error) {}
  explicit CompositeError(NetworkError error) : value_(std::move(error)) {}
  explicit CompositeError(SerializationError error)
      : value_(std::move(error)) {}

  // Result<T, CompositeError> needs a default state
  CompositeError() : value_(SerializationError{}) {}

  Kind kind() const noexcept;

  /// @brief The wrapped domain error, if this is a Domain composite
  std::optional<DomainError> domain_error() const;

  /// @brief The wrapped codec error, if this is a Serialization composite
  std::optional<CodecError> codec_error() const;

  /// @brief The network message, if this is a Network composite
  std::optional<std::string> network_message() const;

  bool operator==(const CompositeError &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const CompositeError &other) const {
    return !(*this == other);
  }

private:
  std::variant<DomainError, NetworkError, SerializationError> value_;
};

/**
 * @brief Canonical DomainError -> CompositeError wrapping
 *
 * Total over DomainError; the original kind is always recoverable through
 * CompositeError::domain_error().
 */
CompositeError to_composite(DomainError error);

/// @brief Canonical CodecError -> CompositeError wrapping (Serialization)
CompositeError to_composite(const CodecError &error);

/// @brief Stable identifier used as a structured-log error code
const char *error_code(DomainError error);
const char *error_code(CodecErrorKind kind);
const char *error_code(CompositeError::Kind kind);

std::string to_string(DomainError error);
std::string to_string(const CodecError &error);
std::string to_string(const CompositeError &error);

std::ostream &operator<<(std::ostream &os, DomainError error);
std::ostream &operator<<(std::ostream &os, const CodecError &error);
std::ostream &operator<<(std::ostream &os, const CompositeError &error);

} // namespace common
} // namespace solcore
