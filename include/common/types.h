#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace solcore {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout solcore
 *
 * This header defines the byte buffer and ledger scalar aliases and the
 * Result<T, E> wrapper every fallible core operation returns.
 */

/// @brief Raw wire bytes (instruction data, account data)
using Bytes = std::vector<uint8_t>;

/// @brief Cryptographic hash representation (SHA-256, 32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Native token amount in smallest unit (1 SOL = 1,000,000,000 lamports)
using Lamports = uint64_t;

/// @brief Numeric account identifier as carried in instruction payloads
using AccountId = uint32_t;

/// @brief Tag selecting the error constructor of Result
struct error_tag {};

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Implements a Result<T, E> pattern similar to Rust's Result type. The error
 * parameter defaults to a message string; core modules instantiate it with
 * their typed error values so failures are never flattened to text.
 *
 * @tparam T The type of the success value
 * @tparam E The type of the error value
 *
 * @note Thread safety: not thread-safe. Each instance should be used by one
 *       thread at a time.
 *
 * Example usage:
 * @code
 * auto decoded = InstructionCodec::decode(buffer);
 * if (decoded.is_ok()) {
 *     Opcode op = opcode_of(decoded.value());
 * } else {
 *     handle(decoded.error());
 * }
 * @endcode
 */
template <typename T, typename E = std::string>
class Result {
private:
  bool success_;
  T value_;
  E error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result with a typed error
   * @param error The error value to store
   */
  Result(error_tag, E error) : success_(false), error_(std::move(error)) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error) : success_(false), error_(error) {}

  Result(const Result &other) = default;
  Result(Result &&other) = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) = default;

  /// @brief Shorthand for the failed form
  static Result failure(E error) { return Result(error_tag{}, std::move(error)); }

  bool is_ok() const noexcept { return success_; }
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /// @brief Move the success value out
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error value
   * @warning Only call this if is_err() returns true
   */
  const E &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /**
   * @brief Get value or return default on error
   * @param default_value Value to return if result is an error
   */
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }

  /**
   * @brief Re-wrap the error through a conversion, keeping the value type
   *
   * Used to lift a lower-layer error into the next layer without losing it.
   */
  template <typename F>
  auto map_error(F &&convert) const
      -> Result<T, decltype(convert(std::declval<const E &>()))> {
    using Next = Result<T, decltype(convert(std::declval<const E &>()))>;
    if (success_) {
      return Next(value_);
    }
    return Next::failure(convert(error_));
  }
};

/// @brief Render bytes as lowercase hex without separators
std::string to_hex(const Bytes &data);

/**
 * @brief Parse a hex string (optional 0x prefix, whitespace ignored)
 * @return The decoded bytes, or a message describing the first bad character
 */
Result<Bytes> from_hex(const std::string &text);

} // namespace common
} // namespace solcore
