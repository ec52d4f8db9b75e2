#include "common/types.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace solcore {
namespace common {

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<std::string>;
template class Result<Bytes>;

std::string to_hex(const Bytes &data) {
  std::ostringstream ss;
  for (uint8_t byte : data) {
    ss << std::hex << std::setfill('0') << std::setw(2)
       << static_cast<int>(byte);
  }
  return ss.str();
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

Result<Bytes> from_hex(const std::string &text) {
  std::string digits;
  digits.reserve(text.size());

  size_t start = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    start = 2;
  }

  for (size_t i = start; i < text.size(); ++i) {
    char c = text[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    if (hex_value(c) < 0) {
      return Result<Bytes>::failure("Invalid hex character '" +
                                    std::string(1, c) + "' at position " +
                                    std::to_string(i));
    }
    digits.push_back(c);
  }

  if (digits.size() % 2 != 0) {
    return Result<Bytes>("Hex string has an odd number of digits");
  }

  Bytes out;
  out.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    out.push_back(static_cast<uint8_t>((hex_value(digits[i]) << 4) |
                                       hex_value(digits[i + 1])));
  }
  return Result<Bytes>(std::move(out));
}

} // namespace common
} // namespace solcore
