#include "swarm/address.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace blockstore {
namespace swarm {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Address::Address(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

Address Address::zero() {
  return Address(std::vector<uint8_t>(SIZE, 0));
}

Address Address::from_hex(const std::string& hex) {
  std::size_t offset = 0;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    offset = 2;
  }

  const std::size_t digits = hex.size() - offset;
  if (digits % 2 != 0) {
    throw std::invalid_argument("Address: odd length hex string");
  }
  if (digits / 2 != SIZE && digits / 2 != ENCRYPTED_SIZE) {
    throw std::invalid_argument("Address: invalid length " + std::to_string(digits / 2));
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(digits / 2);
  for (std::size_t i = offset; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Address: invalid hex character");
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return Address(std::move(bytes));
}

bool Address::is_zero() const {
  return !bytes_.empty() &&
    std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::string Address::to_hex() const {
  std::stringstream ss;
  for (uint8_t b : bytes_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Address& address) {
  return os << address.to_hex();
}

} // namespace swarm
} // namespace blockstore
