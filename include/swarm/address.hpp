#ifndef BLOCKSTORE_SWARM_ADDRESS_HPP
#define BLOCKSTORE_SWARM_ADDRESS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace blockstore {
namespace swarm {

class Address {
public:
  static constexpr std::size_t SIZE = 32;
  // References to encrypted content carry the decryption key after the hash
  static constexpr std::size_t ENCRYPTED_SIZE = 64;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Empty address, no backing bytes
  Address() = default;
  explicit Address(std::vector<uint8_t> bytes);


  // ---- FACTORIES ----
  // The all-zero sentinel meaning "no address"
  static Address zero();
  // Parses lowercase or uppercase hex with an optional 0x prefix
  // Throws std::invalid_argument for malformed input or unsupported lengths
  static Address from_hex(const std::string& hex);


  // ---- QUERY OPERATIONS ----
  bool is_zero() const;
  bool is_empty() const { return bytes_.empty(); }
  // True when the address can be sent to the network as a reference
  bool is_valid_reference() const { return !is_empty() && !is_zero(); }

  const std::vector<uint8_t>& bytes() const { return bytes_; }
  std::size_t size() const { return bytes_.size(); }
  std::string to_hex() const;

  bool operator==(const Address& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Address& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Address& other) const { return bytes_ < other.bytes_; }

private:
  std::vector<uint8_t> bytes_;
};

std::ostream& operator<<(std::ostream& os, const Address& address);

} // namespace swarm
} // namespace blockstore

#endif // BLOCKSTORE_SWARM_ADDRESS_HPP
