#ifndef BLOCKSTORE_SWARM_CHUNK_HPP
#define BLOCKSTORE_SWARM_CHUNK_HPP

#include <string>
#include "swarm/address.hpp"

namespace blockstore {
namespace swarm {

// Immutable payload keyed by its content address.
// The address is taken as given; nothing here checks it against the data.
class Chunk {
public:
  Chunk() = default;
  Chunk(Address address, std::string data)
    : address_(std::move(address))
    , data_(std::move(data)) {}

  const Address& address() const { return address_; }
  const std::string& data() const { return data_; }

private:
  Address address_;
  std::string data_;
};

} // namespace swarm
} // namespace blockstore

#endif // BLOCKSTORE_SWARM_CHUNK_HPP
