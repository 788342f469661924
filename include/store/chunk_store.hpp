#pragma once

#include "swarm/address.hpp"
#include "swarm/chunk.hpp"
#include "client/context.hpp"

namespace blockstore {
namespace store {

// Key-addressable chunk storage
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  // Retrieves the chunk stored under the address
  virtual swarm::Chunk get(client::Context& context, const swarm::Address& address) = 0;
  // Stores the chunk under its own address
  virtual void put(client::Context& context, const swarm::Chunk& chunk) = 0;

protected:
  ChunkStore() = default;
};

} // namespace store
} // namespace blockstore
