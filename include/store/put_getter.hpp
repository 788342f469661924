#pragma once

#include <cstdint>
#include <string>
#include "store/chunk_store.hpp"
#include "client/client.hpp"

namespace blockstore {
namespace store {

// ChunkStore backed by a storage node.
// Every put is uploaded under one tag created at construction, with the
// stamp, redundancy level and pin flag given here.
class PutGetter : public ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the upload tag; throws the client's error if that fails
  PutGetter(client::Client& client, std::string stamp, std::string redundancy, bool pin);


  // ---- CORE STORAGE OPERATIONS ----
  swarm::Chunk get(client::Context& context, const swarm::Address& address) override;
  void put(client::Context& context, const swarm::Chunk& chunk) override;


  // ---- QUERY OPERATIONS ----
  std::uint32_t tag() const { return tag_; }
  const std::string& stamp() const { return stamp_; }
  const std::string& redundancy() const { return redundancy_; }
  bool pin() const { return pin_; }

private:
  // ---- PARAMETERS ----
  client::Client& client_;
  const std::string stamp_;
  const std::string redundancy_;
  const bool pin_;
  const std::uint32_t tag_;
};

} // namespace store
} // namespace blockstore
