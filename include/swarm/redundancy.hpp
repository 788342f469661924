#ifndef BLOCKSTORE_SWARM_REDUNDANCY_HPP
#define BLOCKSTORE_SWARM_REDUNDANCY_HPP

#include <cstdint>
#include <string>

namespace blockstore {
namespace swarm {

// Erasure coding levels understood by the node
enum class RedundancyLevel : uint8_t {
  NONE = 0,
  MEDIUM = 1,
  STRONG = 2,
  INSANE = 3,
  PARANOID = 4
};

// Header value for the level ("0".."4")
std::string to_string(RedundancyLevel level);

// Human readable name for logging
const char* redundancy_level_name(RedundancyLevel level);

} // namespace swarm
} // namespace blockstore

#endif // BLOCKSTORE_SWARM_REDUNDANCY_HPP
