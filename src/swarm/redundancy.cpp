#include "swarm/redundancy.hpp"

namespace blockstore {
namespace swarm {

std::string to_string(RedundancyLevel level) {
  return std::to_string(static_cast<int>(level));
}

const char* redundancy_level_name(RedundancyLevel level) {
  switch (level) {
    case RedundancyLevel::NONE: return "none";
    case RedundancyLevel::MEDIUM: return "medium";
    case RedundancyLevel::STRONG: return "strong";
    case RedundancyLevel::INSANE: return "insane";
    case RedundancyLevel::PARANOID: return "paranoid";
    default: return "unknown";
  }
}

} // namespace swarm
} // namespace blockstore
