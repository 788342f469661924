#include "store/put_getter.hpp"
#include <boost/log/trivial.hpp>

namespace blockstore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PutGetter::PutGetter(client::Client& client, std::string stamp, std::string redundancy, bool pin)
  : client_(client)
  , stamp_(std::move(stamp))
  , redundancy_(std::move(redundancy))
  , pin_(pin)
  , tag_(client_.create_tag(swarm::Address::zero())) {
  BOOST_LOG_TRIVIAL(info) << "Store: Chunk uploads bound to tag " << tag_
                          << (pin_ ? " (pinned)" : "");
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

swarm::Chunk PutGetter::get(client::Context& context, const swarm::Address& address) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Getting chunk " << address;
  return client_.download_chunk(context, address);
}

void PutGetter::put(client::Context& context, const swarm::Chunk& chunk) {
  // Uploads cannot be cancelled once sent
  (void)context;
  BOOST_LOG_TRIVIAL(debug) << "Store: Putting chunk " << chunk.address()
                           << " (" << chunk.data().size() << " bytes)";
  client_.upload_chunk(tag_, chunk, stamp_, redundancy_, pin_);
}

} // namespace store
} // namespace blockstore
