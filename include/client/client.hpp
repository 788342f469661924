#ifndef BLOCKSTORE_CLIENT_CLIENT_HPP
#define BLOCKSTORE_CLIENT_CLIENT_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include "swarm/address.hpp"
#include "swarm/chunk.hpp"
#include "archive/tar_stream.hpp"
#include "client/context.hpp"

namespace blockstore {
namespace client {

// Kind of endpoint the client talks to, decided by check_connection()
enum class NodeMode {
  FullNode,
  // Restricted proxy without the tag API
  GatewayProxy
};

const char* node_mode_name(NodeMode mode);

// Server-side sync counters of one upload
struct Tag {
  std::uint32_t uid{0};
  std::uint64_t total{0};
  std::uint64_t processed{0};
  std::uint64_t synced{0};
};

// Latest update of a feed and the index to publish the next one at
struct FeedLookup {
  swarm::Address reference;
  std::string index;
  std::string next_index;
};

struct BlobDownload {
  std::unique_ptr<std::istream> data;
  unsigned status{0};
};

struct ArchiveDownload {
  std::string data;
  unsigned status{0};
};

struct FileDownload {
  std::unique_ptr<std::istream> data;
  std::uint64_t content_length{0};
};

// Operations of the storage node API.
// Each call is a single request/response exchange. Empty stamp or redundancy
// arguments fall back to the client defaults. Failures throw ClientError
// subclasses; see client_error.hpp.
class Client {
public:
  virtual ~Client() = default;

  // ---- NODE ----
  // Probes the node and records whether it is a full node or a gateway proxy
  virtual bool check_connection() = 0;
  virtual NodeMode node_mode() const = 0;


  // ---- CHUNKS ----
  // Single owner chunk; owner, id and signature are hex strings
  virtual swarm::Address upload_soc(const std::string& owner, const std::string& id,
                                    const std::string& signature, const std::string& stamp,
                                    const std::string& redundancy, bool pin,
                                    const std::string& data) = 0;
  virtual swarm::Address upload_chunk(std::uint32_t tag, const swarm::Chunk& chunk,
                                      const std::string& stamp, const std::string& redundancy,
                                      bool pin) = 0;
  // Cancelling the context aborts the request with CancelledError
  virtual swarm::Chunk download_chunk(Context& context, const swarm::Address& address) = 0;


  // ---- BLOBS ----
  // The stream is read to its end and sent as one in-memory body, so the
  // blob must fit in memory
  virtual swarm::Address upload_blob(std::uint32_t tag, const std::string& stamp,
                                     const std::string& redundancy, bool pin, bool encrypt,
                                     std::istream& data) = 0;
  virtual BlobDownload download_blob(const swarm::Address& address) = 0;


  // ---- COLLECTIONS ----
  virtual swarm::Address upload_file_bzz(const std::string& data, const std::string& filename,
                                         const std::string& stamp, const std::string& redundancy,
                                         bool pin) = 0;
  // The archive must be closed; its bytes are consumed by the upload
  virtual swarm::Address upload_archive(archive::TarStream& archive, const std::string& stamp,
                                        const std::string& redundancy, bool pin) = 0;
  virtual ArchiveDownload download_archive(const swarm::Address& address) = 0;
  virtual FileDownload download_archive_file(const swarm::Address& address,
                                             const std::string& filename) = 0;


  // ---- PINS ----
  // Succeeds when the reference was not pinned
  virtual void unpin_reference(const swarm::Address& address) = 0;


  // ---- TAGS ----
  virtual std::uint32_t create_tag(const swarm::Address& address) = 0;
  virtual Tag get_tag(std::uint32_t uid) = 0;


  // ---- FEEDS ----
  virtual swarm::Address create_feed_manifest(const std::string& owner, const std::string& topic,
                                              const std::string& stamp, bool pin) = 0;
  virtual FeedLookup get_latest_feed_manifest(const std::string& owner,
                                              const std::string& topic) = 0;

protected:
  Client() = default;
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_CLIENT_HPP
