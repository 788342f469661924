#ifndef BLOCKSTORE_CLIENT_BEE_CLIENT_HPP
#define BLOCKSTORE_CLIENT_BEE_CLIENT_HPP

#include <atomic>
#include <initializer_list>
#include <memory>
#include <string>
#include "client/client.hpp"
#include "client/client_options.hpp"
#include "client/endpoint.hpp"
#include "client/http_transport.hpp"

namespace blockstore {
namespace client {

// Client for a Bee node's HTTP API.
// Holds no per-call state; safe to share between threads.
class BeeClient : public Client {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Talks to the node through a BeastTransport
  BeeClient(const std::string& api_url, ClientOptions options);
  BeeClient(const std::string& api_url, ClientOptions options,
            std::unique_ptr<HttpTransport> transport);
  ~BeeClient() override = default;

  BeeClient(const BeeClient&) = delete;
  BeeClient& operator=(const BeeClient&) = delete;


  // ---- NODE ----
  bool check_connection() override;
  NodeMode node_mode() const override { return mode_.load(); }


  // ---- CHUNKS ----
  swarm::Address upload_soc(const std::string& owner, const std::string& id,
                            const std::string& signature, const std::string& stamp,
                            const std::string& redundancy, bool pin,
                            const std::string& data) override;
  swarm::Address upload_chunk(std::uint32_t tag, const swarm::Chunk& chunk,
                              const std::string& stamp, const std::string& redundancy,
                              bool pin) override;
  swarm::Chunk download_chunk(Context& context, const swarm::Address& address) override;


  // ---- BLOBS ----
  swarm::Address upload_blob(std::uint32_t tag, const std::string& stamp,
                             const std::string& redundancy, bool pin, bool encrypt,
                             std::istream& data) override;
  BlobDownload download_blob(const swarm::Address& address) override;


  // ---- COLLECTIONS ----
  swarm::Address upload_file_bzz(const std::string& data, const std::string& filename,
                                 const std::string& stamp, const std::string& redundancy,
                                 bool pin) override;
  swarm::Address upload_archive(archive::TarStream& archive, const std::string& stamp,
                                const std::string& redundancy, bool pin) override;
  ArchiveDownload download_archive(const swarm::Address& address) override;
  FileDownload download_archive_file(const swarm::Address& address,
                                     const std::string& filename) override;


  // ---- PINS ----
  void unpin_reference(const swarm::Address& address) override;


  // ---- TAGS ----
  std::uint32_t create_tag(const swarm::Address& address) override;
  Tag get_tag(std::uint32_t uid) override;


  // ---- FEEDS ----
  swarm::Address create_feed_manifest(const std::string& owner, const std::string& topic,
                                      const std::string& stamp, bool pin) override;
  FeedLookup get_latest_feed_manifest(const std::string& owner,
                                      const std::string& topic) override;


  // ---- GETTERS ----
  const ClientOptions& options() const { return options_; }
  const Endpoint& endpoint() const { return endpoint_; }

private:
  // ---- PARAMETERS ----
  const ClientOptions options_;
  const Endpoint endpoint_;
  std::unique_ptr<HttpTransport> transport_;
  std::atomic<NodeMode> mode_{NodeMode::FullNode};


  // ---- REQUEST HELPERS ----
  HttpRequest make_request(boost::beast::http::verb method, const std::string& path) const;
  HttpResponse execute(HttpRequest request, const CallOptions& options = CallOptions()) const;
  // Throws ResponseError unless the status is one of the accepted ones
  void check_status(const HttpResponse& response, std::initializer_list<unsigned> accepted,
                    const char* operation) const;
  std::string require_stamp(const std::string& stamp, const char* operation) const;
  void require_reference(const swarm::Address& address, const char* operation) const;
  void set_redundancy(HttpRequest& request, const std::string& redundancy) const;
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_BEE_CLIENT_HPP
