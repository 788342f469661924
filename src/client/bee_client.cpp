#include "client/bee_client.hpp"
#include "client/api.hpp"
#include "client/beast_transport.hpp"
#include "client/client_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace blockstore {
namespace client {

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {

constexpr const char* UNMARSHAL_ERROR = "error unmarshalling response";

const char* bool_header(bool value) {
  return value ? "true" : "false";
}

// Reads {"reference": hex} from an upload or feed response
swarm::Address decode_reference(const std::string& body) {
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw DecodeError(UNMARSHAL_ERROR);
  }
  auto it = parsed.find("reference");
  if (it == parsed.end() || !it->is_string()) {
    throw DecodeError(UNMARSHAL_ERROR);
  }
  try {
    return swarm::Address::from_hex(it->get<std::string>());
  } catch (const std::invalid_argument&) {
    throw DecodeError(UNMARSHAL_ERROR);
  }
}

// Reads a tag object; counters missing from the body stay zero
Tag decode_tag(const std::string& body) {
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw DecodeError(UNMARSHAL_ERROR);
  }
  try {
    Tag tag;
    auto uid = parsed.find("uid");
    if (uid != parsed.end()) {
      if (!uid->is_number_unsigned() ||
          uid->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        throw DecodeError(UNMARSHAL_ERROR);
      }
      tag.uid = uid->get<std::uint32_t>();
    }
    tag.total = parsed.value("total", std::uint64_t{0});
    tag.processed = parsed.value("processed", std::uint64_t{0});
    tag.synced = parsed.value("synced", std::uint64_t{0});
    return tag;
  } catch (const json::exception&) {
    throw DecodeError(UNMARSHAL_ERROR);
  }
}

std::string header_value(const HttpResponse& response, const char* name) {
  auto it = response.find(name);
  if (it == response.end()) {
    return std::string();
  }
  return std::string(it->value());
}

} // namespace

const char* node_mode_name(NodeMode mode) {
  switch (mode) {
    case NodeMode::FullNode: return "full node";
    case NodeMode::GatewayProxy: return "gateway proxy";
  }
  return "unknown";
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeeClient::BeeClient(const std::string& api_url, ClientOptions options)
  : options_(std::move(options))
  , endpoint_(parse_endpoint(api_url))
  , transport_(std::make_unique<BeastTransport>(endpoint_, options_)) {
  BOOST_LOG_TRIVIAL(info) << "Bee client: Created for " << api_url;
}

BeeClient::BeeClient(const std::string& api_url, ClientOptions options,
                     std::unique_ptr<HttpTransport> transport)
  : options_(std::move(options))
  , endpoint_(parse_endpoint(api_url))
  , transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("Bee client: Transport must not be null");
  }
  BOOST_LOG_TRIVIAL(info) << "Bee client: Created for " << api_url;
}


//==============================================
// NODE
//==============================================

bool BeeClient::check_connection() {
  // A full node greets on its root path
  try {
    HttpResponse root = execute(make_request(http::verb::get, "/"));
    if (root.body() == api::BEE_ROOT_BANNER) {
      mode_.store(NodeMode::FullNode);
      BOOST_LOG_TRIVIAL(info) << "Bee client: Connected to a full node";
      return true;
    }
  } catch (const ClientError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Bee client: Root probe failed: " << e.what();
  }

  // A gateway proxy only answers its health check
  try {
    HttpResponse health = execute(make_request(http::verb::get, api::HEALTH_PATH));
    if (health.body() == api::GATEWAY_HEALTH_OK) {
      mode_.store(NodeMode::GatewayProxy);
      BOOST_LOG_TRIVIAL(info) << "Bee client: Connected to a gateway proxy, tags disabled";
      return true;
    }
  } catch (const ClientError& e) {
    BOOST_LOG_TRIVIAL(error) << "Bee client: Health probe failed: " << e.what();
    return false;
  }

  // Answered, but not as a proxy: tags stay enabled
  mode_.store(NodeMode::FullNode);
  BOOST_LOG_TRIVIAL(warning) << "Bee client: Endpoint is neither a Bee node nor a gateway proxy";
  return false;
}


//==============================================
// CHUNKS
//==============================================

swarm::Address BeeClient::upload_soc(const std::string& owner, const std::string& id,
                                     const std::string& signature, const std::string& stamp,
                                     const std::string& redundancy, bool pin,
                                     const std::string& data) {
  const std::string batch = require_stamp(stamp, "upload_soc");
  if (signature.empty()) {
    throw PreconditionError("Bee client: upload_soc requires a signature");
  }

  HttpRequest request = make_request(http::verb::post,
    std::string(api::SOC_PATH) + escape_component(owner) + "/" + escape_component(id) +
    "?sig=" + escape_component(signature));
  request.set(api::SWARM_POSTAGE_BATCH_ID, batch);
  request.set(http::field::content_type, api::OCTET_STREAM);
  request.set(api::SWARM_DEFERRED_UPLOAD, "true");
  set_redundancy(request, redundancy);
  if (options_.resolve_pin(pin)) {
    request.set(api::SWARM_PIN, "true");
  }
  request.body() = data;

  HttpResponse response = execute(std::move(request));
  check_status(response, {201}, "upload_soc");
  return decode_reference(response.body());
}

swarm::Address BeeClient::upload_chunk(std::uint32_t tag, const swarm::Chunk& chunk,
                                       const std::string& stamp, const std::string& redundancy,
                                       bool pin) {
  const std::string batch = require_stamp(stamp, "upload_chunk");

  HttpRequest request = make_request(http::verb::post, api::CHUNKS_PATH);
  request.set(http::field::content_type, api::OCTET_STREAM);
  request.set(api::SWARM_POSTAGE_BATCH_ID, batch);
  request.set(api::SWARM_DEFERRED_UPLOAD, "true");
  set_redundancy(request, redundancy);
  request.set(api::SWARM_TAG, std::to_string(tag));
  if (options_.resolve_pin(pin)) {
    request.set(api::SWARM_PIN, "true");
  }
  request.body() = chunk.data();

  // The node applies the header's level; the client side of the request
  // never encodes redundancy for a single chunk
  CallOptions call;
  call.local_redundancy = swarm::RedundancyLevel::NONE;

  HttpResponse response = execute(std::move(request), call);
  check_status(response, {201}, "upload_chunk");
  return decode_reference(response.body());
}

swarm::Chunk BeeClient::download_chunk(Context& context, const swarm::Address& address) {
  require_reference(address, "download_chunk");

  CallOptions call;
  call.context = &context;
  HttpResponse response = execute(
    make_request(http::verb::get, std::string(api::CHUNKS_PATH) + "/" + address.to_hex()), call);
  check_status(response, {200}, "download_chunk");
  return swarm::Chunk(address, std::move(response.body()));
}


//==============================================
// BLOBS
//==============================================

swarm::Address BeeClient::upload_blob(std::uint32_t tag, const std::string& stamp,
                                      const std::string& redundancy, bool pin, bool encrypt,
                                      std::istream& data) {
  const std::string batch = require_stamp(stamp, "upload_blob");

  std::ostringstream body;
  body << data.rdbuf();
  if (data.bad()) {
    throw PreconditionError("Bee client: upload_blob could not read the data stream");
  }

  HttpRequest request = make_request(http::verb::post, api::BYTES_PATH);
  request.set(api::SWARM_PIN, bool_header(options_.resolve_pin(pin)));
  request.set(api::SWARM_ENCRYPT, bool_header(encrypt));
  request.set(http::field::content_type, api::OCTET_STREAM);
  set_redundancy(request, redundancy);
  if (tag > 0) {
    request.set(api::SWARM_TAG, std::to_string(tag));
  }
  request.set(api::SWARM_POSTAGE_BATCH_ID, batch);
  request.set(api::SWARM_DEFERRED_UPLOAD, "true");
  request.body() = body.str();

  HttpResponse response = execute(std::move(request));
  check_status(response, {200, 201}, "upload_blob");
  return decode_reference(response.body());
}

BlobDownload BeeClient::download_blob(const swarm::Address& address) {
  require_reference(address, "download_blob");

  HttpResponse response = execute(
    make_request(http::verb::get, std::string(api::BYTES_PATH) + "/" + address.to_hex()));
  check_status(response, {200}, "download_blob");

  BlobDownload download;
  download.status = response.result_int();
  download.data = std::make_unique<std::istringstream>(std::move(response.body()));
  return download;
}


//==============================================
// COLLECTIONS
//==============================================

swarm::Address BeeClient::upload_file_bzz(const std::string& data, const std::string& filename,
                                          const std::string& stamp, const std::string& redundancy,
                                          bool pin) {
  const std::string batch = require_stamp(stamp, "upload_file_bzz");

  HttpRequest request = make_request(http::verb::post,
    std::string(api::BZZ_PATH) + "?name=" + escape_component(filename));
  request.set(api::SWARM_PIN, bool_header(options_.resolve_pin(pin)));
  request.set(api::SWARM_POSTAGE_BATCH_ID, batch);
  request.set(http::field::content_type, api::OCTET_STREAM);
  set_redundancy(request, redundancy);
  request.body() = data;

  HttpResponse response = execute(std::move(request));
  check_status(response, {200, 201}, "upload_file_bzz");
  return decode_reference(response.body());
}

swarm::Address BeeClient::upload_archive(archive::TarStream& archive, const std::string& stamp,
                                         const std::string& redundancy, bool pin) {
  const std::string batch = require_stamp(stamp, "upload_archive");
  if (!archive.is_closed()) {
    throw PreconditionError("Bee client: upload_archive requires a closed archive");
  }
  if (archive.is_consumed()) {
    throw PreconditionError("Bee client: upload_archive archive was already uploaded");
  }

  HttpRequest request = make_request(http::verb::post, api::BZZ_PATH);
  request.set(api::SWARM_PIN, bool_header(options_.resolve_pin(pin)));
  request.set(api::SWARM_POSTAGE_BATCH_ID, batch);
  request.set(http::field::content_type, api::TAR_CONTENT_TYPE);
  request.set(api::SWARM_COLLECTION, "true");
  set_redundancy(request, redundancy);
  request.body() = archive.take_output();

  BOOST_LOG_TRIVIAL(debug) << "Bee client: Uploading archive with " << archive.entry_count()
                           << " entries (" << request.body().size() << " bytes)";

  HttpResponse response = execute(std::move(request));
  check_status(response, {200, 201}, "upload_archive");
  return decode_reference(response.body());
}

ArchiveDownload BeeClient::download_archive(const swarm::Address& address) {
  require_reference(address, "download_archive");

  HttpResponse response = execute(
    make_request(http::verb::get, std::string(api::BZZ_PATH) + "/" + address.to_hex()));
  check_status(response, {200}, "download_archive");

  ArchiveDownload download;
  download.status = response.result_int();
  download.data = std::move(response.body());
  return download;
}

FileDownload BeeClient::download_archive_file(const swarm::Address& address,
                                              const std::string& filename) {
  require_reference(address, "download_archive_file");

  std::string member = filename;
  while (!member.empty() && member.front() == '/') {
    member.erase(0, 1);
  }

  HttpResponse response = execute(make_request(http::verb::get,
    std::string(api::BZZ_PATH) + "/" + address.to_hex() + "/" + escape_path(member)));
  check_status(response, {200}, "download_archive_file");

  const std::string length = header_value(response, "Content-Length");
  FileDownload download;
  try {
    std::size_t consumed = 0;
    download.content_length = std::stoull(length, &consumed);
    if (consumed != length.size()) {
      throw std::invalid_argument(length);
    }
  } catch (const std::logic_error&) {
    BOOST_LOG_TRIVIAL(error) << "Bee client: Invalid Content-Length '" << length
                             << "' for " << filename;
    throw DecodeError("invalid content length");
  }
  download.data = std::make_unique<std::istringstream>(std::move(response.body()));
  return download;
}


//==============================================
// PINS
//==============================================

void BeeClient::unpin_reference(const swarm::Address& address) {
  require_reference(address, "unpin_reference");

  HttpResponse response = execute(
    make_request(http::verb::delete_, std::string(api::PINS_PATH) + address.to_hex()));
  if (response.result() == http::status::not_found) {
    BOOST_LOG_TRIVIAL(debug) << "Bee client: " << address << " was not pinned";
    return;
  }
  check_status(response, {200}, "unpin_reference");
}


//==============================================
// TAGS
//==============================================

std::uint32_t BeeClient::create_tag(const swarm::Address& address) {
  if (mode_.load() == NodeMode::GatewayProxy) {
    BOOST_LOG_TRIVIAL(debug) << "Bee client: Gateway proxy has no tags, using tag 0";
    return 0;
  }

  HttpRequest request = make_request(http::verb::post, api::TAGS_PATH);
  if (address.is_valid_reference()) {
    request.set(http::field::content_type, api::JSON_CONTENT_TYPE);
    request.body() = json{{"address", address.to_hex()}}.dump();
  }

  HttpResponse response = execute(std::move(request));
  check_status(response, {200, 201}, "create_tag");
  const std::uint32_t uid = decode_tag(response.body()).uid;
  BOOST_LOG_TRIVIAL(debug) << "Bee client: Created tag " << uid;
  return uid;
}

Tag BeeClient::get_tag(std::uint32_t uid) {
  if (mode_.load() == NodeMode::GatewayProxy) {
    BOOST_LOG_TRIVIAL(debug) << "Bee client: Gateway proxy has no tags, reporting tag " << uid << " empty";
    Tag empty;
    empty.uid = uid;
    return empty;
  }

  HttpResponse response = execute(
    make_request(http::verb::get, std::string(api::TAGS_PATH) + "/" + std::to_string(uid)));
  check_status(response, {200, 201}, "get_tag");
  return decode_tag(response.body());
}


//==============================================
// FEEDS
//==============================================

swarm::Address BeeClient::create_feed_manifest(const std::string& owner, const std::string& topic,
                                               const std::string& stamp, bool pin) {
  const std::string batch = require_stamp(stamp, "create_feed_manifest");

  HttpRequest request = make_request(http::verb::post,
    std::string(api::FEEDS_PATH) + escape_component(owner) + "/" + escape_component(topic));
  request.set(api::SWARM_POSTAGE_BATCH_ID, batch);
  if (options_.resolve_pin(pin)) {
    request.set(api::SWARM_PIN, "true");
  }

  HttpResponse response = execute(std::move(request));
  check_status(response, {200, 201}, "create_feed_manifest");
  return decode_reference(response.body());
}

FeedLookup BeeClient::get_latest_feed_manifest(const std::string& owner,
                                               const std::string& topic) {
  HttpResponse response = execute(make_request(http::verb::get,
    std::string(api::FEEDS_PATH) + escape_component(owner) + "/" + escape_component(topic)));
  check_status(response, {200, 201}, "get_latest_feed_manifest");

  FeedLookup lookup;
  lookup.reference = decode_reference(response.body());
  lookup.index = header_value(response, api::SWARM_FEED_INDEX);
  lookup.next_index = header_value(response, api::SWARM_FEED_INDEX_NEXT);
  return lookup;
}


//==============================================
// REQUEST HELPERS
//==============================================

HttpRequest BeeClient::make_request(http::verb method, const std::string& path) const {
  HttpRequest request{method, endpoint_.target(path), 11};
  return request;
}

HttpResponse BeeClient::execute(HttpRequest request, const CallOptions& options) const {
  return transport_->send(std::move(request), options);
}

void BeeClient::check_status(const HttpResponse& response, std::initializer_list<unsigned> accepted,
                             const char* operation) const {
  const unsigned status = response.result_int();
  for (unsigned code : accepted) {
    if (status == code) {
      return;
    }
  }
  ErrorBody body = decode_error_body(response.body());
  BOOST_LOG_TRIVIAL(error) << "Bee client: " << operation << " failed with status " << status
                           << ": " << error_message(body);
  throw ResponseError(status, std::move(body));
}

std::string BeeClient::require_stamp(const std::string& stamp, const char* operation) const {
  std::string batch = options_.resolve_stamp(stamp);
  if (batch.empty()) {
    throw PreconditionError(std::string("Bee client: ") + operation + " requires a postage stamp");
  }
  return batch;
}

void BeeClient::require_reference(const swarm::Address& address, const char* operation) const {
  if (!address.is_valid_reference()) {
    throw PreconditionError(std::string("Bee client: ") + operation + " requires a non-zero address");
  }
}

void BeeClient::set_redundancy(HttpRequest& request, const std::string& redundancy) const {
  const std::string level = options_.resolve_redundancy(redundancy);
  if (!level.empty()) {
    request.set(api::SWARM_REDUNDANCY_LEVEL, level);
  }
}

} // namespace client
} // namespace blockstore
