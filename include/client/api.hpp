#ifndef BLOCKSTORE_CLIENT_API_HPP
#define BLOCKSTORE_CLIENT_API_HPP

// Wire names of the Bee HTTP API this client speaks.
// They must match the node's API exactly.

namespace blockstore {
namespace client {
namespace api {

// ---- PATHS ----
constexpr const char* HEALTH_PATH = "/health";
constexpr const char* SOC_PATH = "/soc/";
constexpr const char* CHUNKS_PATH = "/chunks";
constexpr const char* BYTES_PATH = "/bytes";
constexpr const char* BZZ_PATH = "/bzz";
constexpr const char* TAGS_PATH = "/tags";
constexpr const char* PINS_PATH = "/pins/";
constexpr const char* FEEDS_PATH = "/feeds/";


// ---- REQUEST HEADERS ----
constexpr const char* SWARM_POSTAGE_BATCH_ID = "Swarm-Postage-Batch-Id";
constexpr const char* SWARM_PIN = "Swarm-Pin";
constexpr const char* SWARM_ENCRYPT = "Swarm-Encrypt";
constexpr const char* SWARM_TAG = "Swarm-Tag";
constexpr const char* SWARM_DEFERRED_UPLOAD = "Swarm-Deferred-Upload";
constexpr const char* SWARM_REDUNDANCY_LEVEL = "Swarm-Redundancy-Level";
constexpr const char* SWARM_COLLECTION = "Swarm-Collection";


// ---- RESPONSE HEADERS ----
constexpr const char* SWARM_FEED_INDEX = "swarm-feed-index";
constexpr const char* SWARM_FEED_INDEX_NEXT = "swarm-feed-index-next";


// ---- CONTENT TYPES ----
constexpr const char* OCTET_STREAM = "application/octet-stream";
constexpr const char* TAR_CONTENT_TYPE = "application/x-tar";
constexpr const char* JSON_CONTENT_TYPE = "application/json";


// ---- NODE IDENTIFICATION ----
// Body served at "/" by a full Bee node
constexpr const char* BEE_ROOT_BANNER = "Ethereum Swarm Bee\n";
// Body served at "/health" by a gateway proxy
constexpr const char* GATEWAY_HEALTH_OK = "OK";

} // namespace api
} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_API_HPP
