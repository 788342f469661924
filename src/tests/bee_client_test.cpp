#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <sstream>
#include <string>
#include "client/api.hpp"
#include "client/bee_client.hpp"
#include "client/client_error.hpp"
#include "mock_transport.hpp"
#include "test_utils.hpp"

using namespace blockstore::client;
using blockstore::swarm::Address;
using blockstore::swarm::Chunk;
using blockstore::swarm::RedundancyLevel;
using blockstore::archive::CollectionItem;
using blockstore::archive::TarStream;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;
namespace http = boost::beast::http;

class BeeClientTest : public ::testing::Test {
protected:
  const std::string url = "http://localhost:1633";
  const std::string hex_aa = std::string(64, 'a');
  const std::string reference_body = R"({"reference":"0x)" + std::string(64, 'a') + R"("})";

  MockTransport* transport = nullptr;
  std::unique_ptr<BeeClient> client;

  HttpRequest captured;
  CallOptions captured_options;

  void SetUp() override {
    init_test_logging();
    make_client(ClientOptions());
  }

  void make_client(ClientOptions options, const std::string& api_url = "") {
    auto mock = std::make_unique<MockTransport>();
    transport = mock.get();
    client = std::make_unique<BeeClient>(api_url.empty() ? url : api_url, options, std::move(mock));
  }

  // Answers the next request with the response and remembers the request
  void expect_request(HttpResponse response) {
    EXPECT_CALL(*transport, send(_, _))
      .WillOnce([this, response](HttpRequest request, const CallOptions& options) {
        captured = request;
        captured_options = options;
        return response;
      });
  }

  void expect_no_request() {
    EXPECT_CALL(*transport, send(_, _)).Times(0);
  }

  Address address_aa() const {
    return Address::from_hex(hex_aa);
  }

  static ClientOptions with_stamp(const std::string& stamp) {
    ClientOptions options;
    options.stamp = stamp;
    return options;
  }
};

//==============================================
// CHUNKS
//==============================================

TEST_F(BeeClientTest, ChunkUploadSendsTagAndStamp) {
  expect_request(make_response(201, reference_body));

  Address result = client->upload_chunk(7, Chunk(address_aa(), "chunk-data"), "stamp1", "", false);

  EXPECT_EQ(result, address_aa());
  EXPECT_EQ(captured.method(), http::verb::post);
  EXPECT_EQ(captured.target(), "/chunks");
  EXPECT_EQ(header_of(captured, api::SWARM_TAG), "7");
  EXPECT_EQ(header_of(captured, api::SWARM_POSTAGE_BATCH_ID), "stamp1");
  EXPECT_EQ(header_of(captured, api::SWARM_DEFERRED_UPLOAD), "true");
  EXPECT_EQ(header_of(captured, "Content-Type"), api::OCTET_STREAM);
  EXPECT_FALSE(has_header(captured, api::SWARM_PIN));
  EXPECT_FALSE(has_header(captured, api::SWARM_REDUNDANCY_LEVEL));
  EXPECT_EQ(captured.body(), "chunk-data");
}

TEST_F(BeeClientTest, ChunkUploadKeepsLocalAndNetworkRedundancyApart) {
  expect_request(make_response(201, reference_body));

  client->upload_chunk(1, Chunk(address_aa(), "x"), "stamp1", "3", false);

  // The node is asked for level 3
  EXPECT_EQ(header_of(captured, api::SWARM_REDUNDANCY_LEVEL), "3");
  // The request itself is processed without redundancy
  ASSERT_TRUE(captured_options.local_redundancy.has_value());
  EXPECT_EQ(*captured_options.local_redundancy, RedundancyLevel::NONE);
}

TEST_F(BeeClientTest, ChunkUploadAcceptsOnlyCreated) {
  expect_request(make_response(200, reference_body));

  try {
    client->upload_chunk(7, Chunk(address_aa(), "x"), "stamp1", "", false);
    FAIL() << "Expected ResponseError";
  } catch (const ResponseError& e) {
    EXPECT_EQ(e.status_code(), 200u);
    EXPECT_EQ(std::string(e.what()), reference_body);
  }
}

TEST_F(BeeClientTest, SocUploadBuildsOwnerPath) {
  expect_request(make_response(201, reference_body));

  Address result = client->upload_soc("0011", "2233", "beef", "stamp1", "", true, "payload");

  EXPECT_EQ(result, address_aa());
  EXPECT_EQ(captured.target(), "/soc/0011/2233?sig=beef");
  EXPECT_EQ(header_of(captured, api::SWARM_PIN), "true");
  EXPECT_EQ(header_of(captured, api::SWARM_DEFERRED_UPLOAD), "true");
  EXPECT_EQ(captured.body(), "payload");
}

TEST_F(BeeClientTest, SocUploadEscapesPathAndSignature) {
  expect_request(make_response(201, reference_body));

  client->upload_soc("00/11", "22 33", "be+ef", "stamp1", "", false, "payload");

  EXPECT_EQ(captured.target(), "/soc/00%2F11/22%2033?sig=be%2Bef");
}

TEST_F(BeeClientTest, SocUploadRequiresSignatureAndStamp) {
  expect_no_request();

  EXPECT_THROW(client->upload_soc("0011", "2233", "", "stamp1", "", false, "x"), PreconditionError);
  EXPECT_THROW(client->upload_soc("0011", "2233", "beef", "", "", false, "x"), PreconditionError);
}

TEST_F(BeeClientTest, ChunkDownloadCarriesContext) {
  expect_request(make_response(200, "chunk-data"));
  Context context;

  Chunk chunk = client->download_chunk(context, address_aa());

  EXPECT_EQ(captured.method(), http::verb::get);
  EXPECT_EQ(captured.target(), "/chunks/" + hex_aa);
  EXPECT_EQ(captured_options.context, &context);
  EXPECT_EQ(chunk.address(), address_aa());
  EXPECT_EQ(chunk.data(), "chunk-data");
}

TEST_F(BeeClientTest, ChunkDownloadPropagatesCancellation) {
  EXPECT_CALL(*transport, send(_, _)).WillOnce(Throw(CancelledError("cancelled")));
  Context context;
  context.cancel();

  EXPECT_THROW(client->download_chunk(context, address_aa()), CancelledError);
}

TEST_F(BeeClientTest, DownloadsRefuseZeroAndEmptyAddresses) {
  expect_no_request();
  Context context;

  EXPECT_THROW(client->download_chunk(context, Address::zero()), PreconditionError);
  EXPECT_THROW(client->download_blob(Address()), PreconditionError);
  EXPECT_THROW(client->download_archive(Address::zero()), PreconditionError);
  EXPECT_THROW(client->download_archive_file(Address(), "a.txt"), PreconditionError);
  EXPECT_THROW(client->unpin_reference(Address::zero()), PreconditionError);
}


//==============================================
// BLOBS
//==============================================

TEST_F(BeeClientTest, BlobUploadUsesDefaults) {
  ClientOptions options;
  options.stamp = "default-stamp";
  options.redundancy = "2";
  make_client(options);
  expect_request(make_response(201, reference_body));

  std::istringstream data("blob-data");
  Address result = client->upload_blob(0, "", "", false, true, data);

  EXPECT_EQ(result, address_aa());
  EXPECT_EQ(captured.target(), "/bytes");
  EXPECT_EQ(header_of(captured, api::SWARM_POSTAGE_BATCH_ID), "default-stamp");
  EXPECT_EQ(header_of(captured, api::SWARM_REDUNDANCY_LEVEL), "2");
  EXPECT_EQ(header_of(captured, api::SWARM_PIN), "false");
  EXPECT_EQ(header_of(captured, api::SWARM_ENCRYPT), "true");
  EXPECT_FALSE(has_header(captured, api::SWARM_TAG));
  EXPECT_EQ(captured.body(), "blob-data");
}

TEST_F(BeeClientTest, BlobUploadSendsWholeStream) {
  const std::string large(3 * 1024 * 1024 + 17, 'b');
  expect_request(make_response(201, reference_body));

  std::istringstream data(large);
  client->upload_blob(0, "stamp1", "", false, false, data);

  EXPECT_EQ(captured.body().size(), large.size());
  EXPECT_EQ(captured.body(), large);
}

TEST_F(BeeClientTest, BlobUploadSendsNonZeroTag) {
  expect_request(make_response(200, reference_body));

  std::istringstream data("blob-data");
  client->upload_blob(12, "stamp1", "", false, false, data);

  EXPECT_EQ(header_of(captured, api::SWARM_TAG), "12");
  EXPECT_EQ(header_of(captured, api::SWARM_ENCRYPT), "false");
}

TEST_F(BeeClientTest, BlobUploadRejectsUndecodableBody) {
  expect_request(make_response(201, "not json"));

  std::istringstream data("blob-data");
  try {
    client->upload_blob(0, "stamp1", "", false, false, data);
    FAIL() << "Expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_STREQ(e.what(), "error unmarshalling response");
  }
}

TEST_F(BeeClientTest, BlobUploadReportsRawErrorText) {
  expect_request(make_response(500, "storage exhausted"));

  std::istringstream data("blob-data");
  try {
    client->upload_blob(0, "stamp1", "", false, false, data);
    FAIL() << "Expected ResponseError";
  } catch (const ResponseError& e) {
    EXPECT_EQ(e.status_code(), 500u);
    EXPECT_STREQ(e.what(), "storage exhausted");
    EXPECT_TRUE(std::holds_alternative<std::string>(e.body()));
  }
}

TEST_F(BeeClientTest, BlobDownloadNotFound) {
  expect_request(make_response(404, R"({"code":404,"message":"Not Found"})"));

  try {
    client->download_blob(address_aa());
    FAIL() << "Expected ResponseError";
  } catch (const ResponseError& e) {
    EXPECT_EQ(e.status_code(), 404u);
    EXPECT_STREQ(e.what(), "Not Found");
  }
  EXPECT_EQ(captured.target(), "/bytes/" + hex_aa);
}

TEST_F(BeeClientTest, BlobDownloadReturnsStreamAndStatus) {
  expect_request(make_response(200, "blob-data"));

  BlobDownload download = client->download_blob(address_aa());

  EXPECT_EQ(download.status, 200u);
  ASSERT_NE(download.data, nullptr);
  std::ostringstream content;
  content << download.data->rdbuf();
  EXPECT_EQ(content.str(), "blob-data");
}


//==============================================
// COLLECTIONS
//==============================================

TEST_F(BeeClientTest, SingleFileUploadNamesFile) {
  expect_request(make_response(201, reference_body));

  client->upload_file_bzz("file-data", "notes.txt", "stamp1", "1", false);

  EXPECT_EQ(captured.target(), "/bzz?name=notes.txt");
  EXPECT_EQ(header_of(captured, api::SWARM_PIN), "false");
  EXPECT_EQ(header_of(captured, "Content-Type"), api::OCTET_STREAM);
  EXPECT_EQ(header_of(captured, api::SWARM_REDUNDANCY_LEVEL), "1");
  EXPECT_EQ(captured.body(), "file-data");
}

TEST_F(BeeClientTest, SingleFileUploadEscapesName) {
  expect_request(make_response(201, reference_body));

  client->upload_file_bzz("file-data", "a b&c=d.txt", "stamp1", "", false);

  EXPECT_EQ(captured.target(), "/bzz?name=a%20b%26c%3Dd.txt");
}

TEST_F(BeeClientTest, ArchiveUploadSendsTarCollection) {
  TarStream tar;
  CollectionItem item;
  item.path = "a.txt";
  item.size = 5;
  item.file = std::make_unique<std::istringstream>("hello");
  tar.write_item(std::move(item));
  tar.end();
  const std::size_t archive_size = tar.size();

  expect_request(make_response(200, reference_body));
  Address result = client->upload_archive(tar, "stamp1", "", false);

  EXPECT_EQ(result, address_aa());
  EXPECT_EQ(captured.target(), "/bzz");
  EXPECT_EQ(header_of(captured, "Content-Type"), api::TAR_CONTENT_TYPE);
  EXPECT_EQ(header_of(captured, api::SWARM_COLLECTION), "true");
  EXPECT_EQ(header_of(captured, api::SWARM_PIN), "false");
  EXPECT_EQ(captured.body().size(), archive_size);
  EXPECT_TRUE(tar.is_consumed());

  // The archive body is handed out once
  EXPECT_THROW(client->upload_archive(tar, "stamp1", "", false), PreconditionError);
}

TEST_F(BeeClientTest, ArchiveUploadRequiresClosedArchive) {
  expect_no_request();
  TarStream tar;

  EXPECT_THROW(client->upload_archive(tar, "stamp1", "", false), PreconditionError);
}

TEST_F(BeeClientTest, ArchiveDownloadReturnsBytes) {
  expect_request(make_response(200, "tar-bytes"));

  ArchiveDownload download = client->download_archive(address_aa());

  EXPECT_EQ(captured.target(), "/bzz/" + hex_aa);
  EXPECT_EQ(download.status, 200u);
  EXPECT_EQ(download.data, "tar-bytes");
}

TEST_F(BeeClientTest, ArchiveFileDownloadReportsContentLength) {
  expect_request(make_response(200, "hello"));

  FileDownload download = client->download_archive_file(address_aa(), "docs/a.txt");

  EXPECT_EQ(captured.target(), "/bzz/" + hex_aa + "/docs/a.txt");
  EXPECT_EQ(download.content_length, 5u);
  std::ostringstream content;
  content << download.data->rdbuf();
  EXPECT_EQ(content.str(), "hello");
}

TEST_F(BeeClientTest, ArchiveFileDownloadEscapesMemberName) {
  expect_request(make_response(200, "hello"));

  client->download_archive_file(address_aa(), "my file.txt");
  EXPECT_EQ(captured.target(), "/bzz/" + hex_aa + "/my%20file.txt");

  expect_request(make_response(200, "hello"));
  client->download_archive_file(address_aa(), "/docs/50%#1?.txt");
  EXPECT_EQ(captured.target(), "/bzz/" + hex_aa + "/docs/50%25%231%3F.txt");
}

TEST_F(BeeClientTest, ArchiveFileDownloadRejectsBadContentLength) {
  HttpResponse response = make_response(200, "hello");
  response.set(http::field::content_length, "five");
  expect_request(response);

  EXPECT_THROW(client->download_archive_file(address_aa(), "a.txt"), DecodeError);
}


//==============================================
// PINS
//==============================================

TEST_F(BeeClientTest, UnpinTreatsNotFoundAsSuccess) {
  expect_request(make_response(404, R"({"code":404,"message":"Not Found"})"));

  EXPECT_NO_THROW(client->unpin_reference(address_aa()));
  EXPECT_EQ(captured.method(), http::verb::delete_);
  EXPECT_EQ(captured.target(), "/pins/" + hex_aa);
}

TEST_F(BeeClientTest, UnpinReportsOtherFailures) {
  expect_request(make_response(500, R"({"code":500,"message":"db closed"})"));

  EXPECT_THROW(client->unpin_reference(address_aa()), ResponseError);
}


//==============================================
// TAGS
//==============================================

TEST_F(BeeClientTest, CreateTagSeedsAddress) {
  expect_request(make_response(201,
    R"({"uid":42,"startedAt":"2024-01-01T00:00:00Z","total":0,"processed":0,"synced":0})"));

  EXPECT_EQ(client->create_tag(address_aa()), 42u);
  EXPECT_EQ(captured.target(), "/tags");
  EXPECT_EQ(captured.body(), R"({"address":")" + hex_aa + R"("})");
}

TEST_F(BeeClientTest, CreateTagWithoutAddressSendsEmptyBody) {
  expect_request(make_response(201, R"({"uid":3})"));

  EXPECT_EQ(client->create_tag(Address::zero()), 3u);
  EXPECT_TRUE(captured.body().empty());
}

TEST_F(BeeClientTest, GetTagDecodesCounters) {
  expect_request(make_response(200,
    R"({"uid":42,"startedAt":"2024-01-01T00:00:00Z","total":10,"processed":7,"synced":5})"));

  Tag tag = client->get_tag(42);

  EXPECT_EQ(captured.target(), "/tags/42");
  EXPECT_EQ(tag.uid, 42u);
  EXPECT_EQ(tag.total, 10u);
  EXPECT_EQ(tag.processed, 7u);
  EXPECT_EQ(tag.synced, 5u);
}


TEST_F(BeeClientTest, GetTagRejectsUidOutOfRange) {
  expect_request(make_response(200, R"({"uid":4294967296,"total":1})"));
  EXPECT_THROW(client->get_tag(1), DecodeError);

  expect_request(make_response(200, R"({"uid":-1})"));
  EXPECT_THROW(client->get_tag(1), DecodeError);
}


//==============================================
// NODE MODE
//==============================================

TEST_F(BeeClientTest, DetectsFullNode) {
  expect_request(make_response(200, api::BEE_ROOT_BANNER));

  EXPECT_TRUE(client->check_connection());
  EXPECT_EQ(captured.target(), "/");
  EXPECT_EQ(client->node_mode(), NodeMode::FullNode);
}

TEST_F(BeeClientTest, GatewayProxyShortCircuitsTags) {
  {
    InSequence sequence;
    EXPECT_CALL(*transport, send(_, _))
      .WillOnce([](HttpRequest request, const CallOptions&) {
        EXPECT_EQ(request.target(), "/");
        return make_response(404, "404 page not found");
      });
    EXPECT_CALL(*transport, send(_, _))
      .WillOnce([](HttpRequest request, const CallOptions&) {
        EXPECT_EQ(request.target(), "/health");
        return make_response(200, api::GATEWAY_HEALTH_OK);
      });
  }

  EXPECT_TRUE(client->check_connection());
  EXPECT_EQ(client->node_mode(), NodeMode::GatewayProxy);

  // No further requests reach the transport
  EXPECT_EQ(client->create_tag(address_aa()), 0u);
  Tag tag = client->get_tag(99);
  EXPECT_EQ(tag.total, 0u);
  EXPECT_EQ(tag.processed, 0u);
  EXPECT_EQ(tag.synced, 0u);
}

TEST_F(BeeClientTest, UnreachableNodeFailsCheck) {
  EXPECT_CALL(*transport, send(_, _))
    .Times(2)
    .WillRepeatedly(Throw(TransportError("connection refused")));

  EXPECT_FALSE(client->check_connection());
  EXPECT_EQ(client->node_mode(), NodeMode::FullNode);
}


TEST_F(BeeClientTest, LaterCheckLeavesGatewayProxyMode) {
  {
    InSequence sequence;
    EXPECT_CALL(*transport, send(_, _))
      .WillOnce(Return(make_response(404, "404 page not found")));
    EXPECT_CALL(*transport, send(_, _))
      .WillOnce(Return(make_response(200, api::GATEWAY_HEALTH_OK)));
    EXPECT_CALL(*transport, send(_, _))
      .WillOnce(Return(make_response(404, "404 page not found")));
    EXPECT_CALL(*transport, send(_, _))
      .WillOnce(Return(make_response(200, "maintenance")));
  }

  EXPECT_TRUE(client->check_connection());
  EXPECT_EQ(client->node_mode(), NodeMode::GatewayProxy);

  EXPECT_FALSE(client->check_connection());
  EXPECT_EQ(client->node_mode(), NodeMode::FullNode);
}


//==============================================
// DEFAULTS
//==============================================

TEST_F(BeeClientTest, DefaultPinOverridesFalse) {
  ClientOptions options = with_stamp("stamp1");
  options.pin = true;
  make_client(options);

  expect_request(make_response(201, reference_body));
  client->upload_chunk(1, Chunk(address_aa(), "x"), "", "", false);
  EXPECT_EQ(header_of(captured, api::SWARM_PIN), "true");

  expect_request(make_response(201, reference_body));
  std::istringstream data("blob");
  client->upload_blob(0, "", "", false, false, data);
  EXPECT_EQ(header_of(captured, api::SWARM_PIN), "true");
}

TEST_F(BeeClientTest, DefaultFalseKeepsExplicitPin) {
  make_client(with_stamp("stamp1"));
  expect_request(make_response(201, reference_body));

  client->create_feed_manifest("owner", "topic", "", true);

  EXPECT_EQ(header_of(captured, api::SWARM_PIN), "true");
  EXPECT_EQ(header_of(captured, api::SWARM_POSTAGE_BATCH_ID), "stamp1");
}

TEST_F(BeeClientTest, PerCallStampBeatsDefault) {
  make_client(with_stamp("default-stamp"));
  expect_request(make_response(201, reference_body));

  client->upload_file_bzz("x", "x.txt", "call-stamp", "", false);

  EXPECT_EQ(header_of(captured, api::SWARM_POSTAGE_BATCH_ID), "call-stamp");
}

TEST_F(BeeClientTest, WritesWithoutAnyStampFail) {
  expect_no_request();
  std::istringstream data("blob");

  EXPECT_THROW(client->upload_chunk(1, Chunk(address_aa(), "x"), "", "", false), PreconditionError);
  EXPECT_THROW(client->upload_blob(0, "", "", false, false, data), PreconditionError);
  EXPECT_THROW(client->upload_file_bzz("x", "x.txt", "", "", false), PreconditionError);
  EXPECT_THROW(client->create_feed_manifest("owner", "topic", "", false), PreconditionError);
}

TEST_F(BeeClientTest, BasePathPrefixesTargets) {
  make_client(ClientOptions(), "http://localhost:1633/api/");
  expect_request(make_response(200, "x"));

  client->download_blob(address_aa());

  EXPECT_EQ(captured.target(), "/api/bytes/" + hex_aa);
}


//==============================================
// FEEDS
//==============================================

TEST_F(BeeClientTest, FeedManifestCreate) {
  expect_request(make_response(201, reference_body));

  Address manifest = client->create_feed_manifest("owner", "topic", "stamp1", false);

  EXPECT_EQ(manifest, address_aa());
  EXPECT_EQ(captured.method(), http::verb::post);
  EXPECT_EQ(captured.target(), "/feeds/owner/topic");
  EXPECT_FALSE(has_header(captured, api::SWARM_PIN));
}

TEST_F(BeeClientTest, FeedLookupReadsIndexHeaders) {
  expect_request(make_response(200, reference_body, {
    {api::SWARM_FEED_INDEX, "0000000000000004"},
    {api::SWARM_FEED_INDEX_NEXT, "0000000000000005"}
  }));

  FeedLookup lookup = client->get_latest_feed_manifest("owner", "topic");

  EXPECT_EQ(captured.method(), http::verb::get);
  EXPECT_EQ(captured.target(), "/feeds/owner/topic");
  EXPECT_EQ(lookup.reference, address_aa());
  EXPECT_EQ(lookup.index, "0000000000000004");
  EXPECT_EQ(lookup.next_index, "0000000000000005");
}

TEST_F(BeeClientTest, FeedPathsEscapeOwnerAndTopic) {
  expect_request(make_response(201, reference_body));
  client->create_feed_manifest("owner", "my topic/1", "stamp1", false);
  EXPECT_EQ(captured.target(), "/feeds/owner/my%20topic%2F1");

  expect_request(make_response(200, reference_body));
  client->get_latest_feed_manifest("owner", "my topic/1");
  EXPECT_EQ(captured.target(), "/feeds/owner/my%20topic%2F1");
}

TEST_F(BeeClientTest, FeedLookupWithoutHeadersHasEmptyIndexes) {
  expect_request(make_response(200, reference_body));

  FeedLookup lookup = client->get_latest_feed_manifest("owner", "topic");

  EXPECT_TRUE(lookup.index.empty());
  EXPECT_TRUE(lookup.next_index.empty());
}
