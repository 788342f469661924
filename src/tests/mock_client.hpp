#ifndef BLOCKSTORE_MOCK_CLIENT_HPP
#define BLOCKSTORE_MOCK_CLIENT_HPP

#include <gmock/gmock.h>
#include "client/client.hpp"

using blockstore::swarm::Address;
using blockstore::swarm::Chunk;

class MockClient : public blockstore::client::Client {
public:
    MOCK_METHOD(bool, check_connection, (), (override));
    MOCK_METHOD(blockstore::client::NodeMode, node_mode, (), (const, override));
    MOCK_METHOD(Address, upload_soc,
                (const std::string& owner, const std::string& id, const std::string& signature,
                 const std::string& stamp, const std::string& redundancy, bool pin,
                 const std::string& data),
                (override));
    MOCK_METHOD(Address, upload_chunk,
                (std::uint32_t tag, const Chunk& chunk, const std::string& stamp,
                 const std::string& redundancy, bool pin),
                (override));
    MOCK_METHOD(Chunk, download_chunk,
                (blockstore::client::Context& context, const Address& address), (override));
    MOCK_METHOD(Address, upload_blob,
                (std::uint32_t tag, const std::string& stamp, const std::string& redundancy,
                 bool pin, bool encrypt, std::istream& data),
                (override));
    MOCK_METHOD(blockstore::client::BlobDownload, download_blob, (const Address& address), (override));
    MOCK_METHOD(Address, upload_file_bzz,
                (const std::string& data, const std::string& filename, const std::string& stamp,
                 const std::string& redundancy, bool pin),
                (override));
    MOCK_METHOD(Address, upload_archive,
                (blockstore::archive::TarStream& archive, const std::string& stamp,
                 const std::string& redundancy, bool pin),
                (override));
    MOCK_METHOD(blockstore::client::ArchiveDownload, download_archive, (const Address& address), (override));
    MOCK_METHOD(blockstore::client::FileDownload, download_archive_file,
                (const Address& address, const std::string& filename), (override));
    MOCK_METHOD(void, unpin_reference, (const Address& address), (override));
    MOCK_METHOD(std::uint32_t, create_tag, (const Address& address), (override));
    MOCK_METHOD(blockstore::client::Tag, get_tag, (std::uint32_t uid), (override));
    MOCK_METHOD(Address, create_feed_manifest,
                (const std::string& owner, const std::string& topic, const std::string& stamp, bool pin),
                (override));
    MOCK_METHOD(blockstore::client::FeedLookup, get_latest_feed_manifest,
                (const std::string& owner, const std::string& topic), (override));
};

#endif // BLOCKSTORE_MOCK_CLIENT_HPP
