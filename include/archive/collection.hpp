#ifndef BLOCKSTORE_ARCHIVE_COLLECTION_HPP
#define BLOCKSTORE_ARCHIVE_COLLECTION_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace blockstore {
namespace archive {

// One file of a collection upload. The stream is owned by the item and
// handed over to the archive writer, which releases it when done.
struct CollectionItem {
  std::string path;
  std::uint64_t size{0};
  std::unique_ptr<std::istream> file;
};

} // namespace archive
} // namespace blockstore

#endif // BLOCKSTORE_ARCHIVE_COLLECTION_HPP
