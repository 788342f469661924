#ifndef BLOCKSTORE_ARCHIVE_ERROR_HPP
#define BLOCKSTORE_ARCHIVE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blockstore {
namespace archive {

class ArchiveError : public std::runtime_error {
public:
  explicit ArchiveError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace archive
} // namespace blockstore

#endif // BLOCKSTORE_ARCHIVE_ERROR_HPP
