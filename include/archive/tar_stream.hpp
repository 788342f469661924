#ifndef BLOCKSTORE_ARCHIVE_TAR_STREAM_HPP
#define BLOCKSTORE_ARCHIVE_TAR_STREAM_HPP

#include <cstdint>
#include <string>
#include "archive/collection.hpp"
#include "archive/archive_error.hpp"

namespace blockstore {
namespace archive {

// Single-pass writer for an uncompressed tar archive held in memory.
// Entries are written in order: begin_file, append_file..., end_file.
// After end() the archive is sealed and its bytes can be taken once.
// Not safe for concurrent writers.
class TarStream {
public:
  static constexpr std::size_t BLOCK_SIZE = 512;
  static constexpr std::size_t COPY_BUFFER_SIZE = 32 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TarStream() = default;
  TarStream(const TarStream&) = delete;
  TarStream& operator=(const TarStream&) = delete;


  // ---- ENTRY OPERATIONS ----
  // Writes the header for the next entry; finishes the previous entry first
  void begin_file(const CollectionItem& item);
  // Appends payload bytes to the current entry
  void append_file(const char* data, std::size_t size);
  void append_file(const std::string& data);
  // Pads the current entry to the block boundary
  void end_file();
  // Writes a whole item, draining its stream through a bounded buffer.
  // The item's stream is released on return whether or not the write succeeded.
  void write_item(CollectionItem item);


  // ---- ARCHIVE OPERATIONS ----
  // Finishes the archive with the end-of-archive marker
  void end();
  // Hands out the finished archive bytes; valid once, after end()
  std::string take_output();


  // ---- QUERY OPERATIONS ----
  bool is_closed() const { return closed_; }
  bool is_consumed() const { return consumed_; }
  std::size_t entry_count() const { return entry_count_; }
  std::size_t size() const { return buffer_.size(); }

private:
  // ---- PARAMETERS ----
  std::string buffer_;
  bool closed_{false};
  bool consumed_{false};
  bool in_entry_{false};
  std::uint64_t entry_size_{0};
  std::uint64_t remaining_{0};
  std::size_t entry_count_{0};


  // ---- HEADER ENCODING ----
  void write_header(const std::string& name, const std::string& prefix,
                    std::uint64_t size, char typeflag);
  void write_pax_header(const std::string& path, std::uint64_t size,
                        bool record_path, bool record_size);
  void write_padding(std::uint64_t size);
  void check_open(const char* operation) const;
};

} // namespace archive
} // namespace blockstore

#endif // BLOCKSTORE_ARCHIVE_TAR_STREAM_HPP
