#include "archive/tar_stream.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <ctime>
#include <vector>

namespace blockstore {
namespace archive {

namespace {

// USTAR header field offsets and widths
constexpr std::size_t NAME_OFFSET = 0, NAME_SIZE = 100;
constexpr std::size_t MODE_OFFSET = 100, MODE_SIZE = 8;
constexpr std::size_t UID_OFFSET = 108, UID_SIZE = 8;
constexpr std::size_t GID_OFFSET = 116, GID_SIZE = 8;
constexpr std::size_t SIZE_OFFSET = 124, SIZE_SIZE = 12;
constexpr std::size_t MTIME_OFFSET = 136, MTIME_SIZE = 12;
constexpr std::size_t CHKSUM_OFFSET = 148, CHKSUM_SIZE = 8;
constexpr std::size_t TYPEFLAG_OFFSET = 156;
constexpr std::size_t MAGIC_OFFSET = 257;
constexpr std::size_t VERSION_OFFSET = 263;
constexpr std::size_t PREFIX_OFFSET = 345, PREFIX_SIZE = 155;

constexpr char TYPE_REGULAR = '0';
constexpr char TYPE_PAX = 'x';
constexpr unsigned FILE_MODE = 0777;

// Largest value an 11 digit octal size field holds
constexpr std::uint64_t MAX_OCTAL_SIZE = 077777777777ULL;

using HeaderBlock = std::array<char, TarStream::BLOCK_SIZE>;

void put_string(HeaderBlock& block, std::size_t offset, std::size_t width, const std::string& value) {
  std::memcpy(block.data() + offset, value.data(), std::min(width, value.size()));
}

// Writes width-1 zero padded octal digits followed by NUL
void put_octal(HeaderBlock& block, std::size_t offset, std::size_t width, std::uint64_t value) {
  for (std::size_t i = width - 1; i > 0; --i) {
    block[offset + i - 1] = static_cast<char>('0' + (value & 07));
    value >>= 3;
  }
  block[offset + width - 1] = '\0';
}

bool is_ascii(const std::string& value) {
  return std::all_of(value.begin(), value.end(),
    [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

// Splits a long path into USTAR prefix and name at a '/' so both fit.
// Returns false when no such split exists.
bool split_ustar_path(const std::string& path, std::string& prefix, std::string& name) {
  std::size_t length = path.size();
  if (length <= NAME_SIZE || !is_ascii(path)) {
    return false;
  }
  if (length > PREFIX_SIZE + 1) {
    length = PREFIX_SIZE + 1;
  } else if (path[length - 1] == '/') {
    --length;
  }

  std::size_t slash = path.rfind('/', length - 1);
  if (slash == std::string::npos || slash == 0) {
    return false;
  }
  std::size_t name_length = path.size() - slash - 1;
  if (name_length == 0 || name_length > NAME_SIZE || slash > PREFIX_SIZE) {
    return false;
  }

  prefix = path.substr(0, slash);
  name = path.substr(slash + 1);
  return true;
}

// A PAX record is "<length> <key>=<value>\n" where length counts itself
std::string pax_record(const std::string& key, const std::string& value) {
  const std::size_t base = key.size() + value.size() + 3;  // ' ', '=' and '\n'
  std::size_t total = base + std::to_string(base).size();
  if (std::to_string(total).size() != std::to_string(base).size()) {
    ++total;
  }
  return std::to_string(total) + " " + key + "=" + value + "\n";
}

std::string base_name(const std::string& path) {
  std::string trimmed = path;
  while (trimmed.size() > 1 && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  std::size_t slash = trimmed.rfind('/');
  return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

} // namespace

//==============================================
// ENTRY OPERATIONS
//==============================================

void TarStream::begin_file(const CollectionItem& item) {
  check_open("begin_file");

  if (item.path.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Tar stream: Refusing entry with empty path";
    throw ArchiveError("Tar stream: Empty entry path");
  }

  // Finish the previous entry, fails if it is short
  end_file();

  BOOST_LOG_TRIVIAL(debug) << "Tar stream: Beginning entry " << item.path << " (" << item.size << " bytes)";

  std::string prefix;
  std::string name = item.path;
  bool long_path = false;
  if (item.path.size() > NAME_SIZE || !is_ascii(item.path)) {
    long_path = !split_ustar_path(item.path, prefix, name);
  }
  const bool large_size = item.size > MAX_OCTAL_SIZE;

  if (long_path || large_size) {
    write_pax_header(item.path, item.size, long_path, large_size);
    if (long_path) {
      prefix.clear();
      name = item.path.substr(0, NAME_SIZE);
    }
  }

  write_header(name, prefix, large_size ? 0 : item.size, TYPE_REGULAR);

  in_entry_ = true;
  entry_size_ = item.size;
  remaining_ = item.size;
  ++entry_count_;
}

void TarStream::append_file(const char* data, std::size_t size) {
  check_open("append_file");

  if (!in_entry_) {
    throw ArchiveError("Tar stream: No entry in progress");
  }
  if (size > remaining_) {
    BOOST_LOG_TRIVIAL(error) << "Tar stream: Write of " << size << " bytes exceeds remaining "
                             << remaining_ << " bytes of entry";
    throw ArchiveError("Tar stream: Write too long");
  }

  buffer_.append(data, size);
  remaining_ -= size;
}

void TarStream::append_file(const std::string& data) {
  append_file(data.data(), data.size());
}

void TarStream::end_file() {
  if (!in_entry_) {
    return;
  }
  if (remaining_ > 0) {
    BOOST_LOG_TRIVIAL(error) << "Tar stream: Entry ended with " << remaining_ << " bytes missing";
    throw ArchiveError("Tar stream: Missed writing " + std::to_string(remaining_) + " bytes");
  }

  write_padding(entry_size_);
  in_entry_ = false;
}

void TarStream::write_item(CollectionItem item) {
  // Owning the stream here releases it on every exit path
  std::unique_ptr<std::istream> file = std::move(item.file);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Tar stream: Collection item has no stream: " << item.path;
    throw ArchiveError("Tar stream: Invalid collection item");
  }

  begin_file(item);

  std::vector<char> buffer(COPY_BUFFER_SIZE);
  std::uint64_t copied = 0;
  while (file->read(buffer.data(), buffer.size()) || file->gcount() > 0) {
    append_file(buffer.data(), static_cast<std::size_t>(file->gcount()));
    copied += static_cast<std::uint64_t>(file->gcount());
  }

  if (file->bad()) {
    BOOST_LOG_TRIVIAL(error) << "Tar stream: Failed reading stream for " << item.path;
    throw ArchiveError("Tar stream: Failed to read collection item");
  }

  end_file();
  BOOST_LOG_TRIVIAL(debug) << "Tar stream: Wrote " << copied << " bytes for " << item.path;
}


//==============================================
// ARCHIVE OPERATIONS
//==============================================

void TarStream::end() {
  check_open("end");
  end_file();

  // Two zero blocks mark the end of the archive
  buffer_.append(2 * BLOCK_SIZE, '\0');
  closed_ = true;

  BOOST_LOG_TRIVIAL(info) << "Tar stream: Archive closed with " << entry_count_
                          << " entries, " << buffer_.size() << " bytes";
}

std::string TarStream::take_output() {
  if (!closed_) {
    throw ArchiveError("Tar stream: Archive is not closed");
  }
  if (consumed_) {
    throw ArchiveError("Tar stream: Archive output already taken");
  }
  consumed_ = true;
  return std::move(buffer_);
}


//==============================================
// HEADER ENCODING
//==============================================

void TarStream::write_header(const std::string& name, const std::string& prefix,
                             std::uint64_t size, char typeflag) {
  HeaderBlock block{};

  put_string(block, NAME_OFFSET, NAME_SIZE, name);
  put_octal(block, MODE_OFFSET, MODE_SIZE, FILE_MODE);
  put_octal(block, UID_OFFSET, UID_SIZE, 0);
  put_octal(block, GID_OFFSET, GID_SIZE, 0);
  put_octal(block, SIZE_OFFSET, SIZE_SIZE, size);
  put_octal(block, MTIME_OFFSET, MTIME_SIZE, static_cast<std::uint64_t>(std::time(nullptr)));
  block[TYPEFLAG_OFFSET] = typeflag;
  put_string(block, MAGIC_OFFSET, 6, std::string("ustar\0", 6));
  put_string(block, VERSION_OFFSET, 2, "00");
  put_string(block, PREFIX_OFFSET, PREFIX_SIZE, prefix);

  // Checksum is computed with the checksum field set to spaces
  std::fill(block.begin() + CHKSUM_OFFSET, block.begin() + CHKSUM_OFFSET + CHKSUM_SIZE, ' ');
  unsigned checksum = 0;
  for (char c : block) {
    checksum += static_cast<unsigned char>(c);
  }
  put_octal(block, CHKSUM_OFFSET, CHKSUM_SIZE - 1, checksum);
  block[CHKSUM_OFFSET + CHKSUM_SIZE - 1] = ' ';

  buffer_.append(block.data(), block.size());
}

void TarStream::write_pax_header(const std::string& path, std::uint64_t size,
                                 bool record_path, bool record_size) {
  std::string records;
  if (record_path) {
    records += pax_record("path", path);
  }
  if (record_size) {
    records += pax_record("size", std::to_string(size));
  }

  std::string pax_name = ("PaxHeaders.0/" + base_name(path)).substr(0, NAME_SIZE);
  BOOST_LOG_TRIVIAL(debug) << "Tar stream: Writing PAX header for " << path;

  write_header(pax_name, "", records.size(), TYPE_PAX);
  buffer_.append(records);
  write_padding(records.size());
}

void TarStream::write_padding(std::uint64_t size) {
  const std::uint64_t tail = size % BLOCK_SIZE;
  if (tail != 0) {
    buffer_.append(static_cast<std::size_t>(BLOCK_SIZE - tail), '\0');
  }
}

void TarStream::check_open(const char* operation) const {
  if (closed_) {
    BOOST_LOG_TRIVIAL(error) << "Tar stream: " << operation << " called on a closed archive";
    throw ArchiveError("Tar stream: Archive is closed");
  }
}

} // namespace archive
} // namespace blockstore
