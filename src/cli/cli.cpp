#include "cli/cli.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "archive/tar_stream.hpp"

namespace blockstore {
namespace cli {

namespace fs = std::filesystem;

namespace {

// Expected argument count per command
struct CommandUsage {
  const char* name;
  std::size_t arguments;
  const char* usage;
};

const CommandUsage COMMANDS[] = {
  {"help", 0, "help"},
  {"check", 0, "check"},
  {"upload", 1, "upload <file>"},
  {"upload-dir", 1, "upload-dir <dir>"},
  {"blob", 1, "blob <file>"},
  {"download", 2, "download <reference> <output>"},
  {"get", 3, "get <reference> <filename> <output>"},
  {"tag", 1, "tag <uid>"},
  {"unpin", 1, "unpin <reference>"},
  {"feed-create", 2, "feed-create <owner> <topic>"},
  {"feed-get", 2, "feed-get <owner> <topic>"},
};

const CommandUsage* find_command(const std::string& name) {
  for (const auto& command : COMMANDS) {
    if (name == command.name) {
      return &command;
    }
  }
  return nullptr;
}

void write_stream_to_file(std::istream& data, const std::string& output) {
  std::ofstream file(output, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open " + output + " for writing");
  }
  file << data.rdbuf();
  if (!file) {
    throw std::runtime_error("Failed writing " + output);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::Client& client, std::istream& in, std::ostream& out)
  : running_(false)
  , client_(client)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "Blockstore_Shell> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      out_ << "Blockstore_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  const CommandUsage* usage = find_command(command);
  if (!usage) {
    out_ << "Unknown command: " << command << ". Type 'help' for a list of commands" << std::endl;
    return;
  }
  if (args.size() != usage->arguments) {
    out_ << "Invalid input. Usage: " << usage->usage << std::endl;
    return;
  }

  try {
    if (command == "help") {
      handle_help_command();
    } else if (command == "check") {
      handle_check_command();
    } else if (command == "upload") {
      handle_upload_command(args[0]);
    } else if (command == "upload-dir") {
      handle_upload_dir_command(args[0]);
    } else if (command == "blob") {
      handle_blob_command(args[0]);
    } else if (command == "download") {
      handle_download_command(args[0], args[1]);
    } else if (command == "get") {
      handle_get_command(args[0], args[1], args[2]);
    } else if (command == "tag") {
      handle_tag_command(args[0]);
    } else if (command == "unpin") {
      handle_unpin_command(args[0]);
    } else if (command == "feed-create") {
      handle_feed_create_command(args[0], args[1]);
    } else if (command == "feed-get") {
      handle_feed_get_command(args[0], args[1]);
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + command, e.what());
  }
}

void CLI::handle_check_command() {
  if (client_.check_connection()) {
    out_ << "Connected to " << client::node_mode_name(client_.node_mode()) << std::endl;
  } else {
    out_ << "Node is not reachable" << std::endl;
  }
}

void CLI::handle_upload_command(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << path << std::endl;
    return;
  }
  std::ostringstream data;
  data << file.rdbuf();

  const std::string name = fs::path(path).filename().string();
  swarm::Address reference = client_.upload_file_bzz(data.str(), name, "", "", false);
  out_ << "Uploaded " << name << ": " << reference << std::endl;
}

void CLI::handle_upload_dir_command(const std::string& dir) {
  if (!fs::is_directory(dir)) {
    out_ << "Not a directory: " << dir << std::endl;
    return;
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::recursive_directory_iterator(dir)) {
    if (entry.is_regular_file()) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  archive::TarStream tar;
  for (const auto& file : files) {
    archive::CollectionItem item;
    item.path = fs::relative(file, dir).generic_string();
    item.size = fs::file_size(file);
    item.file = std::make_unique<std::ifstream>(file, std::ios::binary);
    tar.write_item(std::move(item));
  }
  tar.end();

  const std::size_t entries = tar.entry_count();
  swarm::Address reference = client_.upload_archive(tar, "", "", false);
  out_ << "Uploaded " << entries << " files from " << dir << ": " << reference << std::endl;
}

void CLI::handle_blob_command(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << path << std::endl;
    return;
  }
  swarm::Address reference = client_.upload_blob(0, "", "", false, false, file);
  out_ << "Uploaded blob: " << reference << std::endl;
}

void CLI::handle_download_command(const std::string& reference, const std::string& output) {
  client::BlobDownload download = client_.download_blob(swarm::Address::from_hex(reference));
  write_stream_to_file(*download.data, output);
  out_ << "Saved " << reference << " to " << output << std::endl;
}

void CLI::handle_get_command(const std::string& reference, const std::string& filename,
                             const std::string& output) {
  client::FileDownload download =
    client_.download_archive_file(swarm::Address::from_hex(reference), filename);
  write_stream_to_file(*download.data, output);
  out_ << "Saved " << filename << " (" << download.content_length << " bytes) to " << output << std::endl;
}

void CLI::handle_tag_command(const std::string& uid) {
  std::size_t consumed = 0;
  unsigned long long value = std::stoull(uid, &consumed);
  if (consumed != uid.size() || uid.front() == '-' ||
      value > std::numeric_limits<std::uint32_t>::max()) {
    out_ << "Invalid tag uid: " << uid << std::endl;
    return;
  }
  client::Tag tag = client_.get_tag(static_cast<std::uint32_t>(value));
  out_ << "Tag " << tag.uid << ": total " << tag.total << ", processed " << tag.processed
       << ", synced " << tag.synced << std::endl;
}

void CLI::handle_unpin_command(const std::string& reference) {
  client_.unpin_reference(swarm::Address::from_hex(reference));
  out_ << "Unpinned " << reference << std::endl;
}

void CLI::handle_feed_create_command(const std::string& owner, const std::string& topic) {
  swarm::Address manifest = client_.create_feed_manifest(owner, topic, "", false);
  out_ << "Feed manifest: " << manifest << std::endl;
}

void CLI::handle_feed_get_command(const std::string& owner, const std::string& topic) {
  client::FeedLookup lookup = client_.get_latest_feed_manifest(owner, topic);
  out_ << "Feed reference: " << lookup.reference << std::endl;
  out_ << "Index: " << lookup.index << ", next: " << lookup.next_index << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                           Display this help message" << std::endl;
  out_ << "  check                          Probe the node and report its kind" << std::endl;
  out_ << "  upload <file>                  Upload <file> as a single file collection" << std::endl;
  out_ << "  upload-dir <dir>               Upload every file under <dir> as one collection" << std::endl;
  out_ << "  blob <file>                    Upload <file> as raw bytes" << std::endl;
  out_ << "  download <ref> <out>           Save the blob <ref> to <out>" << std::endl;
  out_ << "  get <ref> <name> <out>         Save file <name> of collection <ref> to <out>" << std::endl;
  out_ << "  tag <uid>                      Show sync progress of tag <uid>" << std::endl;
  out_ << "  unpin <ref>                    Remove the pin on <ref>" << std::endl;
  out_ << "  feed-create <owner> <topic>    Create a feed manifest" << std::endl;
  out_ << "  feed-get <owner> <topic>       Show the latest feed update" << std::endl;
  out_ << "  quit                           Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace blockstore
