#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "client/client.hpp"

namespace blockstore {
namespace cli {

// Interactive shell driving a storage client.
// Reads one command per line from the input stream until "quit" or end of input.
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(client::Client& client, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    client::Client& client_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_check_command();
    void handle_upload_command(const std::string& path);
    void handle_upload_dir_command(const std::string& dir);
    void handle_blob_command(const std::string& path);
    void handle_download_command(const std::string& reference, const std::string& output);
    void handle_get_command(const std::string& reference, const std::string& filename,
                            const std::string& output);
    void handle_tag_command(const std::string& uid);
    void handle_unpin_command(const std::string& reference);
    void handle_feed_create_command(const std::string& owner, const std::string& topic);
    void handle_feed_get_command(const std::string& owner, const std::string& topic);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace blockstore
