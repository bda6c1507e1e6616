#pragma once

#include <iostream>
#include <string>
#include "storage/file_storage.hpp"

namespace chunkvault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(storage::FileStorage& storage, std::size_t chunk_size, int parallel,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    storage::FileStorage& storage_;
    std::size_t chunk_size_;
    int parallel_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& first, const std::string& second);
    void handle_upload_command(const std::string& path, const std::string& file_name);
    void handle_download_command(const std::string& file_name, const std::string& path);
    void handle_list_command();
    void handle_info_command(const std::string& file_name);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace chunkvault
