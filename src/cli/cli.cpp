#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
CLI::CLI(storage::FileStorage& storage, std::size_t chunk_size, int parallel,
         std::istream& input, std::ostream& output)
  : running_(false)
  , storage_(storage)
  , chunk_size_(chunk_size)
  , parallel_(parallel)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;
  
  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "chunkvault> " << std::flush;
  
  while (running_ && std::getline(input_, line)) {
    if (line == "quit") {
      running_ = false;
      continue;
    }

    std::istringstream iss(line);
    std::string command, first, second;
    iss >> command >> first >> second;

    if (!command.empty()) {
      process_command(command, first, second);
    }

    if (running_) {
      output_ << "chunkvault> " << std::flush;
    }
  }
  
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING 
//==============================================

void CLI::process_command(const std::string& command, const std::string& first, const std::string& second) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " " << first << " " << second;

  if (command == "upload" && !first.empty()) {
    // Stored under the local file name unless one is given
    handle_upload_command(first, second.empty() ? std::filesystem::path(first).filename().string() : second);
  }
  else if (command == "download" && !first.empty()) {
    handle_download_command(first, second.empty() ? first : second);
  }
  else if (command == "ls") {
    handle_list_command();
  }
  else if (command == "info" && !first.empty()) {
    handle_info_command(first);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments, type 'help'" << std::endl;
  }
}

void CLI::handle_upload_command(const std::string& path, const std::string& file_name) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << path << std::endl;
    return;
  }

  try {
    storage::IstreamByteSource source(file);
    storage_.upload_file(source, file_name, chunk_size_, parallel_);
    output_ << "Uploaded " << path << " as " << file_name << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
  }
}

void CLI::handle_download_command(const std::string& file_name, const std::string& path) {
  try {
    auto content = storage_.download_file(file_name, parallel_);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
      output_ << "Error creating file: " << path << std::endl;
      return;
    }
    file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    if (!file) {
      output_ << "Error writing file: " << path << std::endl;
      return;
    }
    output_ << "Downloaded " << file_name << " (" << content.size() << " bytes) to " << path << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error downloading file", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    auto names = storage_.list_uploaded_files();
    output_ << "Uploaded files:" << std::endl;
    for (const auto& name : names) {
      output_ << "  " << name << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing files", e.what());
  }
}

void CLI::handle_info_command(const std::string& file_name) {
  try {
    auto metadata = storage_.get_metadata(file_name);
    output_ << "File:     " << metadata.file_name << "\n"
            << "Size:     " << metadata.total_size << " bytes\n"
            << "Chunks:   " << metadata.total_chunks << " x " << metadata.chunk_size << " bytes\n"
            << "SHA-1:    " << metadata.checksum << "\n"
            << "Uploaded: " << boost::posix_time::to_simple_string(metadata.created_at) << " UTC" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading metadata", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                      Display this help message" << std::endl;
  output_ << "  upload <path> [name]      Upload local <path>, stored as [name]" << std::endl;
  output_ << "  download <name> [path]    Download <name> into local [path]" << std::endl;
  output_ << "  ls                        List uploaded files" << std::endl;
  output_ << "  info <name>               Show metadata of <name>" << std::endl;
  output_ << "  quit                      Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace chunkvault
