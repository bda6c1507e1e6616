#ifndef CHUNKVAULT_HTTP_HTTP_SERVER_HPP
#define CHUNKVAULT_HTTP_HTTP_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "storage/file_storage.hpp"

namespace chunkvault {
namespace http {

struct HttpConfig {
  std::string address{"127.0.0.1"};
  // Zero picks an ephemeral port, see HttpServer::local_port()
  uint16_t port{8080};
  std::size_t worker_threads{4};
  std::size_t upload_chunk_size{10000000};
  int upload_parallelism{4};
  int download_parallelism{4};
};

// Decodes %XX escapes in a request path segment, throws std::invalid_argument on bad escapes
std::string percent_decode(const std::string& segment);

// Serves the storage over HTTP/1.1:
//   POST /upload/{fileName}    raw body stored as the file
//   GET  /download/{fileName}  exact bytes, application/octet-stream
//   GET  /files                newline-separated uploaded names
// Accepts on an io_context thread; each connection is served synchronously on a
// worker pool thread and closed after one response.
class HttpServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(storage::FileStorage& storage, const HttpConfig& config);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start();
  void shutdown();


  // ---- GETTERS ----
  // Bound port once started
  uint16_t local_port() const;
  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  storage::FileStorage& storage_;
  HttpConfig config_;

  // Server state
  std::atomic<bool> is_running_{false};
  std::unique_ptr<std::thread> io_thread_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  boost::asio::thread_pool workers_;


  // ---- CONNECTION HANDLING ----
  // Re-arms itself after every accepted connection
  void start_accept();
  // Reads one request, dispatches it and writes the response
  void handle_connection(boost::asio::ip::tcp::socket& socket);
};

} // namespace http
} // namespace chunkvault

#endif // CHUNKVAULT_HTTP_HTTP_SERVER_HPP
