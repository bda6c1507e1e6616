#include "http/http_server.hpp"
#include <cctype>
#include <stdexcept>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>
#include "backend/backend_error.hpp"

namespace chunkvault {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::size_t BODY_FRAGMENT_SIZE = 64 * 1024;
constexpr const char* SERVER_NAME = "chunkvault";
constexpr const char* UPLOAD_PREFIX = "/upload/";
constexpr const char* DOWNLOAD_PREFIX = "/download/";
constexpr const char* FILES_PATH = "/files";

// Streams the request body straight off the socket, one fragment per read
class RequestBodySource : public storage::ByteSource {
public:
  RequestBodySource(tcp::socket& socket, beast::flat_buffer& buffer,
                    bhttp::request_parser<bhttp::buffer_body>& parser)
    : socket_(socket), buffer_(buffer), parser_(parser) {}

  bool next(backend::Bytes& fragment) override {
    if (parser_.is_done()) {
      return false;
    }

    fragment.resize(BODY_FRAGMENT_SIZE);
    parser_.get().body().data = fragment.data();
    parser_.get().body().size = fragment.size();

    beast::error_code ec;
    bhttp::read(socket_, buffer_, parser_, ec);
    // need_buffer only means our fragment is full
    if (ec == bhttp::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to read request body: " << ec.message();
      throw beast::system_error(ec);
    }

    fragment.resize(BODY_FRAGMENT_SIZE - parser_.get().body().size);
    return !fragment.empty() || !parser_.is_done();
  }

private:
  tcp::socket& socket_;
  beast::flat_buffer& buffer_;
  bhttp::request_parser<bhttp::buffer_body>& parser_;
};

bhttp::response<bhttp::string_body> make_response(bhttp::status status, unsigned version,
                                                  std::string body,
                                                  const char* content_type = "text/plain") {
  bhttp::response<bhttp::string_body> res{status, version};
  res.set(bhttp::field::server, SERVER_NAME);
  res.set(bhttp::field::content_type, content_type);
  res.body() = std::move(body);
  return res;
}

template <class Response>
void write_response(tcp::socket& socket, Response& res) {
  res.keep_alive(false);
  res.prepare_payload();

  beast::error_code ec;
  bhttp::write(socket, res, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Write error: " << ec.message();
  }

  // Close after sending the response
  socket.shutdown(tcp::socket::shutdown_send, ec);
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string percent_decode(const std::string& segment) {
  std::string decoded;
  decoded.reserve(segment.size());

  for (std::size_t i = 0; i < segment.size(); ++i) {
    if (segment[i] != '%') {
      decoded.push_back(segment[i]);
      continue;
    }
    if (i + 2 >= segment.size() ||
        !std::isxdigit(static_cast<unsigned char>(segment[i + 1])) ||
        !std::isxdigit(static_cast<unsigned char>(segment[i + 2]))) {
      throw std::invalid_argument("Malformed percent escape in: " + segment);
    }
    decoded.push_back(static_cast<char>(std::stoi(segment.substr(i + 1, 2), nullptr, 16)));
    i += 2;
  }
  return decoded;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(storage::FileStorage& storage, const HttpConfig& config)
  : storage_(storage)
  , config_(config)
  , workers_(config.worker_threads == 0 ? 1 : config.worker_threads) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing on " << config_.address << ":" << config_.port
                          << " with " << config_.worker_threads << " workers";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(config_.address), config_.port);

    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);

    is_running_ = true;
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        boost::asio::io_context::work work(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << config_.address << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    return false;
  }
}

void HttpServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  // Let in-flight requests finish
  workers_.join();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

uint16_t HttpServer::local_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return config_.port;
  }
  return acceptor_->local_endpoint().port();
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<tcp::socket>(io_context_);
  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        boost::asio::post(workers_, [this, socket]() {
          try {
            handle_connection(*socket);
          } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "HTTP server: Connection error: " << e.what();
          }
        });
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }

      if (is_running_) {
        start_accept();
      }
    });
}

void HttpServer::handle_connection(tcp::socket& socket) {
  beast::flat_buffer buffer;
  bhttp::request_parser<bhttp::buffer_body> parser;
  parser.body_limit(boost::none);

  beast::error_code ec;
  bhttp::read_header(socket, buffer, parser, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Failed to read request header: " << ec.message();
    return;
  }

  const auto& req = parser.get();
  const unsigned version = req.version();
  const auto method = req.method();
  std::string path(req.target().data(), req.target().size());
  path = path.substr(0, path.find('?'));

  BOOST_LOG_TRIVIAL(info) << "HTTP server: " << req.method_string() << " " << path;

  auto reply = [&](bhttp::status status, std::string body) {
    auto res = make_response(status, version, std::move(body));
    write_response(socket, res);
  };

  try {
    if (starts_with(path, UPLOAD_PREFIX)) {
      if (method != bhttp::verb::post) {
        reply(bhttp::status::method_not_allowed, "Method not allowed\n");
        return;
      }
      if (!parser.content_length() && !parser.chunked()) {
        BOOST_LOG_TRIVIAL(warning) << "HTTP server: Upload without body rejected: " << path;
        reply(bhttp::status::unprocessable_entity, "Missing upload body\n");
        return;
      }

      const std::string file_name = percent_decode(path.substr(std::string(UPLOAD_PREFIX).size()));
      RequestBodySource source(socket, buffer, parser);
      storage_.upload_file(source, file_name, config_.upload_chunk_size, config_.upload_parallelism);

      auto res = make_response(bhttp::status::ok, version, "{\"ok\":true}", "application/json");
      write_response(socket, res);
    }
    else if (starts_with(path, DOWNLOAD_PREFIX)) {
      if (method != bhttp::verb::get) {
        reply(bhttp::status::method_not_allowed, "Method not allowed\n");
        return;
      }

      const std::string file_name = percent_decode(path.substr(std::string(DOWNLOAD_PREFIX).size()));
      auto content = storage_.download_file(file_name, config_.download_parallelism);

      bhttp::response<bhttp::vector_body<std::uint8_t>> res{bhttp::status::ok, version};
      res.set(bhttp::field::server, SERVER_NAME);
      res.set(bhttp::field::content_type, "application/octet-stream");
      res.body() = std::move(content);
      write_response(socket, res);
    }
    else if (path == FILES_PATH) {
      if (method != bhttp::verb::get) {
        reply(bhttp::status::method_not_allowed, "Method not allowed\n");
        return;
      }

      std::string listing;
      for (const auto& name : storage_.list_uploaded_files()) {
        listing += name + "\n";
      }
      reply(bhttp::status::ok, std::move(listing));
    }
    else {
      reply(bhttp::status::not_found, "Unknown route\n");
    }
  }
  catch (const storage::ValidationError& e) {
    reply(bhttp::status::bad_request, std::string(e.what()) + "\n");
  }
  catch (const storage::ResourcePressureError& e) {
    auto res = make_response(bhttp::status::service_unavailable, version, std::string(e.what()) + "\n");
    res.set(bhttp::field::retry_after, "1");
    write_response(socket, res);
  }
  catch (const storage::NotFoundError& e) {
    reply(bhttp::status::not_found, std::string(e.what()) + "\n");
  }
  catch (const storage::IntegrityError& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: " << e.what();
    reply(bhttp::status::internal_server_error, "Integrity check failed\n");
  }
  catch (const storage::InvalidMetadataError& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: " << e.what();
    reply(bhttp::status::internal_server_error, std::string(e.what()) + "\n");
  }
  catch (const backend::BackendError& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Backend failure: " << e.what();
    reply(bhttp::status::bad_gateway, "Storage backend failure\n");
  }
  catch (const std::invalid_argument& e) {
    reply(bhttp::status::bad_request, std::string(e.what()) + "\n");
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Unhandled error for " << path << ": " << e.what();
    reply(bhttp::status::internal_server_error, "Internal server error\n");
  }
}

} // namespace http
} // namespace chunkvault
