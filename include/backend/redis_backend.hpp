#ifndef CHUNKVAULT_BACKEND_REDIS_BACKEND_HPP
#define CHUNKVAULT_BACKEND_REDIS_BACKEND_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "backend/storage_backend.hpp"

// Forward declaration for the hiredis connection handle
struct redisContext;

namespace chunkvault {
namespace backend {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{6379};
  int db{0};
  std::size_t pool_size{4};
  std::chrono::milliseconds connect_timeout{2000};
};

// Backend over a Redis server. Redis keeps no type tag on string values, so
// get() and get_binary() both return whatever bytes are stored under a key.
class RedisBackend : public StorageBackend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens one connection eagerly so misconfiguration fails fast
  explicit RedisBackend(const RedisConfig& config);
  ~RedisBackend() override;


  // ---- SCALAR OPERATIONS ----
  std::optional<std::string> get(const std::string& key) override;
  std::optional<Bytes> get_binary(const std::string& key) override;
  void set(const std::string& key, const std::string& value) override;
  void set_binary(const std::string& key, const Bytes& value) override;


  // ---- LIST OPERATIONS ----
  void append_to_list(const std::string& list_key, const std::string& value) override;
  std::vector<std::string> get_full_list(const std::string& list_key) override;


  // ---- QUERY OPERATIONS ----
  std::vector<std::string> list_keys(const std::string& pattern) override;

private:
  struct ContextDeleter {
    void operator()(redisContext* ctx) const;
  };
  using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

  // Returns a pooled connection to the pool on scope exit, drops it if it broke
  class Lease {
  public:
    Lease(RedisBackend& owner, ContextPtr ctx) : owner_(owner), ctx_(std::move(ctx)) {}
    ~Lease();
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    redisContext* get() const { return ctx_.get(); }
  private:
    RedisBackend& owner_;
    ContextPtr ctx_;
  };

  // ---- PARAMETERS ----
  RedisConfig config_;
  std::mutex mutex_;
  std::condition_variable available_;
  std::vector<ContextPtr> idle_;
  std::size_t open_connections_{0};


  // ---- CONNECTION POOL ----
  // Opens and selects the configured database, throws BackendError on failure
  ContextPtr connect();
  // Blocks until a connection is idle or a new one may be opened
  std::unique_ptr<Lease> acquire();
  void release(ContextPtr ctx);


  // ---- COMMAND HELPERS ----
  // Binary-safe GET; nullopt when the key is absent
  std::optional<std::string> get_raw(const std::string& key);
  void set_raw(const std::string& key, const char* data, std::size_t size);
};

} // namespace backend
} // namespace chunkvault

#endif // CHUNKVAULT_BACKEND_REDIS_BACKEND_HPP
