#include "backend/redis_backend.hpp"
#include <hiredis/hiredis.h>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace backend {

namespace {

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply) {
      freeReplyObject(reply);
    }
  }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

// Turns a null reply or an error reply into a BackendError
ReplyPtr check_reply(redisContext* ctx, void* raw, const std::string& command) {
  ReplyPtr reply(static_cast<redisReply*>(raw));
  if (!reply) {
    std::string reason = ctx && ctx->err ? ctx->errstr : "no reply";
    BOOST_LOG_TRIVIAL(error) << "Redis backend: " << command << " failed: " << reason;
    throw BackendError("Redis backend: " + command + " failed: " + reason);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    std::string reason(reply->str, reply->len);
    BOOST_LOG_TRIVIAL(error) << "Redis backend: " << command << " returned error: " << reason;
    throw BackendError("Redis backend: " + command + " returned error: " + reason);
  }
  return reply;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

void RedisBackend::ContextDeleter::operator()(redisContext* ctx) const {
  if (ctx) {
    redisFree(ctx);
  }
}

RedisBackend::RedisBackend(const RedisConfig& config) : config_(config) {
  BOOST_LOG_TRIVIAL(info) << "Redis backend: Initializing with " << config_.host << ":" << config_.port
                          << " db " << config_.db << ", pool size " << config_.pool_size;

  if (config_.pool_size == 0) {
    throw BackendError("Redis backend: Pool size must be positive");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  idle_.push_back(connect());
  ++open_connections_;
}

RedisBackend::~RedisBackend() {
  BOOST_LOG_TRIVIAL(debug) << "Redis backend: Closing " << idle_.size() << " idle connections";
}


//==============================================
// CONNECTION POOL
//==============================================

RedisBackend::ContextPtr RedisBackend::connect() {
  struct timeval timeout;
  timeout.tv_sec = static_cast<long>(config_.connect_timeout.count() / 1000);
  timeout.tv_usec = static_cast<long>((config_.connect_timeout.count() % 1000) * 1000);

  ContextPtr ctx(redisConnectWithTimeout(config_.host.c_str(), config_.port, timeout));
  if (!ctx || ctx->err) {
    std::string reason = ctx ? ctx->errstr : "allocation failed";
    BOOST_LOG_TRIVIAL(error) << "Redis backend: Failed to connect to " << config_.host << ":"
                             << config_.port << ": " << reason;
    throw BackendError("Redis backend: Failed to connect: " + reason);
  }

  if (config_.db != 0) {
    std::string db = std::to_string(config_.db);
    check_reply(ctx.get(), redisCommand(ctx.get(), "SELECT %s", db.c_str()), "SELECT");
  }

  BOOST_LOG_TRIVIAL(debug) << "Redis backend: Opened connection to " << config_.host << ":" << config_.port;
  return ctx;
}

std::unique_ptr<RedisBackend::Lease> RedisBackend::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_.wait(lock, [this]() {
    return !idle_.empty() || open_connections_ < config_.pool_size;
  });

  if (!idle_.empty()) {
    ContextPtr ctx = std::move(idle_.back());
    idle_.pop_back();
    return std::make_unique<Lease>(*this, std::move(ctx));
  }

  // Reserve the slot before connecting so other callers keep waiting
  ++open_connections_;
  lock.unlock();
  try {
    return std::make_unique<Lease>(*this, connect());
  } catch (...) {
    lock.lock();
    --open_connections_;
    available_.notify_one();
    throw;
  }
}

void RedisBackend::release(ContextPtr ctx) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ctx && !ctx->err) {
    idle_.push_back(std::move(ctx));
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Redis backend: Dropping broken connection";
    --open_connections_;
  }
  available_.notify_one();
}

RedisBackend::Lease::~Lease() {
  owner_.release(std::move(ctx_));
}


//==============================================
// COMMAND HELPERS
//==============================================

std::optional<std::string> RedisBackend::get_raw(const std::string& key) {
  auto lease = acquire();
  auto reply = check_reply(lease->get(),
    redisCommand(lease->get(), "GET %b", key.data(), key.size()), "GET");

  if (reply->type == REDIS_REPLY_NIL) {
    BOOST_LOG_TRIVIAL(debug) << "Redis backend: Key not found: " << key;
    return std::nullopt;
  }
  if (reply->type != REDIS_REPLY_STRING) {
    throw BackendError("Redis backend: Unexpected reply type for GET " + key);
  }
  return std::string(reply->str, reply->len);
}

void RedisBackend::set_raw(const std::string& key, const char* data, std::size_t size) {
  auto lease = acquire();
  check_reply(lease->get(),
    redisCommand(lease->get(), "SET %b %b", key.data(), key.size(), data, size), "SET");
  BOOST_LOG_TRIVIAL(trace) << "Redis backend: Stored " << size << " bytes for key: " << key;
}


//==============================================
// SCALAR OPERATIONS
//==============================================

std::optional<std::string> RedisBackend::get(const std::string& key) {
  return get_raw(key);
}

std::optional<Bytes> RedisBackend::get_binary(const std::string& key) {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return Bytes(value->begin(), value->end());
}

void RedisBackend::set(const std::string& key, const std::string& value) {
  set_raw(key, value.data(), value.size());
}

void RedisBackend::set_binary(const std::string& key, const Bytes& value) {
  set_raw(key, reinterpret_cast<const char*>(value.data()), value.size());
}


//==============================================
// LIST OPERATIONS
//==============================================

void RedisBackend::append_to_list(const std::string& list_key, const std::string& value) {
  auto lease = acquire();
  check_reply(lease->get(),
    redisCommand(lease->get(), "RPUSH %b %b", list_key.data(), list_key.size(),
                 value.data(), value.size()), "RPUSH");
}

std::vector<std::string> RedisBackend::get_full_list(const std::string& list_key) {
  auto lease = acquire();
  auto reply = check_reply(lease->get(),
    redisCommand(lease->get(), "LRANGE %b 0 -1", list_key.data(), list_key.size()), "LRANGE");

  std::vector<std::string> items;
  if (reply->type != REDIS_REPLY_ARRAY) {
    return items;
  }
  items.reserve(reply->elements);
  for (size_t i = 0; i < reply->elements; ++i) {
    const redisReply* element = reply->element[i];
    items.emplace_back(element->str, element->len);
  }
  return items;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> RedisBackend::list_keys(const std::string& pattern) {
  auto lease = acquire();
  auto reply = check_reply(lease->get(),
    redisCommand(lease->get(), "KEYS %b", pattern.data(), pattern.size()), "KEYS");

  std::vector<std::string> keys;
  if (reply->type != REDIS_REPLY_ARRAY) {
    return keys;
  }
  keys.reserve(reply->elements);
  for (size_t i = 0; i < reply->elements; ++i) {
    keys.emplace_back(reply->element[i]->str, reply->element[i]->len);
  }
  BOOST_LOG_TRIVIAL(debug) << "Redis backend: " << keys.size() << " keys match pattern: " << pattern;
  return keys;
}

} // namespace backend
} // namespace chunkvault
