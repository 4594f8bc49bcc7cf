#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "store/reading_store.hpp"

struct redisContext;
struct redisReply;

namespace fleet_telemetry::store {

struct RedisStoreOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"fleet"};
  std::uint32_t connect_timeout_ms{3000};
};

// Readings live in one hash per id plus a per-asset sorted set scored by
// recorded_at. Members are zero-padded ids so equal timestamps fall back to id
// order. Append and fetch each run as a single Lua script.
class RedisReadingStore final : public ReadingStore {
 public:
  explicit RedisReadingStore(RedisStoreOptions options = {});
  ~RedisReadingStore() override;

  RedisReadingStore(const RedisReadingStore&) = delete;
  RedisReadingStore& operator=(const RedisReadingStore&) = delete;

  model::append_receipt append(const model::reading_input& input) override;
  std::vector<model::reading> fetch_latest(const std::string& asset_id, int limit) override;
  void ping() override;

  [[nodiscard]] std::string sequence_key() const;
  [[nodiscard]] std::string reading_key_prefix() const;
  [[nodiscard]] std::string asset_key(const std::string& asset_id) const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  void ensure_connected();
  void reconnect();
  void authenticate();
  void select_db();
  ReplyPtr eval(const std::vector<std::string>& args);

  RedisStoreOptions options_;
  std::mutex mutex_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

}  // namespace fleet_telemetry::store
