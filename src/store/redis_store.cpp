#include "store/redis_store.hpp"

#include <cstddef>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace fleet_telemetry::store {
namespace {

constexpr const char* kAppendScript = R"lua(
redis.replicate_commands()
local id = redis.call('INCR', KEYS[1])
local now = redis.call('TIME')
local recorded_at = string.format('%d', tonumber(now[1]) * 1000000 + tonumber(now[2]))
redis.call('HSET', ARGV[1] .. id,
  'asset_id', ARGV[2],
  'temperature_c', ARGV[3],
  'vibration_rms', ARGV[4],
  'pressure_psi', ARGV[5],
  'recorded_at', recorded_at)
redis.call('ZADD', KEYS[2], recorded_at, string.format('%020d', id))
return {id, recorded_at}
)lua";

constexpr const char* kFetchLatestScript = R"lua(
local members = redis.call('ZREVRANGE', KEYS[1], 0, tonumber(ARGV[2]) - 1)
local rows = {}
for _, member in ipairs(members) do
  local id = tonumber(member)
  local fields = redis.call('HMGET', ARGV[1] .. id,
    'asset_id', 'temperature_c', 'vibration_rms', 'pressure_psi', 'recorded_at')
  rows[#rows + 1] = {tostring(id), fields[1], fields[2], fields[3], fields[4], fields[5]}
end
return rows
)lua";

constexpr std::size_t kRowFieldCount = 6;

std::string format_double(const double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  return std::string(buffer);
}

std::string reply_string(const redisReply* reply) {
  if (reply == nullptr || reply->str == nullptr) {
    return {};
  }
  return std::string(reply->str, static_cast<std::size_t>(reply->len));
}

std::int64_t reply_integer(const redisReply* reply) {
  if (reply == nullptr) {
    throw StoreUnavailable("missing integer in redis reply");
  }
  if (reply->type == REDIS_REPLY_INTEGER) {
    return static_cast<std::int64_t>(reply->integer);
  }
  if (reply->type == REDIS_REPLY_STRING) {
    try {
      return static_cast<std::int64_t>(std::stoll(reply_string(reply)));
    } catch (const std::logic_error&) {
      throw StoreUnavailable("malformed integer in redis reply: " + reply_string(reply));
    }
  }
  throw StoreUnavailable("unexpected redis reply type for integer field");
}

bool parse_row(const redisReply* row, model::reading& out) {
  if (row == nullptr || row->type != REDIS_REPLY_ARRAY || row->elements != kRowFieldCount) {
    return false;
  }
  for (std::size_t i = 0; i < kRowFieldCount; ++i) {
    const auto* field = row->element[i];
    if (field == nullptr || field->type != REDIS_REPLY_STRING || field->str == nullptr) {
      return false;
    }
  }

  try {
    out.id = std::stoll(reply_string(row->element[0]));
    out.asset_id = reply_string(row->element[1]);
    out.temperature_c = std::stod(reply_string(row->element[2]));
    out.vibration_rms = std::stod(reply_string(row->element[3]));
    out.pressure_psi = std::stod(reply_string(row->element[4]));
    out.recorded_at_us = std::stoll(reply_string(row->element[5]));
  } catch (const std::logic_error&) {
    return false;
  }
  return true;
}

}  // namespace

RedisReadingStore::RedisReadingStore(RedisStoreOptions options) : options_(std::move(options)) {}

RedisReadingStore::~RedisReadingStore() = default;

void RedisReadingStore::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisReadingStore::ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

std::string RedisReadingStore::sequence_key() const { return options_.key_prefix + ":reading:seq"; }

std::string RedisReadingStore::reading_key_prefix() const { return options_.key_prefix + ":reading:"; }

std::string RedisReadingStore::asset_key(const std::string& asset_id) const {
  return options_.key_prefix + ":asset:" + asset_id;
}

void RedisReadingStore::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return;
  }
  reconnect();
}

void RedisReadingStore::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000U);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000U) * 1000U);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }

  if (raw == nullptr) {
    throw StoreUnavailable("redis connect failed: out of memory");
  }
  if (raw->err != REDIS_OK) {
    const std::string message = std::string("redis connect failed: ") + raw->errstr;
    redisFree(raw);
    throw StoreUnavailable(message);
  }

  context_.reset(raw);
  try {
    authenticate();
    select_db();
  } catch (const StoreUnavailable&) {
    context_.reset();
    throw;
  }
}

void RedisReadingStore::authenticate() {
  if (options_.password.empty()) {
    return;
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str())));
  if (reply == nullptr) {
    throw StoreUnavailable("redis AUTH failed: connection lost");
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    throw StoreUnavailable("redis AUTH rejected");
  }
}

void RedisReadingStore::select_db() {
  if (options_.db == 0) {
    return;
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db)));
  if (reply == nullptr) {
    throw StoreUnavailable("redis SELECT failed: connection lost");
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    throw StoreUnavailable("redis SELECT rejected: " + reply_string(reply.get()));
  }
}

RedisReadingStore::ReplyPtr RedisReadingStore::eval(const std::vector<std::string>& args) {
  ensure_connected();

  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  ReplyPtr reply(static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data())));
  if (reply == nullptr) {
    const std::string message =
        context_ != nullptr && context_->errstr[0] != '\0' ? context_->errstr : "connection lost";
    context_.reset();
    throw StoreUnavailable("redis command failed: " + message);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    throw StoreUnavailable("redis script error: " + reply_string(reply.get()));
  }
  return reply;
}

model::append_receipt RedisReadingStore::append(const model::reading_input& input) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto reply = eval({"EVAL", kAppendScript, "2", sequence_key(), asset_key(input.asset_id),
                           reading_key_prefix(), input.asset_id, format_double(input.temperature_c),
                           format_double(input.vibration_rms), format_double(input.pressure_psi)});

  if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
    throw StoreUnavailable("unexpected redis reply to append");
  }

  model::append_receipt receipt{};
  receipt.id = reply_integer(reply->element[0]);
  receipt.recorded_at_us = reply_integer(reply->element[1]);
  return receipt;
}

std::vector<model::reading> RedisReadingStore::fetch_latest(const std::string& asset_id, const int limit) {
  validate_window(limit);

  std::lock_guard<std::mutex> lock(mutex_);

  const auto reply = eval({"EVAL", kFetchLatestScript, "1", asset_key(asset_id), reading_key_prefix(),
                           std::to_string(limit)});

  if (reply->type != REDIS_REPLY_ARRAY) {
    throw StoreUnavailable("unexpected redis reply to fetch");
  }

  std::vector<model::reading> readings;
  readings.reserve(reply->elements);
  for (std::size_t i = 0; i < reply->elements; ++i) {
    model::reading row{};
    if (!parse_row(reply->element[i], row)) {
      std::cerr << "[store] corrupt reading row " << i << " for asset " << asset_id << '\n';
      throw StoreUnavailable("corrupt reading row for asset " + asset_id);
    }
    readings.push_back(std::move(row));
  }
  return readings;
}

void RedisReadingStore::ping() {
  std::lock_guard<std::mutex> lock(mutex_);

  ensure_connected();

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(context_.get(), "PING")));
  if (reply == nullptr) {
    const std::string message = context_->errstr[0] != '\0' ? context_->errstr : "connection lost";
    context_.reset();
    throw StoreUnavailable("redis PING failed: " + message);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    throw StoreUnavailable("redis PING rejected: " + reply_string(reply.get()));
  }
}

}  // namespace fleet_telemetry::store
