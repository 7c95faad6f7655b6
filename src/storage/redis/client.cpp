/// @file client.cpp
/// @brief Redis client implementation

#include "storage/redis/client.h"

#include <mutex>

#include <absl/strings/str_cat.h>
#include <hiredis/hiredis.h>

#include "common/error.h"
#include "common/logging.h"

namespace insightx::storage {

namespace {

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply != nullptr) freeReplyObject(reply);
    }
};

using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

struct timeval ToTimeval(std::chrono::seconds seconds) {
    struct timeval tv;
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(seconds.count());
    tv.tv_usec = 0;
    return tv;
}

}  // namespace

// =============================================================================
// RedisClient Implementation
// =============================================================================

class RedisClient::Impl {
public:
    explicit Impl(const RedisConfig& config) : config_(config) {}

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        Close();
    }

    absl::Status Connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        return ConnectLocked();
    }

    absl::Status Ping() {
        std::lock_guard<std::mutex> lock(mutex_);
        return Command("PING", [this] { return redisCommand(context_, "PING"); }).status();
    }

    absl::Status Set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl) {
        std::chrono::seconds expiry = ttl.value_or(config_.default_ttl);

        std::lock_guard<std::mutex> lock(mutex_);
        return Command("SET", [&] {
            if (expiry.count() > 0) {
                return redisCommand(context_, "SET %b %b EX %lld", key.data(), key.size(),
                                    value.data(), value.size(),
                                    static_cast<long long>(expiry.count()));
            }
            return redisCommand(context_, "SET %b %b", key.data(), key.size(), value.data(),
                                value.size());
        }).status();
    }

    absl::StatusOr<std::optional<std::string>> Get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        INSIGHTX_ASSIGN_OR_RETURN(Reply reply, Command("GET", [&] {
            return redisCommand(context_, "GET %b", key.data(), key.size());
        }));

        if (reply->type == REDIS_REPLY_NIL) {
            return std::optional<std::string>();
        }
        if (reply->type != REDIS_REPLY_STRING) {
            return MakeError(ErrorCode::kInternal, "GET returned a non-string reply");
        }
        return std::optional<std::string>(std::string(reply->str, reply->len));
    }

    absl::StatusOr<bool> Delete(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        INSIGHTX_ASSIGN_OR_RETURN(Reply reply, Command("DEL", [&] {
            return redisCommand(context_, "DEL %b", key.data(), key.size());
        }));
        return reply->integer > 0;
    }

private:
    absl::Status ConnectLocked() {
        if (context_ != nullptr) {
            return absl::OkStatus();
        }

        context_ = redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                           ToTimeval(config_.connection_timeout));
        if (context_ == nullptr || context_->err) {
            std::string error_msg = context_ ? context_->errstr : "Unknown error";
            Close();
            return MakeError(ErrorCode::kConnectionFailed,
                             absl::StrCat("Failed to connect to Redis: ", error_msg));
        }
        redisSetTimeout(context_, ToTimeval(config_.socket_timeout));

        if (!config_.password.empty()) {
            Reply reply(static_cast<redisReply*>(
                redisCommand(context_, "AUTH %s", config_.password.c_str())));
            if (!reply || reply->type == REDIS_REPLY_ERROR) {
                std::string error_msg = reply ? reply->str : "Unknown error";
                Close();
                return MakeError(ErrorCode::kConnectionFailed,
                                 absl::StrCat("Redis authentication failed: ", error_msg));
            }
        }

        if (config_.database != 0) {
            Reply reply(static_cast<redisReply*>(
                redisCommand(context_, "SELECT %d", config_.database)));
            if (!reply || reply->type == REDIS_REPLY_ERROR) {
                std::string error_msg = reply ? reply->str : "Unknown error";
                Close();
                return MakeError(ErrorCode::kConnectionFailed,
                                 absl::StrCat("Failed to select database: ", error_msg));
            }
        }

        INSIGHTX_LOG_INFO("Connected to Redis at {}:{}/{}", config_.host, config_.port,
                          config_.database);
        return absl::OkStatus();
    }

    void Close() {
        if (context_ != nullptr) {
            redisFree(context_);
            context_ = nullptr;
        }
    }

    /// @brief Run one command, reconnecting first if needed
    template <typename F>
    absl::StatusOr<Reply> Command(const char* name, F&& issue) {
        INSIGHTX_RETURN_IF_ERROR(ConnectLocked());

        Reply reply(static_cast<redisReply*>(issue()));
        if (!reply) {
            std::string error_msg = context_->errstr;
            // The context is unusable after an I/O error
            Close();
            return MakeError(ErrorCode::kConnectionFailed,
                             absl::StrCat(name, " failed: ", error_msg));
        }
        if (reply->type == REDIS_REPLY_ERROR) {
            return MakeError(ErrorCode::kInternal,
                             absl::StrCat(name, " failed: ", std::string(reply->str, reply->len)));
        }
        return std::move(reply);
    }

    RedisConfig config_;
    redisContext* context_ = nullptr;
    std::mutex mutex_;
};

RedisClient::RedisClient(RedisConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_)) {}

RedisClient::~RedisClient() = default;

absl::Status RedisClient::Connect() { return impl_->Connect(); }

absl::Status RedisClient::Ping() { return impl_->Ping(); }

absl::Status RedisClient::Set(const std::string& key, const std::string& value,
                              std::optional<std::chrono::seconds> ttl) {
    return impl_->Set(key, value, ttl);
}

absl::StatusOr<std::optional<std::string>> RedisClient::Get(const std::string& key) {
    return impl_->Get(key);
}

absl::StatusOr<bool> RedisClient::Delete(const std::string& key) {
    return impl_->Delete(key);
}

}  // namespace insightx::storage
