#include "store/redis_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iterator>
#include <map>
#include <vector>

namespace warden::store {

namespace {

constexpr const char* UNAVAILABLE = "durable store unavailable";

} // namespace

std::optional<RedisAddress> RedisAddress::parse(const std::string& url) {
    const std::string scheme = "redis://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    RedisAddress address;
    std::string rest = url.substr(scheme.size());

    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string credentials = rest.substr(0, at);
        rest = rest.substr(at + 1);
        size_t colon = credentials.find(':');
        if (colon == std::string::npos) {
            address.user = credentials;
        } else {
            address.user = credentials.substr(0, colon);
            address.password = credentials.substr(colon + 1);
        }
    }

    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        std::string db_text = rest.substr(slash + 1);
        rest = rest.substr(0, slash);
        if (!db_text.empty()) {
            char* end = nullptr;
            long db = std::strtol(db_text.c_str(), &end, 10);
            if (*end != '\0' || db < 0) return std::nullopt;
            address.db = static_cast<int>(db);
        }
    }

    size_t colon = rest.rfind(':');
    if (colon != std::string::npos) {
        std::string port_text = rest.substr(colon + 1);
        char* end = nullptr;
        long port = std::strtol(port_text.c_str(), &end, 10);
        if (port_text.empty() || *end != '\0' || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        address.port = static_cast<uint16_t>(port);
        rest = rest.substr(0, colon);
    }
    if (!rest.empty()) {
        address.host = rest;
    }
    return address;
}

sw::redis::ConnectionOptions RedisAddress::connection_options(int timeout_ms) const {
    sw::redis::ConnectionOptions options;
    options.host = host;
    options.port = port;
    options.db = db;
    if (!user.empty()) {
        options.user = user;
    }
    options.password = password;
    options.connect_timeout = std::chrono::milliseconds(timeout_ms);
    options.socket_timeout = std::chrono::milliseconds(timeout_ms);
    return options;
}

RedisStore::RedisStore(kernel::Reactor& reactor, RedisAddress address, int timeout_ms)
    : queue_(reactor.task_queue())
    , address_(std::move(address))
    , redis_(std::make_unique<sw::redis::Redis>(address_.connection_options(timeout_ms)))
    , alive_(std::make_shared<bool>(true)) {
    worker_ = std::thread([this]() { worker_loop(); });
}

RedisStore::~RedisStore() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        jobs_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    alive_.reset();
}

std::string RedisStore::escape_glob(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

// ============================================================================
// Worker
// ============================================================================

void RedisStore::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void RedisStore::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job(*redis_);
    }
}

template <typename T>
void RedisStore::run(std::function<T(sw::redis::Redis&)> op, std::function<void(Reply<T>)> cb) {
    std::weak_ptr<bool> alive = alive_;
    enqueue([this, alive, op = std::move(op), cb = std::move(cb)](sw::redis::Redis& redis) {
        Reply<T> reply;
        try {
            reply = Reply<T>::success(op(redis));
            if (!connected_.exchange(true)) {
                spdlog::info("Connected to Redis at {}:{}", address_.host, address_.port);
            }
        } catch (const sw::redis::ReplyError& e) {
            // The server answered, so the connection itself is fine
            connected_ = true;
            reply = Reply<T>::failure(e.what());
        } catch (const sw::redis::Error& e) {
            if (connected_.exchange(false)) {
                spdlog::warn("Redis connection to {}:{} lost: {}", address_.host, address_.port, e.what());
            } else {
                spdlog::debug("Redis at {}:{} unavailable: {}", address_.host, address_.port, e.what());
            }
            reply = Reply<T>::failure(UNAVAILABLE);
        } catch (const std::exception& e) {
            spdlog::error("Redis command failed: {}", e.what());
            reply = Reply<T>::failure(e.what());
        }

        if (!cb) return;
        queue_->post([alive, cb, reply = std::move(reply)]() mutable {
            if (alive.expired()) return;
            cb(std::move(reply));
        });
    });
}

void RedisStore::connect() {
    run<bool>([](sw::redis::Redis& redis) {
        redis.ping();
        return true;
    }, [host = address_.host, port = address_.port](StatusReply reply) {
        if (!reply.ok) {
            spdlog::warn("Redis at {}:{} is not reachable yet: {}", host, port, reply.error);
        }
    });
}

// ============================================================================
// Commands
// ============================================================================

namespace {

template <typename Text>
std::optional<std::string> to_optional(const Text& value) {
    if (!value) return std::nullopt;
    return std::string(*value);
}

} // namespace

void RedisStore::get(const std::string& key, ValueCallback cb) {
    run<std::optional<std::string>>([key](sw::redis::Redis& redis) {
        return to_optional(redis.get(key));
    }, std::move(cb));
}

void RedisStore::set(const std::string& key, const std::string& value,
                     std::optional<int64_t> ttl_seconds, StatusCallback cb) {
    run<bool>([key, value, ttl_seconds](sw::redis::Redis& redis) {
        if (ttl_seconds && *ttl_seconds > 0) {
            redis.set(key, value, std::chrono::milliseconds(*ttl_seconds * 1000));
        } else {
            redis.set(key, value);
        }
        return true;
    }, std::move(cb));
}

void RedisStore::del(const std::string& key, StatusCallback cb) {
    run<bool>([key](sw::redis::Redis& redis) {
        return redis.del(key) > 0;
    }, std::move(cb));
}

void RedisStore::hget(const std::string& key, const std::string& field, ValueCallback cb) {
    run<std::optional<std::string>>([key, field](sw::redis::Redis& redis) {
        return to_optional(redis.hget(key, field));
    }, std::move(cb));
}

void RedisStore::hset(const std::string& key, const std::string& field,
                      const std::string& value, StatusCallback cb) {
    run<bool>([key, field, value](sw::redis::Redis& redis) {
        redis.hset(key, field, value);
        return true;
    }, std::move(cb));
}

void RedisStore::hdel(const std::string& key, const std::string& field, StatusCallback cb) {
    run<bool>([key, field](sw::redis::Redis& redis) {
        return redis.hdel(key, field) > 0;
    }, std::move(cb));
}

void RedisStore::hgetall(const std::string& key, HashCallback cb) {
    run<std::map<std::string, std::string>>([key](sw::redis::Redis& redis) {
        std::map<std::string, std::string> hash;
        redis.hgetall(key, std::inserter(hash, hash.begin()));
        return hash;
    }, std::move(cb));
}

void RedisStore::expire(const std::string& key, int64_t ttl_seconds, StatusCallback cb) {
    run<bool>([key, ttl_seconds](sw::redis::Redis& redis) {
        return redis.expire(key, static_cast<long long>(ttl_seconds));
    }, std::move(cb));
}

void RedisStore::keys(const std::string& prefix, KeysCallback cb) {
    std::string pattern = escape_glob(prefix) + "*";
    run<std::vector<std::string>>([pattern](sw::redis::Redis& redis) {
        std::vector<std::string> found;
        long long cursor = 0;
        do {
            cursor = redis.scan(cursor, pattern, 100, std::back_inserter(found));
        } while (cursor != 0);

        // SCAN may return a key more than once
        std::sort(found.begin(), found.end());
        found.erase(std::unique(found.begin(), found.end()), found.end());
        return found;
    }, std::move(cb));
}

} // namespace warden::store
