/**
 * Redis-backed key-value store
 *
 * Commands run in order on one worker thread that owns a redis++ client;
 * replies are posted back to the reactor. redis++ reconnects on its own,
 * so a dropped connection fails the commands issued while it is down and
 * nothing else.
 */
#pragma once
#include <sw/redis++/redis++.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "kernel/reactor.hpp"
#include "store/kv_store.hpp"

namespace warden::store {

struct RedisAddress {
    std::string host = "localhost";
    uint16_t port = 6379;
    int db = 0;
    std::string user;
    std::string password;

    // redis://[[user]:password@]host[:port][/db]
    static std::optional<RedisAddress> parse(const std::string& url);

    sw::redis::ConnectionOptions connection_options(int timeout_ms) const;
};

class RedisStore : public KeyValueStore {
public:
    RedisStore(kernel::Reactor& reactor, RedisAddress address, int timeout_ms = 1000);
    // Queued commands are abandoned without invoking their callbacks
    ~RedisStore() override;

    // Non-copyable
    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    // Probe the server once and log the outcome; commands may be issued
    // before or without it
    void connect();
    bool connected() const { return connected_; }

    void get(const std::string& key, ValueCallback cb) override;
    void set(const std::string& key, const std::string& value,
             std::optional<int64_t> ttl_seconds, StatusCallback cb) override;
    void del(const std::string& key, StatusCallback cb) override;

    void hget(const std::string& key, const std::string& field, ValueCallback cb) override;
    void hset(const std::string& key, const std::string& field,
              const std::string& value, StatusCallback cb) override;
    void hdel(const std::string& key, const std::string& field, StatusCallback cb) override;
    void hgetall(const std::string& key, HashCallback cb) override;

    void expire(const std::string& key, int64_t ttl_seconds, StatusCallback cb) override;
    void keys(const std::string& prefix, KeysCallback cb) override;

    // Escape glob metacharacters for MATCH patterns
    static std::string escape_glob(const std::string& text);

private:
    using Job = std::function<void(sw::redis::Redis&)>;

    std::shared_ptr<kernel::TaskQueue> queue_;
    RedisAddress address_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
    std::shared_ptr<bool> alive_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::thread worker_;

    void worker_loop();
    void enqueue(Job job);

    // Runs op on the worker and delivers its result, or the failure, to cb
    template <typename T>
    void run(std::function<T(sw::redis::Redis&)> op, std::function<void(Reply<T>)> cb);
};

} // namespace warden::store
