/**
 * In-process key-value store
 *
 * Single-replica stand-in for the durable store with the same async
 * contract and expiry semantics. Used for local runs ("memory://") and
 * tests.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include "kernel/reactor.hpp"
#include "store/kv_store.hpp"
#include "util/clock.hpp"

namespace warden::store {

class MemoryStore : public KeyValueStore {
public:
    explicit MemoryStore(kernel::Reactor& reactor, util::Clock clock = util::monotonic_seconds);

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

    // Synchronous inspection for tests and diagnostics
    size_t size();
    std::optional<double> ttl_remaining(const std::string& key);

    // While set, every operation replies ok == false
    void set_unavailable(bool unavailable) { unavailable_ = unavailable; }

private:
    struct Entry {
        bool is_hash = false;
        std::string value;
        std::map<std::string, std::string> hash;
        std::optional<double> expires_at;
    };

    kernel::Reactor& reactor_;
    util::Clock clock_;
    std::unordered_map<std::string, Entry> data_;
    bool unavailable_ = false;

    // Drops the entry if expired
    Entry* lookup(const std::string& key);

    template <typename ReplyT>
    void complete(std::function<void(ReplyT)> cb, ReplyT reply);
};

} // namespace warden::store
