/**
 * Durable key-value store contract
 *
 * Asynchronous: every operation completes by invoking its callback on
 * the reactor thread, never inline. A reply with ok == false means the
 * store could not be reached or rejected the command; callers treat
 * that as "unavailable", not as a thrown error. Callbacks may be empty
 * for fire-and-forget writes.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden::store {

template <typename T>
struct Reply {
    bool ok = false;
    T value{};
    std::string error;

    static Reply success(T v) {
        Reply r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }
    static Reply failure(std::string message) {
        Reply r;
        r.error = std::move(message);
        return r;
    }
};

using ValueReply = Reply<std::optional<std::string>>;
using StatusReply = Reply<bool>;
using HashReply = Reply<std::map<std::string, std::string>>;
using KeysReply = Reply<std::vector<std::string>>;

using ValueCallback = std::function<void(ValueReply)>;
using StatusCallback = std::function<void(StatusReply)>;
using HashCallback = std::function<void(HashReply)>;
using KeysCallback = std::function<void(KeysReply)>;

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual void get(const std::string& key, ValueCallback cb) = 0;
    // ttl_seconds <= 0 or nullopt stores without expiry
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<int64_t> ttl_seconds, StatusCallback cb) = 0;
    // value: whether the key existed
    virtual void del(const std::string& key, StatusCallback cb) = 0;

    virtual void hget(const std::string& key, const std::string& field, ValueCallback cb) = 0;
    virtual void hset(const std::string& key, const std::string& field,
                      const std::string& value, StatusCallback cb) = 0;
    virtual void hdel(const std::string& key, const std::string& field, StatusCallback cb) = 0;
    virtual void hgetall(const std::string& key, HashCallback cb) = 0;

    // value: whether the key existed
    virtual void expire(const std::string& key, int64_t ttl_seconds, StatusCallback cb) = 0;

    // Every key starting with prefix, in no particular order
    virtual void keys(const std::string& prefix, KeysCallback cb) = 0;
};

} // namespace warden::store
