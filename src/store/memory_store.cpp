#include "store/memory_store.hpp"
#include <spdlog/spdlog.h>

namespace warden::store {

namespace {

constexpr const char* UNAVAILABLE = "store unavailable";
constexpr const char* WRONG_TYPE = "WRONGTYPE Operation against a key holding the wrong kind of value";

} // namespace

MemoryStore::MemoryStore(kernel::Reactor& reactor, util::Clock clock)
    : reactor_(reactor)
    , clock_(std::move(clock)) {}

template <typename ReplyT>
void MemoryStore::complete(std::function<void(ReplyT)> cb, ReplyT reply) {
    if (!cb) {
        if (!reply.ok) {
            spdlog::debug("Store write failed: {}", reply.error);
        }
        return;
    }
    reactor_.post([cb = std::move(cb), reply = std::move(reply)]() mutable {
        cb(std::move(reply));
    });
}

MemoryStore::Entry* MemoryStore::lookup(const std::string& key) {
    auto it = data_.find(key);
    if (it == data_.end()) {
        return nullptr;
    }
    if (it->second.expires_at && *it->second.expires_at <= clock_()) {
        data_.erase(it);
        return nullptr;
    }
    return &it->second;
}

void MemoryStore::get(const std::string& key, ValueCallback cb) {
    if (unavailable_) return complete(std::move(cb), ValueReply::failure(UNAVAILABLE));

    Entry* entry = lookup(key);
    if (!entry) return complete(std::move(cb), ValueReply::success(std::nullopt));
    if (entry->is_hash) return complete(std::move(cb), ValueReply::failure(WRONG_TYPE));
    complete(std::move(cb), ValueReply::success(entry->value));
}

void MemoryStore::set(const std::string& key, const std::string& value,
                      std::optional<int64_t> ttl_seconds, StatusCallback cb) {
    if (unavailable_) return complete(std::move(cb), StatusReply::failure(UNAVAILABLE));

    Entry entry;
    entry.value = value;
    if (ttl_seconds && *ttl_seconds > 0) {
        entry.expires_at = clock_() + static_cast<double>(*ttl_seconds);
    }
    data_[key] = std::move(entry);
    complete(std::move(cb), StatusReply::success(true));
}

void MemoryStore::del(const std::string& key, StatusCallback cb) {
    if (unavailable_) return complete(std::move(cb), StatusReply::failure(UNAVAILABLE));

    bool existed = lookup(key) != nullptr;
    data_.erase(key);
    complete(std::move(cb), StatusReply::success(existed));
}

void MemoryStore::hget(const std::string& key, const std::string& field, ValueCallback cb) {
    if (unavailable_) return complete(std::move(cb), ValueReply::failure(UNAVAILABLE));

    Entry* entry = lookup(key);
    if (!entry) return complete(std::move(cb), ValueReply::success(std::nullopt));
    if (!entry->is_hash) return complete(std::move(cb), ValueReply::failure(WRONG_TYPE));

    auto it = entry->hash.find(field);
    if (it == entry->hash.end()) return complete(std::move(cb), ValueReply::success(std::nullopt));
    complete(std::move(cb), ValueReply::success(it->second));
}

void MemoryStore::hset(const std::string& key, const std::string& field,
                       const std::string& value, StatusCallback cb) {
    if (unavailable_) return complete(std::move(cb), StatusReply::failure(UNAVAILABLE));

    Entry* entry = lookup(key);
    if (!entry) {
        entry = &data_[key];
        entry->is_hash = true;
    }
    if (!entry->is_hash) return complete(std::move(cb), StatusReply::failure(WRONG_TYPE));

    entry->hash[field] = value;
    complete(std::move(cb), StatusReply::success(true));
}

void MemoryStore::hdel(const std::string& key, const std::string& field, StatusCallback cb) {
    if (unavailable_) return complete(std::move(cb), StatusReply::failure(UNAVAILABLE));

    Entry* entry = lookup(key);
    if (!entry) return complete(std::move(cb), StatusReply::success(false));
    if (!entry->is_hash) return complete(std::move(cb), StatusReply::failure(WRONG_TYPE));

    bool existed = entry->hash.erase(field) > 0;
    if (entry->hash.empty()) {
        data_.erase(key);
    }
    complete(std::move(cb), StatusReply::success(existed));
}

void MemoryStore::hgetall(const std::string& key, HashCallback cb) {
    if (unavailable_) return complete(std::move(cb), HashReply::failure(UNAVAILABLE));

    Entry* entry = lookup(key);
    if (!entry) return complete(std::move(cb), HashReply::success({}));
    if (!entry->is_hash) return complete(std::move(cb), HashReply::failure(WRONG_TYPE));
    complete(std::move(cb), HashReply::success(entry->hash));
}

void MemoryStore::expire(const std::string& key, int64_t ttl_seconds, StatusCallback cb) {
    if (unavailable_) return complete(std::move(cb), StatusReply::failure(UNAVAILABLE));

    Entry* entry = lookup(key);
    if (!entry) return complete(std::move(cb), StatusReply::success(false));

    if (ttl_seconds <= 0) {
        data_.erase(key);
    } else {
        entry->expires_at = clock_() + static_cast<double>(ttl_seconds);
    }
    complete(std::move(cb), StatusReply::success(true));
}

void MemoryStore::keys(const std::string& prefix, KeysCallback cb) {
    if (unavailable_) return complete(std::move(cb), KeysReply::failure(UNAVAILABLE));

    std::vector<std::string> result;
    double now = clock_();
    for (auto it = data_.begin(); it != data_.end();) {
        if (it->second.expires_at && *it->second.expires_at <= now) {
            it = data_.erase(it);
            continue;
        }
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(it->first);
        }
        ++it;
    }
    complete(std::move(cb), KeysReply::success(std::move(result)));
}

size_t MemoryStore::size() {
    double now = clock_();
    size_t live = 0;
    for (const auto& [key, entry] : data_) {
        if (!entry.expires_at || *entry.expires_at > now) live++;
    }
    return live;
}

std::optional<double> MemoryStore::ttl_remaining(const std::string& key) {
    Entry* entry = lookup(key);
    if (!entry || !entry->expires_at) {
        return std::nullopt;
    }
    return *entry->expires_at - clock_();
}

} // namespace warden::store
