#include "persistence/persistence_manager.hpp"
#include "persistence/file_codec.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace warden::persistence {

using json = nlohmann::json;

namespace {

constexpr const char* SESSION_PREFIX = "executor:session:";
constexpr const char* FILES_SUFFIX = ":files";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

PersistenceManager::PersistenceManager(kernel::Reactor& reactor, store::KeyValueStore& store,
                                       PersistenceConfig config, util::Clock clock)
    : reactor_(reactor)
    , store_(store)
    , config_(config)
    , clock_(std::move(clock))
    , alive_(std::make_shared<bool>(true)) {}

PersistenceManager::~PersistenceManager() {
    if (snapshot_timer_ != 0) {
        reactor_.cancel(snapshot_timer_);
    }
}

std::string PersistenceManager::session_key(const std::string& session_id) {
    return SESSION_PREFIX + session_id;
}

std::string PersistenceManager::files_key(const std::string& session_id) {
    return SESSION_PREFIX + session_id + FILES_SUFFIX;
}

std::string PersistenceManager::now_iso() const {
    return util::iso_timestamp(clock_());
}

std::optional<int64_t> PersistenceManager::remaining_ttl(const SessionState& state) const {
    auto expires = util::parse_iso_timestamp(state.expires_at);
    if (!expires) {
        return std::nullopt;
    }
    double left = std::ceil(*expires - clock_());
    return left < 1.0 ? 1 : static_cast<int64_t>(left);
}

bool PersistenceManager::expired(const SessionState& state) const {
    auto expires = util::parse_iso_timestamp(state.expires_at);
    return expires && *expires <= clock_();
}

template <typename Callback, typename Value>
void PersistenceManager::post_result(Callback cb, Value value) {
    if (!cb) return;
    reactor_.post([cb = std::move(cb), value = std::move(value)]() mutable {
        cb(std::move(value));
    });
}

// ============================================================================
// Lifecycle
// ============================================================================

void PersistenceManager::start() {
    if (running_) return;
    spdlog::info("Starting session persistence manager");
    running_ = true;
    schedule_snapshot();
}

void PersistenceManager::stop(DoneCallback done) {
    spdlog::info("Stopping session persistence manager");
    running_ = false;
    if (snapshot_timer_ != 0) {
        reactor_.cancel(snapshot_timer_);
        snapshot_timer_ = 0;
    }
    flush([done = std::move(done)](bool ok) {
        spdlog::info("Session persistence manager stopped");
        if (done) done(ok);
    });
}

void PersistenceManager::schedule_snapshot() {
    if (!running_ || snapshot_timer_ != 0) return;

    std::weak_ptr<bool> alive = alive_;
    snapshot_timer_ = reactor_.call_later(config_.snapshot_interval, [this, alive]() {
        snapshot_timer_ = 0;
        flush([this, alive](bool) {
            if (alive.expired()) return;
            schedule_snapshot();
        });
    });
}

void PersistenceManager::flush(DoneCallback done) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (expired(it->second)) {
            spdlog::debug("Dropping expired session {} from the cache", it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }

    if (sessions_.empty()) {
        post_result(std::move(done), true);
        return;
    }

    struct Pending {
        size_t remaining;
        bool ok = true;
        DoneCallback done;
    };
    auto pending = std::make_shared<Pending>(Pending{sessions_.size(), true, std::move(done)});
    size_t count = sessions_.size();

    for (const auto& [id, state] : sessions_) {
        save_session(state, remaining_ttl(state), [pending, count](bool ok) {
            pending->ok = pending->ok && ok;
            if (--pending->remaining == 0) {
                spdlog::debug("Saved {} sessions to the durable store", count);
                if (pending->done) pending->done(pending->ok);
            }
        });
    }
}

// ============================================================================
// Store access
// ============================================================================

void PersistenceManager::save_session(const SessionState& state, std::optional<int64_t> ttl,
                                      DoneCallback done) {
    std::string id = state.session_id;
    store_.set(session_key(id), state.to_json().dump(), ttl,
        [id, done = std::move(done)](store::StatusReply reply) {
            if (!reply.ok) {
                spdlog::error("Error saving session {}: {}", id, reply.error);
            }
            if (done) done(reply.ok);
        });
}

void PersistenceManager::load_session(const std::string& session_id, StateCallback cb) {
    std::weak_ptr<bool> alive = alive_;
    store_.get(session_key(session_id), [this, alive, session_id, cb = std::move(cb)](store::ValueReply reply) {
        if (!reply.ok) {
            spdlog::error("Error loading session {}: {}", session_id, reply.error);
            cb(std::nullopt);
            return;
        }
        if (!reply.value) {
            cb(std::nullopt);
            return;
        }
        std::optional<SessionState> state;
        try {
            state = SessionState::from_json(json::parse(*reply.value));
        } catch (const json::parse_error& e) {
            spdlog::error("Error loading session {}: {}", session_id, e.what());
        }
        if (state && !alive.expired() && expired(*state)) {
            spdlog::debug("Stored session {} is past its expiry", session_id);
            state.reset();
        }
        cb(std::move(state));
    });
}

void PersistenceManager::load_all_files(const std::string& session_id,
                                        std::function<void(std::map<std::string, std::string>)> cb) {
    size_t max_size = config_.max_file_size;
    store_.hgetall(files_key(session_id),
        [session_id, max_size, cb = std::move(cb)](store::HashReply reply) {
            std::map<std::string, std::string> files;
            if (!reply.ok) {
                spdlog::error("Error loading files for session {}: {}", session_id, reply.error);
                cb(std::move(files));
                return;
            }
            for (const auto& [path, stored] : reply.value) {
                auto content = decode_file(stored, max_size);
                if (!content) {
                    spdlog::error("Undecodable file {} in session {}", path, session_id);
                    continue;
                }
                files[path] = std::move(*content);
            }
            cb(std::move(files));
        });
}

// ============================================================================
// Sessions
// ============================================================================

void PersistenceManager::create_session(const std::string& session_id, const std::string& pool_name,
                                        const std::string& pod_name, const std::string& template_name,
                                        int64_t ttl_seconds, std::map<std::string, std::string> metadata,
                                        StateCallback cb) {
    double now = clock_();

    SessionState state;
    state.session_id = session_id;
    state.pool_name = pool_name;
    state.pod_name = pod_name;
    state.template_name = template_name;
    state.created_at = util::iso_timestamp(now);
    state.last_activity = state.created_at;
    state.expires_at = util::iso_timestamp(now + static_cast<double>(ttl_seconds));
    state.metadata = std::move(metadata);

    sessions_[session_id] = state;

    save_session(state, ttl_seconds, [session_id, state, cb = std::move(cb)](bool) {
        spdlog::info("Created persisted session: {}", session_id);
        if (cb) cb(state);
    });
}

void PersistenceManager::get_session(const std::string& session_id, StateCallback cb) {
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        if (!expired(it->second)) {
            post_result(std::move(cb), std::optional<SessionState>(it->second));
            return;
        }
        sessions_.erase(it);
    }
    load_session(session_id, std::move(cb));
}

void PersistenceManager::update_session(const std::string& session_id, const json& updates,
                                        DoneCallback done) {
    std::weak_ptr<bool> alive = alive_;
    get_session(session_id, [this, alive, session_id, updates, done = std::move(done)](std::optional<SessionState> state) {
        if (alive.expired()) return;
        if (!state) {
            spdlog::warn("Session not found for update: {}", session_id);
            if (done) done(false);
            return;
        }

        try {
            state->apply_updates(updates);
        } catch (const json::exception& e) {
            spdlog::error("Error updating session {}: {}", session_id, e.what());
            if (done) done(false);
            return;
        }
        state->last_activity = now_iso();

        // Keep files picked up since the record was read
        auto cached = sessions_.find(session_id);
        if (cached != sessions_.end()) {
            state->files = cached->second.files;
        }
        sessions_[session_id] = *state;

        spdlog::debug("Updated session: {}", session_id);
        save_session(*state, remaining_ttl(*state), std::move(done));
    });
}

void PersistenceManager::migrate_session(const std::string& session_id, const std::string& new_pod,
                                         const std::optional<std::string>& new_pool, StateCallback cb) {
    std::weak_ptr<bool> alive = alive_;
    get_session(session_id, [this, alive, session_id, new_pod, new_pool, cb = std::move(cb)](std::optional<SessionState> state) {
        if (alive.expired()) return;
        if (!state) {
            spdlog::warn("Cannot migrate non-existent session: {}", session_id);
            if (cb) cb(std::nullopt);
            return;
        }

        std::string old_pod = state->pod_name;
        state->pod_name = new_pod;
        if (new_pool && !new_pool->empty()) {
            state->pool_name = *new_pool;
        }
        state->last_activity = now_iso();
        state->metadata["migrated_from"] = old_pod;
        state->metadata["migrated_at"] = state->last_activity;

        sessions_[session_id] = *state;

        SessionState result = *state;
        save_session(*state, remaining_ttl(*state), [session_id, old_pod, new_pod, result, cb](bool) {
            spdlog::info("Migrated session {} from {} to {}", session_id, old_pod, new_pod);
            if (cb) cb(result);
        });
    });
}

void PersistenceManager::restore_session(const std::string& session_id, const std::string& new_pod,
                                         StateCallback cb) {
    std::weak_ptr<bool> alive = alive_;
    load_session(session_id, [this, alive, session_id, new_pod, cb = std::move(cb)](std::optional<SessionState> state) {
        if (alive.expired()) return;
        if (!state) {
            spdlog::warn("Cannot restore non-existent session: {}", session_id);
            if (cb) cb(std::nullopt);
            return;
        }

        state->pod_name = new_pod;
        state->last_activity = now_iso();
        state->metadata["restored"] = "true";
        state->metadata["restored_at"] = state->last_activity;

        SessionState restored = std::move(*state);
        load_all_files(session_id, [this, alive, session_id, new_pod, restored, cb](std::map<std::string, std::string> files) mutable {
            if (alive.expired()) return;
            restored.files = std::move(files);
            sessions_[session_id] = restored;

            save_session(restored, remaining_ttl(restored), [session_id, new_pod, restored, cb](bool) {
                spdlog::info("Restored session {} to pod {} ({} files)", session_id, new_pod, restored.files.size());
                if (cb) cb(restored);
            });
        });
    });
}

void PersistenceManager::delete_session(const std::string& session_id, DoneCallback done) {
    sessions_.erase(session_id);

    auto ok = std::make_shared<bool>(true);
    store_.del(session_key(session_id), [ok](store::StatusReply reply) {
        if (!reply.ok) *ok = false;
    });
    store_.del(files_key(session_id), [session_id, ok, done = std::move(done)](store::StatusReply reply) {
        if (!reply.ok) *ok = false;
        if (*ok) {
            spdlog::info("Deleted session: {}", session_id);
        } else {
            spdlog::error("Error deleting session {}: {}", session_id, reply.error);
        }
        if (done) done(*ok);
    });
}

void PersistenceManager::list_sessions(const std::optional<std::string>& pool_name,
                                       const std::optional<std::string>& pod_name, StatesCallback cb) {
    std::weak_ptr<bool> alive = alive_;
    store_.keys(SESSION_PREFIX, [this, alive, pool_name, pod_name, cb = std::move(cb)](store::KeysReply reply) {
        if (alive.expired()) return;
        if (!reply.ok) {
            spdlog::error("Error listing sessions: {}", reply.error);
            cb({});
            return;
        }

        std::vector<std::string> ids;
        const std::string prefix = SESSION_PREFIX;
        for (const auto& key : reply.value) {
            if (ends_with(key, FILES_SUFFIX)) continue;
            ids.push_back(key.substr(prefix.size()));
        }
        if (ids.empty()) {
            cb({});
            return;
        }

        struct Pending {
            size_t remaining;
            std::vector<std::optional<SessionState>> results;
            StatesCallback cb;
        };
        auto pending = std::make_shared<Pending>();
        pending->remaining = ids.size();
        pending->results.resize(ids.size());
        pending->cb = std::move(cb);

        for (size_t i = 0; i < ids.size(); i++) {
            load_session(ids[i], [pending, i, pool_name, pod_name](std::optional<SessionState> state) {
                if (state) {
                    bool keep = (!pool_name || state->pool_name == *pool_name) &&
                                (!pod_name || state->pod_name == *pod_name);
                    if (keep) pending->results[i] = std::move(state);
                }
                if (--pending->remaining == 0) {
                    std::vector<SessionState> sessions;
                    for (auto& result : pending->results) {
                        if (result) sessions.push_back(std::move(*result));
                    }
                    pending->cb(std::move(sessions));
                }
            });
        }
    });
}

// ============================================================================
// Files
// ============================================================================

void PersistenceManager::add_file(const std::string& session_id, const std::string& path,
                                  const std::string& content, DoneCallback done) {
    if (content.size() > config_.max_file_size) {
        spdlog::warn("File too large for session {}: {} ({} bytes)", session_id, path, content.size());
        post_result(std::move(done), false);
        return;
    }

    std::weak_ptr<bool> alive = alive_;
    get_session(session_id, [this, alive, session_id, path, content, done = std::move(done)](std::optional<SessionState> state) mutable {
        if (alive.expired()) return;
        if (!state) {
            spdlog::warn("Cannot add file to unknown session: {}", session_id);
            if (done) done(false);
            return;
        }

        auto cached = sessions_.find(session_id);
        if (cached == sessions_.end()) {
            cached = sessions_.emplace(session_id, std::move(*state)).first;
        }
        cached->second.files[path] = content;
        cached->second.last_activity = now_iso();

        std::string key = files_key(session_id);
        store_.hset(key, path, encode_file(content, config_.compression_enabled),
            [session_id, path](store::StatusReply reply) {
                if (!reply.ok) {
                    spdlog::error("Error saving file {} for session {}: {}", path, session_id, reply.error);
                }
            });
        store_.expire(key, config_.files_ttl, [done = std::move(done)](store::StatusReply reply) {
            if (done) done(reply.ok);
        });
    });
}

void PersistenceManager::get_file(const std::string& session_id, const std::string& path, FileCallback cb) {
    auto cached = sessions_.find(session_id);
    if (cached != sessions_.end()) {
        auto file = cached->second.files.find(path);
        if (file != cached->second.files.end()) {
            post_result(std::move(cb), std::optional<std::string>(file->second));
            return;
        }
    }

    size_t max_size = config_.max_file_size;
    store_.hget(files_key(session_id), path,
        [session_id, path, max_size, cb = std::move(cb)](store::ValueReply reply) {
            if (!reply.ok) {
                spdlog::error("Error loading file {} for session {}: {}", path, session_id, reply.error);
                cb(std::nullopt);
                return;
            }
            if (!reply.value) {
                cb(std::nullopt);
                return;
            }
            auto content = decode_file(*reply.value, max_size);
            if (!content) {
                spdlog::error("Undecodable file {} in session {}", path, session_id);
            }
            cb(std::move(content));
        });
}

void PersistenceManager::delete_file(const std::string& session_id, const std::string& path,
                                     DoneCallback done) {
    auto cached = sessions_.find(session_id);
    if (cached != sessions_.end()) {
        cached->second.files.erase(path);
    }

    store_.hdel(files_key(session_id), path, [session_id, path, done = std::move(done)](store::StatusReply reply) {
        if (!reply.ok) {
            spdlog::error("Error deleting file {} from session {}: {}", path, session_id, reply.error);
        }
        if (done) done(reply.ok);
    });
}

// ============================================================================
// Stats
// ============================================================================

void PersistenceManager::get_stats(StatsCallback cb) {
    std::weak_ptr<bool> alive = alive_;
    store_.keys(SESSION_PREFIX, [this, alive, cb = std::move(cb)](store::KeysReply reply) {
        if (alive.expired()) return;

        json stats = {
            {"active_sessions", sessions_.size()},
            {"compression_enabled", config_.compression_enabled},
            {"max_file_size", config_.max_file_size},
            {"snapshot_interval", config_.snapshot_interval}
        };
        if (reply.ok) {
            size_t persisted = 0;
            for (const auto& key : reply.value) {
                if (!ends_with(key, FILES_SUFFIX)) persisted++;
            }
            stats["persisted_sessions"] = persisted;
        } else {
            spdlog::error("Error getting persistence stats: {}", reply.error);
            stats["persisted_sessions"] = nullptr;
            stats["error"] = reply.error;
        }
        cb(std::move(stats));
    });
}

} // namespace warden::persistence
