/**
 * Warden Session Persistence Manager
 *
 * Keeps session state in the durable store so a session outlives the pod
 * that created it. Active sessions are cached locally and flushed on a
 * snapshot interval and once more on stop(). Files are stored in a
 * per-session hash, encoded with a codec tag (see file_codec.hpp).
 *
 * Runs on the reactor; every callback runs there and never inline.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/reactor.hpp"
#include "persistence/session_state.hpp"
#include "store/kv_store.hpp"
#include "util/clock.hpp"

namespace warden::persistence {

struct PersistenceConfig {
    bool compression_enabled = true;
    size_t max_file_size = 10 * 1024 * 1024;
    double snapshot_interval = 60.0;    // seconds
    int64_t files_ttl = 86400;          // seconds
};

using StateCallback = std::function<void(std::optional<SessionState>)>;
using StatesCallback = std::function<void(std::vector<SessionState>)>;
using FileCallback = std::function<void(std::optional<std::string>)>;
using StatsCallback = std::function<void(nlohmann::json)>;
using DoneCallback = std::function<void(bool ok)>;

class PersistenceManager {
public:
    // clock: wall seconds, used for the ISO timestamps in records
    PersistenceManager(kernel::Reactor& reactor, store::KeyValueStore& store,
                       PersistenceConfig config = {},
                       util::Clock clock = util::wall_seconds);
    ~PersistenceManager();

    // Non-copyable
    PersistenceManager(const PersistenceManager&) = delete;
    PersistenceManager& operator=(const PersistenceManager&) = delete;

    void start();
    // Cancel the snapshot timer and flush every cached session
    void stop(DoneCallback done = {});
    bool running() const { return running_; }

    static std::string session_key(const std::string& session_id);
    static std::string files_key(const std::string& session_id);

    void create_session(const std::string& session_id, const std::string& pool_name,
                        const std::string& pod_name, const std::string& template_name,
                        int64_t ttl_seconds, std::map<std::string, std::string> metadata,
                        StateCallback cb = {});

    // Local cache first, then the store; expired records read as missing
    void get_session(const std::string& session_id, StateCallback cb);

    // Recognised fields: pool_name, pod_name, template, expires_at,
    // environment, execution_history, installed_packages, metadata
    void update_session(const std::string& session_id, const nlohmann::json& updates,
                        DoneCallback done);

    void add_file(const std::string& session_id, const std::string& path,
                  const std::string& content, DoneCallback done);
    void get_file(const std::string& session_id, const std::string& path, FileCallback cb);
    void delete_file(const std::string& session_id, const std::string& path, DoneCallback done);

    void migrate_session(const std::string& session_id, const std::string& new_pod,
                         const std::optional<std::string>& new_pool, StateCallback cb);
    // Loads the record and every file from the store and moves it to new_pod
    void restore_session(const std::string& session_id, const std::string& new_pod,
                         StateCallback cb);
    void delete_session(const std::string& session_id, DoneCallback done);

    void list_sessions(const std::optional<std::string>& pool_name,
                       const std::optional<std::string>& pod_name, StatesCallback cb);

    void get_stats(StatsCallback cb);

    // Write every live cached session and drop expired ones; done runs
    // after the last write lands
    void flush(DoneCallback done = {});

    size_t cached_sessions() const { return sessions_.size(); }
    const PersistenceConfig& config() const { return config_; }

private:
    kernel::Reactor& reactor_;
    store::KeyValueStore& store_;
    PersistenceConfig config_;
    util::Clock clock_;

    std::unordered_map<std::string, SessionState> sessions_;
    bool running_ = false;
    kernel::TimerId snapshot_timer_ = 0;
    std::shared_ptr<bool> alive_;

    std::string now_iso() const;
    // Seconds left before expires_at; nullopt when it cannot be parsed
    std::optional<int64_t> remaining_ttl(const SessionState& state) const;
    bool expired(const SessionState& state) const;

    void save_session(const SessionState& state, std::optional<int64_t> ttl, DoneCallback done = {});
    void load_session(const std::string& session_id, StateCallback cb);
    void load_all_files(const std::string& session_id,
                        std::function<void(std::map<std::string, std::string>)> cb);

    void schedule_snapshot();

    template <typename Callback, typename Value>
    void post_result(Callback cb, Value value);
};

} // namespace warden::persistence
