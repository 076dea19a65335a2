/**
 * Warden Session Manager
 *
 * In-process registry of sessions, each a TTL-bounded lease over one
 * Sandbox. All registry state is guarded by a single reentrant lock;
 * container lifecycle calls run outside it. A background thread sweeps
 * idle-expired sessions on a fixed interval.
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/container_runtime.hpp"
#include "runtime/sandbox.hpp"
#include "runtime/templates.hpp"
#include "policy/policy_engine.hpp"
#include "util/clock.hpp"

namespace warden::session {

struct SessionManagerConfig {
    double default_ttl = 300.0;         // seconds idle before expiry
    size_t max_sessions = 10;
    double cleanup_interval = 60.0;     // sweep period, seconds
    bool background_cleanup = true;
};

enum class SessionEventType {
    CREATED,
    DESTROYED,
    EXPIRED
};

inline const char* session_event_type_to_string(SessionEventType type) {
    switch (type) {
        case SessionEventType::CREATED:   return "created";
        case SessionEventType::DESTROYED: return "destroyed";
        case SessionEventType::EXPIRED:   return "expired";
        default: return "unknown";
    }
}

struct SessionEvent {
    SessionEventType type;
    std::string session_id;
    std::string template_name;
    double ttl = 0.0;
    nlohmann::json metadata;
};

// Runs on the thread that caused the event, outside the registry lock
using SessionEventCallback = std::function<void(const SessionEvent&)>;

// A named lease over one sandbox
class Session {
public:
    Session(std::string id, std::string template_name,
            std::unique_ptr<runtime::Sandbox> sandbox,
            double now, double ttl, nlohmann::json metadata);

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    const std::string& template_name() const { return template_name_; }
    runtime::Sandbox& sandbox() { return *sandbox_; }
    const nlohmann::json& metadata() const { return metadata_; }
    double ttl() const { return ttl_; }
    uint64_t use_count() const { return use_count_; }
    bool is_active() const { return active_; }

    double age(double now) const { return now - created_at_; }
    double idle_time(double now) const { return now - last_used_; }
    bool is_expired(double now) const { return idle_time(now) > ttl_; }

    void touch(double now);
    void deactivate() { active_ = false; }

    nlohmann::json to_json(double now) const;

private:
    std::string id_;
    std::string template_name_;
    std::unique_ptr<runtime::Sandbox> sandbox_;
    std::string container_id_;
    double created_at_;
    double last_used_;
    double ttl_;
    nlohmann::json metadata_;
    uint64_t use_count_ = 0;
    bool active_ = true;
};

class SessionManager {
public:
    SessionManager(SessionManagerConfig config,
                   std::shared_ptr<runtime::ContainerRuntime> runtime,
                   std::shared_ptr<runtime::TemplateRegistry> templates,
                   util::Clock clock = util::monotonic_seconds);
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Optional authorization check before every execution
    void set_policy_engine(std::shared_ptr<policy::PolicyEngine> policy);

    // Lifecycle notifications (creation, explicit destroy, expiry)
    void set_event_callback(SessionEventCallback callback);

    // Throws CapacityError at max_sessions (after sweeping expired
    // sessions) and ProvisionError if the sandbox cannot start
    std::string create_session(const std::string& template_name = "default",
                               std::optional<double> ttl = std::nullopt,
                               nlohmann::json metadata = nlohmann::json::object());

    // Snapshot of a live session, touching it. Expired sessions are
    // destroyed and reported as nullopt.
    std::optional<nlohmann::json> get_session(const std::string& session_id);

    // Always returns a well-formed result; failures carry error_kind
    runtime::ExecutionResult execute_in_session(
        const std::string& session_id, const std::string& code,
        const std::string& language = "python",
        const std::map<std::string, std::string>& files = {});

    runtime::ExecutionResult install_packages(const std::string& session_id,
                                              const std::vector<std::string>& packages);

    // False if the session is unknown or already destroyed
    bool destroy_session(const std::string& session_id);

    // Destroy every idle-expired session; returns how many
    size_t cleanup_expired();

    nlohmann::json list_sessions() const;
    nlohmann::json metrics() const;
    size_t active_sessions() const;

    // Stop the sweep and destroy all sessions. Idempotent.
    void stop();

    const SessionManagerConfig& config() const { return config_; }

private:
    SessionManagerConfig config_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    std::shared_ptr<runtime::TemplateRegistry> templates_;
    std::shared_ptr<policy::PolicyEngine> policy_;
    SessionEventCallback event_callback_;
    util::Clock clock_;

    mutable std::recursive_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    size_t pending_creates_ = 0;

    // Metrics
    uint64_t sessions_created_ = 0;
    uint64_t sessions_reused_ = 0;
    uint64_t sessions_destroyed_ = 0;
    uint64_t sessions_expired_ = 0;
    uint64_t errors_ = 0;

    // Sweep thread
    std::thread cleanup_thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> stopped_{false};

    // Resolve and touch; nullptr if missing or expired
    std::shared_ptr<Session> acquire(const std::string& session_id);

    // Remove expired entries under the lock; caller destroys them
    std::vector<std::shared_ptr<Session>> take_expired_locked();
    std::shared_ptr<Session> take_locked(const std::string& session_id);
    // Destroy the sandboxes and notify; call without the lock held
    void retire(const std::vector<std::shared_ptr<Session>>& sessions, SessionEventType reason);
    void emit(const SessionEvent& event);

    void cleanup_loop();
};

// Pre-warmed sessions for one template
class SessionPool {
public:
    SessionPool(SessionManager& manager, std::string template_name = "default",
                size_t min_size = 2, size_t max_size = 5);

    // Non-copyable
    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // A live pooled session, or a new one while under max_size
    std::optional<std::string> acquire();

    // Return to the pool, or destroy when asked, dead or the pool is full
    void release(const std::string& session_id, bool destroy = false);

    size_t idle() const;
    size_t leased() const;

private:
    SessionManager& manager_;
    std::string template_name_;
    size_t min_size_;
    size_t max_size_;

    mutable std::mutex mutex_;
    std::deque<std::string> pool_;
    size_t leased_ = 0;

    void warm();
};

} // namespace warden::session
