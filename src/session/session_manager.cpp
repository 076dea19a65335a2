#include "session/session_manager.hpp"
#include "util/errors.hpp"
#include "util/ids.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>

using json = nlohmann::json;

namespace warden::session {

namespace {

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

// ============================================================================
// Session Implementation
// ============================================================================

Session::Session(std::string id, std::string template_name,
                 std::unique_ptr<runtime::Sandbox> sandbox,
                 double now, double ttl, json metadata)
    : id_(std::move(id))
    , template_name_(std::move(template_name))
    , sandbox_(std::move(sandbox))
    , created_at_(now)
    , last_used_(now)
    , ttl_(ttl)
    , metadata_(std::move(metadata)) {
    container_id_ = sandbox_->container_id();
}

void Session::touch(double now) {
    last_used_ = now;
    use_count_++;
}

json Session::to_json(double now) const {
    return {
        {"id", id_},
        {"template", template_name_},
        {"age", round2(age(now))},
        {"idle_time", round2(idle_time(now))},
        {"ttl", ttl_},
        {"is_expired", is_expired(now)},
        {"use_count", use_count_},
        {"metadata", metadata_},
        {"container_id", container_id_}
    };
}

// ============================================================================
// SessionManager Implementation
// ============================================================================

SessionManager::SessionManager(SessionManagerConfig config,
                               std::shared_ptr<runtime::ContainerRuntime> runtime,
                               std::shared_ptr<runtime::TemplateRegistry> templates,
                               util::Clock clock)
    : config_(config)
    , runtime_(std::move(runtime))
    , templates_(std::move(templates))
    , clock_(std::move(clock)) {
    if (config_.background_cleanup) {
        cleanup_thread_ = std::thread([this]() { cleanup_loop(); });
        spdlog::info("Session cleanup thread started (interval={}s)", config_.cleanup_interval);
    }
}

SessionManager::~SessionManager() {
    stop();
}

void SessionManager::set_policy_engine(std::shared_ptr<policy::PolicyEngine> policy) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    policy_ = std::move(policy);
}

void SessionManager::set_event_callback(SessionEventCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    event_callback_ = std::move(callback);
}

void SessionManager::emit(const SessionEvent& event) {
    SessionEventCallback callback;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        callback = event_callback_;
    }
    if (!callback) return;
    try {
        callback(event);
    } catch (const std::exception& e) {
        spdlog::error("Session event handler failed ({} {}): {}",
                      session_event_type_to_string(event.type), event.session_id, e.what());
    }
}

std::string SessionManager::create_session(const std::string& template_name,
                                           std::optional<double> ttl, json metadata) {
    double session_ttl = (ttl && *ttl > 0) ? *ttl : config_.default_ttl;
    if (!metadata.is_object()) {
        metadata = json::object();
    }

    std::vector<std::shared_ptr<Session>> expired;
    bool at_capacity = false;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (sessions_.size() + pending_creates_ >= config_.max_sessions) {
            expired = take_expired_locked();
        }
        if (sessions_.size() + pending_creates_ >= config_.max_sessions) {
            errors_++;
            at_capacity = true;
        } else {
            // Reserve the slot before provisioning outside the lock
            pending_creates_++;
        }
    }
    retire(expired, SessionEventType::EXPIRED);

    if (at_capacity) {
        throw CapacityError("Maximum session limit reached (" +
                            std::to_string(config_.max_sessions) +
                            "). Destroy existing sessions or increase limit.");
    }

    // The reserved slot is released on every path; the sandbox destroys
    // its container if it never reaches the registry
    std::string session_id;
    try {
        runtime::SandboxConfig sandbox_config = templates_->sandbox_config(template_name);
        auto sandbox = std::make_unique<runtime::Sandbox>(sandbox_config, runtime_);
        sandbox->create();

        session_id = util::random_hex(12);
        auto session = std::make_shared<Session>(session_id, template_name, std::move(sandbox),
                                                 clock_(), session_ttl, metadata);
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        sessions_[session_id] = session;
        pending_creates_--;
        sessions_created_++;
    } catch (const std::exception& e) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        pending_creates_--;
        errors_++;
        spdlog::error("Failed to create session (template={}): {}", template_name, e.what());
        throw;
    }

    spdlog::info("Session created: {} (template: {})", session_id, template_name);
    emit({SessionEventType::CREATED, session_id, template_name, session_ttl, metadata});
    return session_id;
}

std::shared_ptr<Session> SessionManager::acquire(const std::string& session_id) {
    std::shared_ptr<Session> expired;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return nullptr;
        }

        auto session = it->second;
        if (!session->is_active()) {
            spdlog::warn("Session {} is inactive", session_id);
            return nullptr;
        }

        double now = clock_();
        if (!session->is_expired(now)) {
            session->touch(now);
            sessions_reused_++;
            return session;
        }

        spdlog::info("Session {} expired, destroying", session_id);
        expired = take_locked(session_id);
        sessions_expired_++;
    }
    retire({expired}, SessionEventType::EXPIRED);
    return nullptr;
}

std::optional<json> SessionManager::get_session(const std::string& session_id) {
    auto session = acquire(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return session->to_json(clock_());
}

runtime::ExecutionResult SessionManager::execute_in_session(
    const std::string& session_id, const std::string& code, const std::string& language,
    const std::map<std::string, std::string>& files) {
    auto session = acquire(session_id);
    if (!session) {
        return runtime::ExecutionResult::failure(
            "not_found", "Session " + session_id + " not found or expired", language);
    }

    std::shared_ptr<policy::PolicyEngine> policy;
    json tenant;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        policy = policy_;
        tenant = session->metadata().value("tenant", json("anonymous"));
    }

    if (policy) {
        policy::PolicyRequest request;
        request.subject = tenant.is_string() ? tenant.get<std::string>() : tenant.dump();
        request.resource = "session:" + session_id;
        request.action = "execute";
        request.context = {{"language", language}, {"template", session->template_name()}};

        policy::PolicyDecision decision = policy->evaluate(request);
        if (!policy->enforce(decision)) {
            spdlog::warn("Policy denied execution in session {} ({})", session_id, decision.decision);
            return runtime::ExecutionResult::failure(
                "policy_denied", "Execution denied by policy", language);
        }
    }

    try {
        return session->sandbox().run(code, language, files);
    } catch (const TimeoutError& e) {
        // The sandbox is gone; the session cannot be used again
        spdlog::error("Execution in session {} timed out", session_id);
        std::shared_ptr<Session> dead;
        {
            std::lock_guard<std::recursive_mutex> lock(mutex_);
            errors_++;
            dead = take_locked(session_id);
            if (dead) sessions_destroyed_++;
        }
        retire({dead}, SessionEventType::DESTROYED);
        return runtime::ExecutionResult::failure(e.kind(), e.what(), language);
    } catch (const UnsupportedLanguageError& e) {
        return runtime::ExecutionResult::failure(e.kind(), e.what(), language);
    } catch (const PathSecurityError& e) {
        return runtime::ExecutionResult::failure(e.kind(), e.what(), language);
    } catch (const FileSizeError& e) {
        return runtime::ExecutionResult::failure(e.kind(), e.what(), language);
    } catch (const SandboxStateError& e) {
        // Destroyed by another caller after lookup
        return runtime::ExecutionResult::failure(e.kind(), e.what(), language);
    } catch (const std::exception& e) {
        spdlog::error("Execution error in session {}: {}", session_id, e.what());
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        errors_++;
        return runtime::ExecutionResult::failure("internal", "Execution failed", language);
    }
}

runtime::ExecutionResult SessionManager::install_packages(const std::string& session_id,
                                                          const std::vector<std::string>& packages) {
    auto session = acquire(session_id);
    if (!session) {
        return runtime::ExecutionResult::failure(
            "not_found", "Session " + session_id + " not found or expired");
    }

    try {
        return session->sandbox().install_packages(packages);
    } catch (const TimeoutError& e) {
        std::shared_ptr<Session> dead;
        {
            std::lock_guard<std::recursive_mutex> lock(mutex_);
            errors_++;
            dead = take_locked(session_id);
            if (dead) sessions_destroyed_++;
        }
        retire({dead}, SessionEventType::DESTROYED);
        return runtime::ExecutionResult::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Package installation failed in session {}: {}", session_id, e.what());
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        errors_++;
        return runtime::ExecutionResult::failure("internal", "Package installation failed");
    }
}

bool SessionManager::destroy_session(const std::string& session_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        session = take_locked(session_id);
        if (!session) {
            return false;
        }
        sessions_destroyed_++;
    }
    retire({session}, SessionEventType::DESTROYED);
    spdlog::info("Session destroyed: {}", session_id);
    return true;
}

size_t SessionManager::cleanup_expired() {
    std::vector<std::shared_ptr<Session>> expired;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        expired = take_expired_locked();
    }
    retire(expired, SessionEventType::EXPIRED);
    if (!expired.empty()) {
        spdlog::info("Cleaned up {} expired sessions", expired.size());
    }
    return expired.size();
}

json SessionManager::list_sessions() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    double now = clock_();
    json list = json::array();
    for (const auto& [id, session] : sessions_) {
        if (session->is_active()) {
            list.push_back(session->to_json(now));
        }
    }
    return list;
}

json SessionManager::metrics() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return {
        {"sessions_created", sessions_created_},
        {"sessions_reused", sessions_reused_},
        {"sessions_destroyed", sessions_destroyed_},
        {"sessions_expired", sessions_expired_},
        {"errors", errors_},
        {"active_sessions", sessions_.size()},
        {"max_sessions", config_.max_sessions},
        {"default_ttl", config_.default_ttl}
    };
}

size_t SessionManager::active_sessions() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return sessions_.size();
}

void SessionManager::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    spdlog::info("Stopping session manager");

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }

    std::vector<std::shared_ptr<Session>> remaining;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        for (auto& [id, session] : sessions_) {
            session->deactivate();
            remaining.push_back(session);
        }
        sessions_destroyed_ += remaining.size();
        sessions_.clear();
    }
    retire(remaining, SessionEventType::DESTROYED);
    spdlog::info("Session manager stopped ({} sessions destroyed)", remaining.size());
}

std::vector<std::shared_ptr<Session>> SessionManager::take_expired_locked() {
    double now = clock_();
    std::vector<std::shared_ptr<Session>> expired;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second->is_expired(now)) {
            it->second->deactivate();
            expired.push_back(it->second);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    sessions_expired_ += expired.size();
    return expired;
}

std::shared_ptr<Session> SessionManager::take_locked(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || !it->second->is_active()) {
        return nullptr;
    }
    auto session = it->second;
    session->deactivate();
    sessions_.erase(it);
    return session;
}

void SessionManager::retire(const std::vector<std::shared_ptr<Session>>& sessions,
                            SessionEventType reason) {
    for (const auto& session : sessions) {
        if (!session) continue;
        session->sandbox().destroy();
        emit({reason, session->id(), session->template_name(), session->ttl(), session->metadata()});
    }
}

void SessionManager::cleanup_loop() {
    auto interval = std::chrono::duration<double>(config_.cleanup_interval);
    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (!stop_cv_.wait_for(lock, interval, [this]() { return stop_requested_; })) {
        lock.unlock();
        try {
            cleanup_expired();
        } catch (const std::exception& e) {
            spdlog::error("Session cleanup error: {}", e.what());
        }
        lock.lock();
    }
}

// ============================================================================
// SessionPool Implementation
// ============================================================================

SessionPool::SessionPool(SessionManager& manager, std::string template_name,
                         size_t min_size, size_t max_size)
    : manager_(manager)
    , template_name_(std::move(template_name))
    , min_size_(min_size)
    , max_size_(std::max(min_size, max_size)) {
    warm();
}

void SessionPool::warm() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (pool_.size() < min_size_) {
        try {
            pool_.push_back(manager_.create_session(template_name_));
        } catch (const Error& e) {
            spdlog::error("Failed to initialize pool session: {}", e.what());
            break;
        }
    }
    spdlog::info("Session pool for {} warmed with {} sessions", template_name_, pool_.size());
}

std::optional<std::string> SessionPool::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!pool_.empty()) {
        std::string sid = pool_.front();
        pool_.pop_front();
        if (manager_.get_session(sid)) {
            leased_++;
            return sid;
        }
    }

    if (leased_ + pool_.size() < max_size_) {
        try {
            std::string sid = manager_.create_session(template_name_);
            leased_++;
            return sid;
        } catch (const Error& e) {
            spdlog::error("Failed to create pooled session: {}", e.what());
        }
    }
    return std::nullopt;
}

void SessionPool::release(const std::string& session_id, bool destroy) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (leased_ > 0) leased_--;

    if (!destroy && pool_.size() < max_size_ && manager_.get_session(session_id)) {
        pool_.push_back(session_id);
        return;
    }
    manager_.destroy_session(session_id);
}

size_t SessionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.size();
}

size_t SessionPool::leased() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_;
}

} // namespace warden::session
