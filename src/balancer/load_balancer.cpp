#include "balancer/load_balancer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace warden::balancer {

using json = nlohmann::json;

LoadBalancer::LoadBalancer(kernel::Reactor& reactor, store::KeyValueStore& store,
                           HealthChecker& checker, LoadBalancerConfig config,
                           util::Clock clock)
    : reactor_(reactor)
    , store_(store)
    , checker_(checker)
    , config_(std::move(config))
    , clock_(std::move(clock))
    , alive_(std::make_shared<bool>(true)) {
    selection_.geo_routing = config_.geo_routing;
    selection_.top_k = config_.top_k;
    selection_.max_queue_depth = config_.max_queue_depth;
    selection_.degraded_health_factor = config_.degraded_health_factor;

    if (config_.seed) {
        rng_.seed(*config_.seed);
    } else {
        rng_.seed(std::random_device{}());
    }
}

LoadBalancer::~LoadBalancer() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void LoadBalancer::start(DoneCallback done) {
    spdlog::info("Starting load balancer");

    std::weak_ptr<bool> alive = alive_;
    store_.hgetall(POOLS_KEY, [this, alive, done = std::move(done)](store::HashReply reply) {
        if (alive.expired()) return;

        if (!reply.ok) {
            spdlog::error("Error loading pools: {}", reply.error);
        }
        for (const auto& [name, text] : reply.value) {
            try {
                auto pool = PoolEndpoint::from_json(json::parse(text));
                if (!pool) {
                    spdlog::warn("Skipping unreadable pool record {}", name);
                    continue;
                }
                pools_[name] = std::move(*pool);
                ensure_breaker(name);
                spdlog::info("Loaded pool: {} ({})", name, pools_[name].region);
            } catch (const json::exception& e) {
                spdlog::error("Error loading pool {}: {}", name, e.what());
            }
        }
        spdlog::info("Loaded {} pools", pools_.size());

        running_ = true;
        health_tick();
        if (done) done(reply.ok);
    });
}

void LoadBalancer::stop() {
    if (!running_) return;
    running_ = false;
    if (health_timer_ != 0) {
        reactor_.cancel(health_timer_);
        health_timer_ = 0;
    }
    spdlog::info("Load balancer stopped");
}

void LoadBalancer::ensure_breaker(const std::string& name) {
    if (breakers_.find(name) == breakers_.end()) {
        breakers_.emplace(name, CircuitBreaker(config_.breaker, clock_));
    }
}

// ============================================================================
// Registry
// ============================================================================

void LoadBalancer::register_pool(PoolEndpoint pool, DoneCallback done) {
    std::string name = pool.name;
    breakers_.erase(name);
    pools_[name] = std::move(pool);
    ensure_breaker(name);

    spdlog::info("Registered pool: {} in {}", name, pools_[name].region);
    persist_pool(pools_[name], std::move(done));
}

void LoadBalancer::unregister_pool(const std::string& name, DoneCallback done) {
    pools_.erase(name);
    breakers_.erase(name);

    store_.hdel(POOLS_KEY, name, [name, done = std::move(done)](store::StatusReply reply) {
        if (!reply.ok) {
            spdlog::error("Error unregistering pool {}: {}", name, reply.error);
        } else {
            spdlog::info("Unregistered pool: {}", name);
        }
        if (done) done(reply.ok);
    });
}

void LoadBalancer::persist_pool(const PoolEndpoint& pool, DoneCallback done) {
    std::string name = pool.name;
    store_.hset(POOLS_KEY, name, pool.to_json().dump(),
        [name, done = std::move(done)](store::StatusReply reply) {
            if (!reply.ok) {
                spdlog::error("Error updating pool metrics for {}: {}", name, reply.error);
            }
            if (done) done(reply.ok);
        });
}

const PoolEndpoint* LoadBalancer::pool(const std::string& name) const {
    auto it = pools_.find(name);
    return it == pools_.end() ? nullptr : &it->second;
}

CircuitBreaker* LoadBalancer::breaker(const std::string& name) {
    auto it = breakers_.find(name);
    return it == breakers_.end() ? nullptr : &it->second;
}

// ============================================================================
// Routing
// ============================================================================

void LoadBalancer::get_pool_for_session(const std::string& session_id,
                                        const std::optional<std::string>& preferred_region,
                                        PoolCallback cb) {
    std::weak_ptr<bool> alive = alive_;
    get_affinity(session_id,
        [this, alive, session_id, preferred_region, cb = std::move(cb)](std::optional<SessionAffinity> affinity) mutable {
            if (alive.expired()) return;

            if (affinity) {
                auto it = pools_.find(affinity->pool_name);
                if (it != pools_.end() && it->second.status == PoolStatus::HEALTHY) {
                    spdlog::debug("Using session affinity for {} -> {}", session_id, it->first);
                    cb(it->second);
                    return;
                }
            }
            select_fresh(session_id, preferred_region, std::move(cb));
        });
}

void LoadBalancer::select_fresh(const std::string& session_id,
                                const std::optional<std::string>& preferred_region,
                                PoolCallback cb) {
    std::vector<PoolEndpoint*> candidates;
    for (auto& [name, pool] : pools_) {
        if (!breakers_.at(name).can_execute()) continue;
        if (pool.status != PoolStatus::HEALTHY && pool.status != PoolStatus::DEGRADED) continue;
        if (pool.current_sessions >= pool.max_sessions) continue;
        if (pool.queue_depth > selection_.max_queue_depth) continue;
        candidates.push_back(&pool);
    }

    if (candidates.empty()) {
        spdlog::warn("No available pools for session {}", session_id);
        cb(std::nullopt);
        return;
    }

    rank_pools(candidates, preferred_region, selection_);
    PoolEndpoint* selected = choose_weighted(candidates, selection_, rng_);

    set_affinity(session_id, selected->name);
    selected->current_sessions++;
    spdlog::info("Selected pool {} for session {}", selected->name, session_id);

    PoolEndpoint snapshot = *selected;
    persist_pool(*selected, [cb = std::move(cb), snapshot](bool) {
        cb(snapshot);
    });
}

void LoadBalancer::release_session(const std::string& session_id, const std::string& pool_name,
                                   DoneCallback done) {
    auto it = pools_.find(pool_name);
    if (it != pools_.end()) {
        it->second.current_sessions = std::max(0, it->second.current_sessions - 1);
        persist_pool(it->second);
    }

    affinities_.erase(session_id);
    store_.hdel(AFFINITIES_KEY, session_id, [done = std::move(done)](store::StatusReply reply) {
        if (!reply.ok) {
            spdlog::error("Error clearing session affinity: {}", reply.error);
        }
        if (done) done(reply.ok);
    });
}

// ============================================================================
// Affinity
// ============================================================================

void LoadBalancer::get_affinity(const std::string& session_id, AffinityCallback cb) {
    double now = clock_();

    auto it = affinities_.find(session_id);
    if (it != affinities_.end()) {
        if (!it->second.is_expired(now)) {
            reactor_.post([cb = std::move(cb), affinity = it->second]() { cb(affinity); });
            return;
        }
        affinities_.erase(it);
    }

    std::weak_ptr<bool> alive = alive_;
    store_.hget(AFFINITIES_KEY, session_id,
        [this, alive, session_id, cb = std::move(cb)](store::ValueReply reply) {
            if (alive.expired()) return;

            if (!reply.ok) {
                spdlog::error("Error getting session affinity: {}", reply.error);
                cb(std::nullopt);
                return;
            }
            if (!reply.value) {
                cb(std::nullopt);
                return;
            }

            std::optional<SessionAffinity> affinity;
            try {
                affinity = SessionAffinity::from_json(json::parse(*reply.value));
            } catch (const json::exception& e) {
                spdlog::error("Error parsing session affinity for {}: {}", session_id, e.what());
            }
            if (!affinity) {
                cb(std::nullopt);
                return;
            }

            if (affinity->is_expired(clock_())) {
                store_.hdel(AFFINITIES_KEY, session_id, {});
                cb(std::nullopt);
                return;
            }
            affinities_[session_id] = *affinity;
            cb(affinity);
        });
}

void LoadBalancer::set_affinity(const std::string& session_id, const std::string& pool_name) {
    SessionAffinity affinity;
    affinity.session_id = session_id;
    affinity.pool_name = pool_name;
    affinity.created_at = clock_();
    affinity.ttl = config_.affinity_ttl;
    affinities_[session_id] = affinity;

    auto log_error = [](store::StatusReply reply) {
        if (!reply.ok) {
            spdlog::error("Error setting session affinity: {}", reply.error);
        }
    };
    store_.hset(AFFINITIES_KEY, session_id, affinity.to_json().dump(), log_error);
    store_.expire(AFFINITIES_KEY, static_cast<int64_t>(config_.affinity_ttl), log_error);
}

// ============================================================================
// Health checks
// ============================================================================

void LoadBalancer::run_health_checks(DoneCallback done) {
    if (pools_.empty()) {
        if (done) reactor_.post([done = std::move(done)]() { done(true); });
        return;
    }

    auto remaining = std::make_shared<size_t>(pools_.size());
    auto finished = std::make_shared<DoneCallback>(std::move(done));
    std::weak_ptr<bool> alive = alive_;

    for (const auto& [name, pool] : pools_) {
        checker_.check(pool, config_.health_check_timeout,
            [this, alive, name = name, remaining, finished](HealthReport report) {
                if (alive.expired()) return;
                apply_health(name, report);
                if (--*remaining == 0 && *finished) {
                    (*finished)(true);
                }
            });
    }
}

void LoadBalancer::apply_health(const std::string& name, const HealthReport& report) {
    auto it = pools_.find(name);
    if (it == pools_.end()) {
        return;
    }
    PoolEndpoint& pool = it->second;
    CircuitBreaker& breaker = breakers_.at(name);

    switch (report.outcome) {
        case HealthReport::Outcome::OK:
            pool.response_time_ms = report.response_time_ms;
            pool.last_health_check = clock_();
            pool.queue_depth = report.queue_depth;
            pool.cpu_utilization = report.cpu_percent;
            pool.memory_utilization = report.memory_percent;
            if (pool.cpu_utilization > config_.degraded_utilization ||
                pool.memory_utilization > config_.degraded_utilization) {
                pool.status = PoolStatus::DEGRADED;
            } else {
                pool.status = PoolStatus::HEALTHY;
            }
            breaker.record_success();
            break;
        case HealthReport::Outcome::BAD_STATUS:
            pool.status = PoolStatus::UNHEALTHY;
            breaker.record_failure();
            spdlog::warn("Health check for pool {} returned {}", name, report.http_status);
            break;
        case HealthReport::Outcome::TIMEOUT:
            pool.response_time_ms = config_.timeout_response_ms;
            pool.status = PoolStatus::DEGRADED;
            breaker.record_failure();
            spdlog::warn("Health check timeout for pool {}", name);
            break;
        case HealthReport::Outcome::TRANSPORT_ERROR:
            pool.status = PoolStatus::UNHEALTHY;
            breaker.record_failure();
            spdlog::error("Health check failed for pool {}: {}", name, report.error);
            break;
    }

    persist_pool(pool);
}

void LoadBalancer::health_tick() {
    if (!running_) return;

    std::weak_ptr<bool> alive = alive_;
    run_health_checks([this, alive](bool) {
        if (alive.expired()) return;
        schedule_health_tick();
    });
}

void LoadBalancer::schedule_health_tick() {
    if (!running_ || health_timer_ != 0) return;
    health_timer_ = reactor_.call_later(config_.health_check_interval, [this]() {
        health_timer_ = 0;
        health_tick();
    });
}

// ============================================================================
// Stats
// ============================================================================

json LoadBalancer::get_pool_stats() const {
    int healthy = 0;
    int degraded = 0;
    int unhealthy = 0;
    int64_t total_sessions = 0;
    int64_t total_capacity = 0;
    json pools = json::object();

    for (const auto& [name, pool] : pools_) {
        if (pool.status == PoolStatus::HEALTHY) healthy++;
        if (pool.status == PoolStatus::DEGRADED) degraded++;
        if (pool.status == PoolStatus::UNHEALTHY) unhealthy++;
        total_sessions += pool.current_sessions;
        total_capacity += pool.max_sessions;

        json entry = pool.to_json();
        auto breaker = breakers_.find(name);
        if (breaker != breakers_.end()) {
            entry["circuit_breaker"] = breaker->second.to_json();
        }
        pools[name] = std::move(entry);
    }

    return {
        {"total_pools", pools_.size()},
        {"healthy_pools", healthy},
        {"degraded_pools", degraded},
        {"unhealthy_pools", unhealthy},
        {"total_sessions", total_sessions},
        {"total_capacity", total_capacity},
        {"pools", pools}
    };
}

} // namespace warden::balancer
