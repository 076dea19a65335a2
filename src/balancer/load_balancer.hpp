/**
 * Warden Global Load Balancer
 *
 * Routes sessions to executor pools. A session that already has a live
 * affinity to a healthy pool goes back there; otherwise the pool is picked
 * among healthy or degraded candidates with spare capacity and a closed
 * (or probing) circuit breaker, by weighted random choice over the best
 * scored few.
 *
 * Runs on the reactor. Pool and affinity state is cached locally and
 * mirrored to the durable store; a periodic health loop probes every
 * pool and feeds its circuit breaker. All callbacks run on the reactor
 * thread and never inline.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "balancer/circuit_breaker.hpp"
#include "balancer/health_checker.hpp"
#include "balancer/pool_endpoint.hpp"
#include "balancer/selection.hpp"
#include "kernel/reactor.hpp"
#include "store/kv_store.hpp"
#include "util/clock.hpp"

namespace warden::balancer {

constexpr const char* POOLS_KEY = "executor:loadbalancer:pools";
constexpr const char* AFFINITIES_KEY = "executor:loadbalancer:affinities";

struct LoadBalancerConfig {
    double health_check_interval = 10.0;    // seconds
    double health_check_timeout = 5.0;      // seconds
    bool geo_routing = false;
    double affinity_ttl = 3600.0;           // seconds
    size_t top_k = 3;
    int max_queue_depth = 50;
    double degraded_health_factor = 0.7;
    double degraded_utilization = 90.0;     // cpu or memory percent
    double timeout_response_ms = 5000.0;    // recorded on a probe timeout
    std::optional<uint32_t> seed;           // fixed RNG seed for tests
    CircuitBreakerConfig breaker;
};

using PoolCallback = std::function<void(std::optional<PoolEndpoint>)>;
using DoneCallback = std::function<void(bool ok)>;

class LoadBalancer {
public:
    // clock: wall seconds, shared with affinity records in the store
    LoadBalancer(kernel::Reactor& reactor, store::KeyValueStore& store,
                 HealthChecker& checker, LoadBalancerConfig config = {},
                 util::Clock clock = util::wall_seconds);
    ~LoadBalancer();

    // Non-copyable
    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    // Load pools from the store, then start the health loop
    void start(DoneCallback done = {});
    // Stop scheduling health rounds; probes in flight still land
    void stop();
    bool running() const { return running_; }

    void register_pool(PoolEndpoint pool, DoneCallback done = {});
    void unregister_pool(const std::string& name, DoneCallback done = {});

    // nullopt means no pool can take the session right now
    void get_pool_for_session(const std::string& session_id,
                              const std::optional<std::string>& preferred_region,
                              PoolCallback cb);

    void release_session(const std::string& session_id, const std::string& pool_name,
                         DoneCallback done = {});

    // One probe of every registered pool; done runs after the last result
    void run_health_checks(DoneCallback done = {});

    nlohmann::json get_pool_stats() const;

    const PoolEndpoint* pool(const std::string& name) const;
    CircuitBreaker* breaker(const std::string& name);
    size_t pool_count() const { return pools_.size(); }
    bool has_cached_affinity(const std::string& session_id) const {
        return affinities_.count(session_id) > 0;
    }

private:
    kernel::Reactor& reactor_;
    store::KeyValueStore& store_;
    HealthChecker& checker_;
    LoadBalancerConfig config_;
    util::Clock clock_;
    SelectionConfig selection_;
    std::mt19937 rng_;

    std::map<std::string, PoolEndpoint> pools_;
    std::map<std::string, CircuitBreaker> breakers_;
    std::unordered_map<std::string, SessionAffinity> affinities_;

    bool running_ = false;
    kernel::TimerId health_timer_ = 0;
    std::shared_ptr<bool> alive_;

    using AffinityCallback = std::function<void(std::optional<SessionAffinity>)>;

    void ensure_breaker(const std::string& name);
    void get_affinity(const std::string& session_id, AffinityCallback cb);
    void set_affinity(const std::string& session_id, const std::string& pool_name);
    void select_fresh(const std::string& session_id,
                      const std::optional<std::string>& preferred_region,
                      PoolCallback cb);
    void persist_pool(const PoolEndpoint& pool, DoneCallback done = {});
    void apply_health(const std::string& name, const HealthReport& report);
    void health_tick();
    void schedule_health_tick();
};

} // namespace warden::balancer
