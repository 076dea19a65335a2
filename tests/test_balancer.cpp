#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "balancer/circuit_breaker.hpp"
#include "balancer/health_checker.hpp"
#include "balancer/load_balancer.hpp"
#include "balancer/pool_endpoint.hpp"
#include "balancer/selection.hpp"
#include "kernel/reactor.hpp"
#include "loopback_server.hpp"
#include "store/memory_store.hpp"

using namespace warden;
using namespace warden::balancer;
using json = nlohmann::json;

namespace {

PoolEndpoint make_pool(const std::string& name, const std::string& region = "us-east",
                       int max_sessions = 100) {
    PoolEndpoint pool;
    pool.name = name;
    pool.region = region;
    pool.url = "http://" + name + ".internal:8080";
    pool.max_sessions = max_sessions;
    return pool;
}

// Replies from a per-pool script; pools without one report OK
class FakeHealthChecker : public HealthChecker {
public:
    explicit FakeHealthChecker(kernel::Reactor& reactor) : reactor_(reactor) {}

    void check(const PoolEndpoint& pool, double, HealthCallback cb) override {
        checks[pool.name]++;
        HealthReport report;
        report.outcome = HealthReport::Outcome::OK;
        report.http_status = 200;
        report.response_time_ms = 20.0;
        auto it = reports.find(pool.name);
        if (it != reports.end()) {
            report = it->second;
        }
        reactor_.post([cb = std::move(cb), report]() { cb(report); });
    }

    std::map<std::string, HealthReport> reports;
    std::map<std::string, int> checks;

private:
    kernel::Reactor& reactor_;
};

HealthReport outcome(HealthReport::Outcome o) {
    HealthReport report;
    report.outcome = o;
    report.http_status = o == HealthReport::Outcome::BAD_STATUS ? 503 : 0;
    return report;
}

} // namespace

// ============================================================================
// Circuit breaker
// ============================================================================

class CircuitBreakerTest : public ::testing::Test {
protected:
    CircuitBreaker make(int threshold = 3, double recovery = 30.0, int half_open = 2) {
        CircuitBreakerConfig config;
        config.failure_threshold = threshold;
        config.recovery_timeout = recovery;
        config.half_open_max_calls = half_open;
        return CircuitBreaker(config, [this]() { return now; });
    }

    double now = 500.0;
};

TEST_F(CircuitBreakerTest, OpensAtThreshold) {
    CircuitBreaker breaker = make();
    breaker.record_failure();
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    EXPECT_TRUE(breaker.can_execute());

    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
    EXPECT_FALSE(breaker.can_execute());
    EXPECT_EQ(breaker.last_failure_time(), 500.0);
}

TEST_F(CircuitBreakerTest, SuccessDecaysFailures) {
    CircuitBreaker breaker = make();
    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    EXPECT_EQ(breaker.failure_count(), 1);
    breaker.record_success();
    breaker.record_success();
    EXPECT_EQ(breaker.failure_count(), 0);

    // Two more failures stay under the threshold after the decay
    breaker.record_failure();
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, HalfOpenAfterRecoveryThenCloses) {
    CircuitBreaker breaker = make();
    for (int i = 0; i < 3; i++) breaker.record_failure();

    now += 29.0;
    EXPECT_FALSE(breaker.can_execute());
    now += 1.0;
    EXPECT_TRUE(breaker.can_execute());
    EXPECT_EQ(breaker.state(), CircuitState::HALF_OPEN);

    breaker.record_success();
    EXPECT_EQ(breaker.state(), CircuitState::HALF_OPEN);
    breaker.record_success();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker.failure_count(), 0);
    EXPECT_EQ(breaker.success_count(), 0);
}

TEST_F(CircuitBreakerTest, HalfOpenFailureReopens) {
    CircuitBreaker breaker = make();
    for (int i = 0; i < 3; i++) breaker.record_failure();
    now += 31.0;
    ASSERT_TRUE(breaker.can_execute());

    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
    EXPECT_FALSE(breaker.can_execute());

    json j = breaker.to_json();
    EXPECT_EQ(j["state"], "open");
    EXPECT_EQ(j["failure_threshold"], 3);
}

// ============================================================================
// Selection
// ============================================================================

TEST(SelectionTest, ScoreCombinesFactors) {
    SelectionConfig config;
    PoolEndpoint pool = make_pool("a");
    pool.current_sessions = 50;
    EXPECT_DOUBLE_EQ(pool_score(pool, config), 50.0);

    pool.status = PoolStatus::DEGRADED;
    EXPECT_DOUBLE_EQ(pool_score(pool, config), 35.0);

    pool.status = PoolStatus::HEALTHY;
    pool.response_time_ms = 1000.0;
    EXPECT_DOUBLE_EQ(pool_score(pool, config), 25.0);

    pool.max_sessions = 0;
    EXPECT_DOUBLE_EQ(pool_score(pool, config), 0.0);
}

TEST(SelectionTest, RankPrefersRegionThenPriorityThenUtilization) {
    PoolEndpoint east = make_pool("east", "us-east");
    PoolEndpoint west = make_pool("west", "us-west");
    PoolEndpoint west_busy = make_pool("west-busy", "us-west");
    west_busy.current_sessions = 80;
    PoolEndpoint backup = make_pool("backup", "us-west");
    backup.priority = 2;

    std::vector<PoolEndpoint*> pools = {&west_busy, &backup, &east, &west};

    SelectionConfig geo;
    geo.geo_routing = true;
    rank_pools(pools, std::string("us-west"), geo);
    EXPECT_EQ(pools[0]->name, "west");
    EXPECT_EQ(pools[1]->name, "west-busy");
    EXPECT_EQ(pools[2]->name, "backup");
    EXPECT_EQ(pools[3]->name, "east");

    // The preferred region is ignored without geo routing
    SelectionConfig flat;
    rank_pools(pools, std::string("us-west"), flat);
    EXPECT_EQ(pools[0]->name, "west");
    EXPECT_EQ(pools[1]->name, "east");
    EXPECT_EQ(pools[3]->name, "backup");
}

TEST(SelectionTest, ChooseWeightedIsSeededAndTopK) {
    PoolEndpoint a = make_pool("a");
    PoolEndpoint b = make_pool("b");
    PoolEndpoint c = make_pool("c");
    c.current_sessions = 99;
    std::vector<PoolEndpoint*> pools = {&a, &b, &c};

    SelectionConfig config;
    config.top_k = 2;

    std::mt19937 rng1(42);
    std::mt19937 rng2(42);
    std::map<std::string, int> picks;
    for (int i = 0; i < 200; i++) {
        PoolEndpoint* first = choose_weighted(pools, config, rng1);
        PoolEndpoint* second = choose_weighted(pools, config, rng2);
        ASSERT_NE(first, nullptr);
        EXPECT_EQ(first, second);
        picks[first->name]++;
    }
    EXPECT_EQ(picks.count("c"), 0u);
    EXPECT_GT(picks["a"], 0);
    EXPECT_GT(picks["b"], 0);
}

TEST(SelectionTest, ZeroScoresPickUniformly) {
    PoolEndpoint a = make_pool("a", "r", 10);
    PoolEndpoint b = make_pool("b", "r", 10);
    a.current_sessions = 10;
    b.current_sessions = 10;
    std::vector<PoolEndpoint*> pools = {&a, &b};

    SelectionConfig config;
    std::mt19937 rng(7);
    std::map<std::string, int> picks;
    for (int i = 0; i < 100; i++) {
        picks[choose_weighted(pools, config, rng)->name]++;
    }
    EXPECT_GT(picks["a"], 0);
    EXPECT_GT(picks["b"], 0);

    std::vector<PoolEndpoint*> none;
    EXPECT_EQ(choose_weighted(none, config, rng), nullptr);
}

// ============================================================================
// Records
// ============================================================================

TEST(PoolRecordTest, PoolJsonRoundTripAndSchemaGuard) {
    PoolEndpoint pool = make_pool("a", "eu-west", 40);
    pool.status = PoolStatus::DEGRADED;
    pool.queue_depth = 7;

    json j = pool.to_json();
    EXPECT_EQ(j["schema_version"], POOL_SCHEMA_VERSION);
    EXPECT_EQ(j["status"], "degraded");

    auto back = PoolEndpoint::from_json(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->region, "eu-west");
    EXPECT_EQ(back->max_sessions, 40);
    EXPECT_EQ(back->status, PoolStatus::DEGRADED);
    EXPECT_EQ(back->queue_depth, 7);

    j["schema_version"] = POOL_SCHEMA_VERSION + 1;
    EXPECT_FALSE(PoolEndpoint::from_json(j).has_value());
    EXPECT_FALSE(PoolEndpoint::from_json(json{{"region", "x"}}).has_value());
    EXPECT_FALSE(PoolEndpoint::from_json(json::array()).has_value());
}

TEST(PoolRecordTest, AffinityExpiry) {
    SessionAffinity affinity;
    affinity.session_id = "s1";
    affinity.pool_name = "a";
    affinity.created_at = 100.0;
    affinity.ttl = 60.0;
    EXPECT_FALSE(affinity.is_expired(160.0));
    EXPECT_TRUE(affinity.is_expired(160.5));

    auto back = SessionAffinity::from_json(affinity.to_json());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->pool_name, "a");
    EXPECT_EQ(back->ttl, 60.0);

    json newer = affinity.to_json();
    newer["schema_version"] = 99;
    EXPECT_FALSE(SessionAffinity::from_json(newer).has_value());
}

// ============================================================================
// Health interpretation
// ============================================================================

TEST(HealthInterpretTest, MapsResponses) {
    net::HttpResponse timeout;
    timeout.timed_out = true;
    timeout.error = "request timed out";
    EXPECT_EQ(HttpHealthChecker::interpret(timeout).outcome, HealthReport::Outcome::TIMEOUT);

    net::HttpResponse refused;
    refused.error = "connection refused";
    EXPECT_EQ(HttpHealthChecker::interpret(refused).outcome, HealthReport::Outcome::TRANSPORT_ERROR);

    net::HttpResponse unavailable;
    unavailable.ok = true;
    unavailable.status = 503;
    HealthReport bad = HttpHealthChecker::interpret(unavailable);
    EXPECT_EQ(bad.outcome, HealthReport::Outcome::BAD_STATUS);
    EXPECT_EQ(bad.http_status, 503);

    net::HttpResponse healthy;
    healthy.ok = true;
    healthy.status = 200;
    healthy.elapsed_ms = 12.5;
    healthy.body = R"({"queue_depth": 4, "cpu_percent": 35.5, "memory_percent": 60})";
    HealthReport ok = HttpHealthChecker::interpret(healthy);
    EXPECT_EQ(ok.outcome, HealthReport::Outcome::OK);
    EXPECT_EQ(ok.queue_depth, 4);
    EXPECT_DOUBLE_EQ(ok.cpu_percent, 35.5);
    EXPECT_DOUBLE_EQ(ok.memory_percent, 60.0);
    EXPECT_DOUBLE_EQ(ok.response_time_ms, 12.5);

    healthy.body = "[1, 2]";
    EXPECT_EQ(HttpHealthChecker::interpret(healthy).outcome, HealthReport::Outcome::TRANSPORT_ERROR);
    healthy.body = "not json";
    EXPECT_EQ(HttpHealthChecker::interpret(healthy).outcome, HealthReport::Outcome::TRANSPORT_ERROR);
}

TEST(HttpHealthCheckerTest, ProbesHealthEndpoint) {
    kernel::Reactor reactor;
    ASSERT_TRUE(reactor.init());

    std::string captured;
    std::optional<HealthReport> report;
    {
        std::string body = R"({"queue_depth": 7, "cpu_percent": 12.5, "memory_percent": 40})";
        warden::testing::LoopbackServer server([&](int fd, const std::atomic<bool>&) {
            captured = warden::testing::LoopbackServer::read_http_request(fd);
            warden::testing::LoopbackServer::write_all(fd,
                "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nConnection: close\r\nContent-Length: " +
                std::to_string(body.size()) + "\r\n\r\n" + body);
        });

        HttpHealthChecker checker(reactor);
        PoolEndpoint pool;
        pool.name = "pool-a";
        pool.url = server.url("/");
        checker.check(pool, 2.0, [&](HealthReport r) { report = r; });
        ASSERT_TRUE(reactor.run_until([&]() { return report.has_value(); }, 3000));
    }

    EXPECT_NE(captured.find("GET /health HTTP/1.1"), std::string::npos);
    EXPECT_EQ(report->outcome, HealthReport::Outcome::OK);
    EXPECT_EQ(report->http_status, 200);
    EXPECT_EQ(report->queue_depth, 7);
    EXPECT_DOUBLE_EQ(report->cpu_percent, 12.5);
}

TEST(HttpHealthCheckerTest, UnreachablePoolIsTransportError) {
    kernel::Reactor reactor;
    ASSERT_TRUE(reactor.init());
    HttpHealthChecker checker(reactor);

    PoolEndpoint pool;
    pool.name = "gone";
    pool.url = "http://127.0.0.1:1";
    std::optional<HealthReport> report;
    checker.check(pool, 2.0, [&](HealthReport r) { report = r; });
    ASSERT_TRUE(reactor.run_until([&]() { return report.has_value(); }, 3000));
    EXPECT_EQ(report->outcome, HealthReport::Outcome::TRANSPORT_ERROR);
    EXPECT_FALSE(report->error.empty());
}

// ============================================================================
// Load balancer
// ============================================================================

class LoadBalancerTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(reactor.init()); }

    std::unique_ptr<LoadBalancer> make_balancer(LoadBalancerConfig config = {}) {
        config.seed = 1234;
        config.breaker.failure_threshold = 3;
        config.breaker.recovery_timeout = 30.0;
        config.breaker.half_open_max_calls = 1;
        return std::make_unique<LoadBalancer>(reactor, store, checker, config,
                                              [this]() { return now; });
    }

    void register_pool(LoadBalancer& lb, PoolEndpoint pool) {
        bool done = false;
        lb.register_pool(std::move(pool), [&](bool ok) {
            EXPECT_TRUE(ok);
            done = true;
        });
        ASSERT_TRUE(reactor.run_until([&]() { return done; }, 1000));
    }

    std::optional<PoolEndpoint> route(LoadBalancer& lb, const std::string& session_id,
                                      std::optional<std::string> region = std::nullopt) {
        bool done = false;
        std::optional<PoolEndpoint> result;
        lb.get_pool_for_session(session_id, region, [&](std::optional<PoolEndpoint> pool) {
            result = std::move(pool);
            done = true;
        });
        EXPECT_TRUE(reactor.run_until([&]() { return done; }, 1000));
        return result;
    }

    void health_round(LoadBalancer& lb) {
        bool done = false;
        lb.run_health_checks([&](bool) { done = true; });
        ASSERT_TRUE(reactor.run_until([&]() { return done; }, 1000));
    }

    kernel::Reactor reactor;
    store::MemoryStore store{reactor};
    FakeHealthChecker checker{reactor};
    double now = 1700000000.0;
};

TEST_F(LoadBalancerTest, RegisterPersistsAndUnregisterRemoves) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a"));
    EXPECT_EQ(lb->pool_count(), 1u);
    ASSERT_NE(lb->breaker("a"), nullptr);

    std::optional<std::string> stored;
    bool done = false;
    store.hget(POOLS_KEY, "a", [&](store::ValueReply reply) {
        stored = reply.value;
        done = true;
    });
    ASSERT_TRUE(reactor.run_until([&]() { return done; }, 1000));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(json::parse(*stored)["url"], "http://a.internal:8080");

    done = false;
    lb->unregister_pool("a", [&](bool) { done = true; });
    ASSERT_TRUE(reactor.run_until([&]() { return done; }, 1000));
    EXPECT_EQ(lb->pool_count(), 0u);
    EXPECT_EQ(lb->pool("a"), nullptr);
    EXPECT_EQ(lb->breaker("a"), nullptr);
}

TEST_F(LoadBalancerTest, AffinityReturnsSamePool) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a"));
    register_pool(*lb, make_pool("b"));

    auto first = route(*lb, "sess-1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->current_sessions, 1);
    EXPECT_TRUE(lb->has_cached_affinity("sess-1"));

    for (int i = 0; i < 5; i++) {
        auto again = route(*lb, "sess-1");
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(again->name, first->name);
    }
    // Affinity hits do not take another slot
    EXPECT_EQ(lb->pool(first->name)->current_sessions, 1);
}

TEST_F(LoadBalancerTest, AffinitySurvivesRestartThroughStore) {
    std::string chosen;
    {
        auto lb = make_balancer();
        register_pool(*lb, make_pool("a"));
        register_pool(*lb, make_pool("b"));
        auto pool = route(*lb, "sess-1");
        ASSERT_TRUE(pool.has_value());
        chosen = pool->name;
    }

    auto restarted = make_balancer();
    bool started = false;
    restarted->start([&](bool ok) {
        EXPECT_TRUE(ok);
        started = true;
    });
    ASSERT_TRUE(reactor.run_until([&]() { return started; }, 1000));
    EXPECT_EQ(restarted->pool_count(), 2u);
    EXPECT_FALSE(restarted->has_cached_affinity("sess-1"));

    auto pool = route(*restarted, "sess-1");
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ(pool->name, chosen);
    EXPECT_TRUE(restarted->has_cached_affinity("sess-1"));
    restarted->stop();
}

TEST_F(LoadBalancerTest, FullPoolIsNeverSelected) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a", "us-east", 1));

    auto first = route(*lb, "sess-1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->name, "a");

    EXPECT_FALSE(route(*lb, "sess-2").has_value());

    register_pool(*lb, make_pool("b", "us-east", 5));
    auto second = route(*lb, "sess-3");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->name, "b");
}

TEST_F(LoadBalancerTest, ExpiredAffinityIsIgnored) {
    LoadBalancerConfig config;
    config.affinity_ttl = 60.0;
    auto lb = make_balancer(config);
    register_pool(*lb, make_pool("a", "us-east", 1));
    ASSERT_TRUE(route(*lb, "sess-1").has_value());

    now += 61.0;
    // The stale binding no longer pins the full pool
    EXPECT_FALSE(route(*lb, "sess-1").has_value());
    EXPECT_FALSE(lb->has_cached_affinity("sess-1"));
}

TEST_F(LoadBalancerTest, ReleaseFreesCapacityAndAffinity) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a", "us-east", 1));
    ASSERT_TRUE(route(*lb, "sess-1").has_value());

    bool done = false;
    lb->release_session("sess-1", "a", [&](bool ok) {
        EXPECT_TRUE(ok);
        done = true;
    });
    ASSERT_TRUE(reactor.run_until([&]() { return done; }, 1000));
    EXPECT_EQ(lb->pool("a")->current_sessions, 0);
    EXPECT_FALSE(lb->has_cached_affinity("sess-1"));

    done = false;
    lb->release_session("sess-1", "a", [&](bool) { done = true; });
    ASSERT_TRUE(reactor.run_until([&]() { return done; }, 1000));
    EXPECT_EQ(lb->pool("a")->current_sessions, 0);

    EXPECT_TRUE(route(*lb, "sess-2").has_value());
}

TEST_F(LoadBalancerTest, GeoRoutingPrefersRegion) {
    LoadBalancerConfig config;
    config.geo_routing = true;
    config.top_k = 1;
    auto lb = make_balancer(config);
    register_pool(*lb, make_pool("east", "us-east"));
    register_pool(*lb, make_pool("west", "us-west"));

    auto pool = route(*lb, "sess-1", std::string("us-west"));
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ(pool->name, "west");
}

TEST_F(LoadBalancerTest, HealthResultsDriveStatusAndBreaker) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a"));
    register_pool(*lb, make_pool("b"));

    HealthReport busy;
    busy.outcome = HealthReport::Outcome::OK;
    busy.http_status = 200;
    busy.response_time_ms = 40.0;
    busy.queue_depth = 3;
    busy.cpu_percent = 95.0;
    checker.reports["a"] = busy;
    checker.reports["b"] = outcome(HealthReport::Outcome::BAD_STATUS);

    health_round(*lb);
    EXPECT_EQ(lb->pool("a")->status, PoolStatus::DEGRADED);
    EXPECT_EQ(lb->pool("a")->queue_depth, 3);
    EXPECT_DOUBLE_EQ(lb->pool("a")->response_time_ms, 40.0);
    EXPECT_EQ(lb->pool("a")->last_health_check, now);
    EXPECT_EQ(lb->pool("b")->status, PoolStatus::UNHEALTHY);
    EXPECT_EQ(lb->breaker("b")->failure_count(), 1);

    // Degraded pools still take sessions; unhealthy ones do not
    auto pool = route(*lb, "sess-1");
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ(pool->name, "a");

    checker.reports["a"] = outcome(HealthReport::Outcome::TIMEOUT);
    health_round(*lb);
    EXPECT_EQ(lb->pool("a")->status, PoolStatus::DEGRADED);
    EXPECT_DOUBLE_EQ(lb->pool("a")->response_time_ms, 5000.0);
}

TEST_F(LoadBalancerTest, OpenBreakerExcludesPoolUntilRecovery) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a"));

    checker.reports["a"] = outcome(HealthReport::Outcome::TIMEOUT);
    for (int i = 0; i < 3; i++) {
        health_round(*lb);
    }
    EXPECT_EQ(lb->breaker("a")->state(), CircuitState::OPEN);
    EXPECT_EQ(lb->pool("a")->status, PoolStatus::DEGRADED);
    EXPECT_FALSE(route(*lb, "sess-1").has_value());

    now += 31.0;
    auto pool = route(*lb, "sess-1");
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ(lb->breaker("a")->state(), CircuitState::HALF_OPEN);

    checker.reports.erase("a");
    health_round(*lb);
    EXPECT_EQ(lb->breaker("a")->state(), CircuitState::CLOSED);
    EXPECT_EQ(lb->pool("a")->status, PoolStatus::HEALTHY);
}

TEST_F(LoadBalancerTest, AffinityToUnhealthyPoolIsReassigned) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a"));
    register_pool(*lb, make_pool("b"));

    auto first = route(*lb, "sess-1");
    ASSERT_TRUE(first.has_value());
    std::string other = first->name == "a" ? "b" : "a";

    checker.reports[first->name] = outcome(HealthReport::Outcome::TRANSPORT_ERROR);
    health_round(*lb);

    auto moved = route(*lb, "sess-1");
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->name, other);
}

TEST_F(LoadBalancerTest, DeepQueueExcludesPool) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a"));

    HealthReport backlog;
    backlog.outcome = HealthReport::Outcome::OK;
    backlog.http_status = 200;
    backlog.queue_depth = 51;
    checker.reports["a"] = backlog;
    health_round(*lb);

    EXPECT_FALSE(route(*lb, "sess-1").has_value());
}

TEST_F(LoadBalancerTest, StartRunsHealthLoop) {
    LoadBalancerConfig config;
    config.health_check_interval = 0.05;
    auto lb = make_balancer(config);
    register_pool(*lb, make_pool("a"));

    lb->start();
    ASSERT_TRUE(reactor.run_until([&]() { return checker.checks["a"] >= 3; }, 2000));
    EXPECT_TRUE(lb->running());

    lb->stop();
    EXPECT_FALSE(lb->running());
    int seen = checker.checks["a"];
    reactor.run_until([]() { return false; }, 200);
    EXPECT_LE(checker.checks["a"], seen + 1);
}

TEST_F(LoadBalancerTest, PoolStats) {
    auto lb = make_balancer();
    register_pool(*lb, make_pool("a", "us-east", 10));
    register_pool(*lb, make_pool("b", "us-east", 20));
    checker.reports["b"] = outcome(HealthReport::Outcome::BAD_STATUS);
    health_round(*lb);
    ASSERT_TRUE(route(*lb, "sess-1").has_value());

    json stats = lb->get_pool_stats();
    EXPECT_EQ(stats["total_pools"], 2);
    EXPECT_EQ(stats["healthy_pools"], 1);
    EXPECT_EQ(stats["degraded_pools"], 0);
    EXPECT_EQ(stats["unhealthy_pools"], 1);
    EXPECT_EQ(stats["total_sessions"], 1);
    EXPECT_EQ(stats["total_capacity"], 30);
    EXPECT_EQ(stats["pools"]["b"]["circuit_breaker"]["failure_count"], 1);
}
