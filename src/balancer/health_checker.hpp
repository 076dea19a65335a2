/**
 * Pool health probes
 *
 * A probe is GET {pool.url}/health answered by
 * {"queue_depth", "cpu_percent", "memory_percent"} with HTTP 200.
 */
#pragma once
#include <functional>
#include <string>
#include "balancer/pool_endpoint.hpp"
#include "kernel/reactor.hpp"
#include "net/http_client.hpp"

namespace warden::balancer {

struct HealthReport {
    enum class Outcome {
        OK,                 // 200 with a readable payload
        BAD_STATUS,
        TIMEOUT,
        TRANSPORT_ERROR
    };

    Outcome outcome = Outcome::TRANSPORT_ERROR;
    int http_status = 0;
    double response_time_ms = 0.0;
    int queue_depth = 0;
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    std::string error;
};

using HealthCallback = std::function<void(HealthReport)>;

class HealthChecker {
public:
    virtual ~HealthChecker() = default;

    // cb runs once on the reactor thread
    virtual void check(const PoolEndpoint& pool, double timeout_seconds, HealthCallback cb) = 0;
};

class HttpHealthChecker : public HealthChecker {
public:
    explicit HttpHealthChecker(kernel::Reactor& reactor);

    void check(const PoolEndpoint& pool, double timeout_seconds, HealthCallback cb) override;

    // Maps an HTTP outcome to a report; exposed for tests
    static HealthReport interpret(const net::HttpResponse& response);

private:
    net::HttpClient client_;
};

} // namespace warden::balancer
