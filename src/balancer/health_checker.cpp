#include "balancer/health_checker.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace warden::balancer {

using json = nlohmann::json;

HttpHealthChecker::HttpHealthChecker(kernel::Reactor& reactor)
    : client_(reactor) {}

void HttpHealthChecker::check(const PoolEndpoint& pool, double timeout_seconds, HealthCallback cb) {
    std::string url = pool.url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    client_.get(url + "/health", timeout_seconds, [cb = std::move(cb)](net::HttpResponse response) {
        cb(interpret(response));
    });
}

HealthReport HttpHealthChecker::interpret(const net::HttpResponse& response) {
    HealthReport report;
    report.response_time_ms = response.elapsed_ms;

    if (response.timed_out) {
        report.outcome = HealthReport::Outcome::TIMEOUT;
        report.error = response.error;
        return report;
    }
    if (!response.ok) {
        report.outcome = HealthReport::Outcome::TRANSPORT_ERROR;
        report.error = response.error;
        return report;
    }

    report.http_status = response.status;
    if (response.status != 200) {
        report.outcome = HealthReport::Outcome::BAD_STATUS;
        report.error = "health endpoint returned " + std::to_string(response.status);
        return report;
    }

    try {
        json payload = json::parse(response.body);
        if (!payload.is_object()) {
            report.outcome = HealthReport::Outcome::TRANSPORT_ERROR;
            report.error = "invalid health payload: not an object";
            return report;
        }
        report.queue_depth = payload.value("queue_depth", 0);
        report.cpu_percent = payload.value("cpu_percent", 0.0);
        report.memory_percent = payload.value("memory_percent", 0.0);
        report.outcome = HealthReport::Outcome::OK;
    } catch (const json::exception& e) {
        report.outcome = HealthReport::Outcome::TRANSPORT_ERROR;
        report.error = std::string("invalid health payload: ") + e.what();
    }
    return report;
}

} // namespace warden::balancer
