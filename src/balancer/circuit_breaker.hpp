/**
 * Per-pool circuit breaker
 *
 * closed: traffic flows; failures accumulate and a success decays the
 * count by one. open: traffic is refused until recovery_timeout has passed
 * since the last failure, then the breaker goes half-open. half-open:
 * half_open_max_calls successes close it, any failure re-opens it.
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "util/clock.hpp"

namespace warden::balancer {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default: return "unknown";
    }
}

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    double recovery_timeout = 30.0;   // seconds
    int half_open_max_calls = 3;
};

class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerConfig config = {},
                            util::Clock clock = util::monotonic_seconds);

    void record_success();
    void record_failure();

    // May move open -> half-open
    bool can_execute();

    CircuitState state() const { return state_; }
    int failure_count() const { return failure_count_; }
    int success_count() const { return success_count_; }
    double last_failure_time() const { return last_failure_time_; }
    const CircuitBreakerConfig& config() const { return config_; }

    nlohmann::json to_json() const;

private:
    CircuitBreakerConfig config_;
    util::Clock clock_;
    CircuitState state_ = CircuitState::CLOSED;
    int failure_count_ = 0;
    int success_count_ = 0;
    double last_failure_time_ = 0.0;
};

} // namespace warden::balancer
