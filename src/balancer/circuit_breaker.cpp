#include "balancer/circuit_breaker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace warden::balancer {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, util::Clock clock)
    : config_(config)
    , clock_(std::move(clock)) {}

void CircuitBreaker::record_success() {
    if (state_ == CircuitState::HALF_OPEN) {
        success_count_++;
        if (success_count_ >= config_.half_open_max_calls) {
            state_ = CircuitState::CLOSED;
            failure_count_ = 0;
            success_count_ = 0;
            spdlog::info("Circuit breaker closed, pool recovered");
        }
    } else {
        failure_count_ = std::max(0, failure_count_ - 1);
    }
}

void CircuitBreaker::record_failure() {
    failure_count_++;
    last_failure_time_ = clock_();

    if (state_ == CircuitState::HALF_OPEN) {
        state_ = CircuitState::OPEN;
        spdlog::warn("Circuit breaker re-opened, pool still failing");
    } else if (state_ == CircuitState::CLOSED && failure_count_ >= config_.failure_threshold) {
        state_ = CircuitState::OPEN;
        spdlog::warn("Circuit breaker opened after {} failures", failure_count_);
    }
}

bool CircuitBreaker::can_execute() {
    switch (state_) {
        case CircuitState::CLOSED:
            return true;
        case CircuitState::OPEN:
            if (clock_() - last_failure_time_ >= config_.recovery_timeout) {
                state_ = CircuitState::HALF_OPEN;
                success_count_ = 0;
                spdlog::info("Circuit breaker half-open, probing pool");
                return true;
            }
            return false;
        case CircuitState::HALF_OPEN:
            return true;
    }
    return false;
}

nlohmann::json CircuitBreaker::to_json() const {
    return {
        {"state", circuit_state_to_string(state_)},
        {"failure_count", failure_count_},
        {"success_count", success_count_},
        {"last_failure_time", last_failure_time_},
        {"failure_threshold", config_.failure_threshold},
        {"recovery_timeout", config_.recovery_timeout},
        {"half_open_max_calls", config_.half_open_max_calls}
    };
}

} // namespace warden::balancer
