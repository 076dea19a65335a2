/**
 * Time helpers shared by the session, balancer and persistence layers.
 *
 * Components that make time-based decisions take a Clock so tests can
 * drive time by hand.
 */
#pragma once
#include <functional>
#include <optional>
#include <string>

namespace warden::util {

// Returns seconds; the epoch is up to the clock
using Clock = std::function<double()>;

// Seconds on a monotonic clock (TTLs, breaker timeouts)
double monotonic_seconds();

// Seconds since the Unix epoch
double wall_seconds();

// "2024-05-01T12:30:45.123456" (UTC, no zone suffix)
std::string iso_timestamp(double epoch_seconds);
std::string iso_now();

// Inverse of iso_timestamp; also accepts a trailing 'Z' and no fraction
std::optional<double> parse_iso_timestamp(const std::string& text);

} // namespace warden::util
