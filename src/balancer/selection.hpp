/**
 * Candidate filtering, ranking and weighted pool choice
 */
#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "balancer/pool_endpoint.hpp"

namespace warden::balancer {

struct SelectionConfig {
    bool geo_routing = false;
    size_t top_k = 3;
    int max_queue_depth = 50;           // pools above this are skipped
    double degraded_health_factor = 0.7;
};

// available_capacity * weight * health_factor * response_factor
double pool_score(const PoolEndpoint& pool, const SelectionConfig& config);

// Sort candidates in place: region match first (geo routing with a
// preferred region), then priority, then utilization
void rank_pools(std::vector<PoolEndpoint*>& pools,
                const std::optional<std::string>& preferred_region,
                const SelectionConfig& config);

// Weighted-random pick among the top_k pools by score. A zero total score
// picks uniformly. nullptr when pools is empty.
PoolEndpoint* choose_weighted(const std::vector<PoolEndpoint*>& pools,
                              const SelectionConfig& config, std::mt19937& rng);

} // namespace warden::balancer
