#include "balancer/selection.hpp"
#include <algorithm>
#include <tuple>
#include <utility>

namespace warden::balancer {

double pool_score(const PoolEndpoint& pool, const SelectionConfig& config) {
    double available_capacity = 1.0 - pool.utilization();

    double health_factor = 1.0;
    if (pool.status == PoolStatus::DEGRADED) {
        health_factor = config.degraded_health_factor;
    }

    double response_factor = 1.0;
    if (pool.response_time_ms > 0) {
        response_factor = 1000.0 / (pool.response_time_ms + 1000.0);
    }

    return available_capacity * pool.weight * health_factor * response_factor;
}

void rank_pools(std::vector<PoolEndpoint*>& pools,
                const std::optional<std::string>& preferred_region,
                const SelectionConfig& config) {
    if (preferred_region && config.geo_routing) {
        const std::string& region = *preferred_region;
        std::stable_sort(pools.begin(), pools.end(), [&region](const PoolEndpoint* a, const PoolEndpoint* b) {
            return std::make_tuple(a->region == region ? 0 : 1, a->priority, a->utilization()) <
                   std::make_tuple(b->region == region ? 0 : 1, b->priority, b->utilization());
        });
    } else {
        std::stable_sort(pools.begin(), pools.end(), [](const PoolEndpoint* a, const PoolEndpoint* b) {
            return std::make_tuple(a->priority, a->utilization()) <
                   std::make_tuple(b->priority, b->utilization());
        });
    }
}

PoolEndpoint* choose_weighted(const std::vector<PoolEndpoint*>& pools,
                              const SelectionConfig& config, std::mt19937& rng) {
    if (pools.empty()) {
        return nullptr;
    }

    std::vector<std::pair<PoolEndpoint*, double>> scored;
    scored.reserve(pools.size());
    for (PoolEndpoint* pool : pools) {
        scored.emplace_back(pool, pool_score(*pool, config));
    }
    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    size_t k = std::min(std::max<size_t>(config.top_k, 1), scored.size());
    scored.resize(k);

    double total = 0.0;
    for (const auto& [pool, score] : scored) {
        total += score;
    }

    if (total <= 0.0) {
        std::uniform_int_distribution<size_t> pick(0, k - 1);
        return scored[pick(rng)].first;
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double r = dist(rng);
    double cumulative = 0.0;
    for (const auto& [pool, score] : scored) {
        cumulative += score;
        if (r <= cumulative) {
            return pool;
        }
    }
    return scored.back().first;
}

} // namespace warden::balancer
