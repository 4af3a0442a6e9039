// =============================================================================
// route_cache.cpp - Parallel bounded cycle enumeration
// =============================================================================

#include "arbscan/route_cache.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace arbscan {

namespace {

struct PoolEdge {
    Address pool;
    PoolType type;
};

inline uint64_t pair_key(TokenId a, TokenId b) {
    return (static_cast<uint64_t>(a) << 32) | b;
}

// Pool lookup keyed by ordered (a, b); both directions are stored
struct PoolGraph {
    std::unordered_map<uint64_t, std::vector<PoolEdge>> pools_by_pair;
    std::vector<std::vector<TokenId>> neighbors;
    std::vector<bool> tradable;

    const std::vector<PoolEdge>* pools_between(TokenId a, TokenId b) const {
        auto it = pools_by_pair.find(pair_key(a, b));
        return it != pools_by_pair.end() ? &it->second : nullptr;
    }
};

PoolGraph build_graph(const TokenIndex& index, const std::vector<PoolInfo>& pools,
                      const TokenTaxTable& taxes) {
    PoolGraph graph;
    graph.neighbors.resize(index.size());
    graph.tradable.resize(index.size());

    for (TokenId id = 0; id < index.size(); ++id) {
        graph.tradable[id] = taxes.simulation_ok(index.resolve(id));
    }

    for (const auto& pool : pools) {
        auto id0 = index.find(pool.token0);
        auto id1 = index.find(pool.token1);
        if (!id0 || !id1) {
            throw std::logic_error("pool " + to_hex(pool.address) + " references an unindexed token");
        }

        auto& forward = graph.pools_by_pair[pair_key(*id0, *id1)];
        if (forward.empty()) {
            graph.neighbors[*id0].push_back(*id1);
            graph.neighbors[*id1].push_back(*id0);
        }
        forward.push_back({pool.address, pool.type});
        graph.pools_by_pair[pair_key(*id1, *id0)].push_back({pool.address, pool.type});
    }
    return graph;
}

// Partial path on the DFS worklist
struct Frame {
    RoutePath path;
};

bool contains_pool(const RoutePath& path, const Address& pool) {
    return std::find(path.pools.begin(), path.pools.end(), pool) != path.pools.end();
}

bool contains_token(const RoutePath& path, TokenId token) {
    return std::find(path.hops.begin(), path.hops.end(), token) != path.hops.end();
}

// Every cycle b -> ... -> b with min_hops..max_hops hops
std::vector<RoutePath> enumerate_cycles(const PoolGraph& graph, TokenId base,
                                        size_t min_hops, size_t max_hops) {
    std::unordered_set<RoutePath, RoutePathHash> unique;
    std::vector<RoutePath> cycles;

    std::vector<Frame> stack;
    Frame root;
    root.path.hops.push_back(base);
    stack.push_back(std::move(root));

    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();

        TokenId current = frame.path.hops.back();
        size_t depth = frame.path.pools.size();

        for (TokenId next : graph.neighbors[current]) {
            const auto* edges = graph.pools_between(current, next);
            if (edges == nullptr) continue;

            if (next == base) {
                if (depth + 1 < min_hops || depth == 0) continue;
                for (const auto& edge : *edges) {
                    if (contains_pool(frame.path, edge.pool)) continue;
                    RoutePath cycle = frame.path;
                    cycle.hops.push_back(base);
                    cycle.pools.push_back(edge.pool);
                    cycle.pool_types.push_back(edge.type);
                    if (unique.insert(cycle).second) {
                        cycles.push_back(std::move(cycle));
                    }
                }
                continue;
            }

            // One more hop is always needed to close the cycle
            if (depth + 2 > max_hops) continue;
            if (!graph.tradable[next] || contains_token(frame.path, next)) continue;

            for (const auto& edge : *edges) {
                if (contains_pool(frame.path, edge.pool)) continue;
                Frame child;
                child.path = frame.path;
                child.path.hops.push_back(next);
                child.path.pools.push_back(edge.pool);
                child.path.pool_types.push_back(edge.type);
                stack.push_back(std::move(child));
            }
        }
    }
    return cycles;
}

// Lock-striped map used while workers merge their results
class ShardedRouteMap {
public:
    explicit ShardedRouteMap(size_t shards) : shards_(shards) {}

    void insert(TokenId token, const RoutePath& route) {
        Shard& shard = shards_[token % shards_.size()];
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.routes[token].push_back(route);
    }

    std::unordered_map<TokenId, std::vector<RoutePath>> drain() {
        std::unordered_map<TokenId, std::vector<RoutePath>> out;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto& [token, routes] : shard.routes) {
                out.emplace(token, std::move(routes));
            }
            shard.routes.clear();
        }
        return out;
    }

private:
    struct Shard {
        std::mutex mutex;
        std::unordered_map<TokenId, std::vector<RoutePath>> routes;
    };
    std::vector<Shard> shards_;
};

} // anonymous namespace

RouteCache RouteCache::build(const TokenIndex& index,
                             const std::vector<PoolInfo>& pools,
                             const std::vector<TokenId>& base_tokens,
                             const TokenTaxTable& taxes,
                             const RouteConfig& config) {
    if (config.min_hops < 2 || config.max_hops < config.min_hops) {
        throw std::invalid_argument("route hop bounds must satisfy 2 <= min_hops <= max_hops");
    }

    auto start = std::chrono::steady_clock::now();
    PoolGraph graph = build_graph(index, pools, taxes);

    size_t workers = config.workers != 0 ? config.workers
                                         : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, std::max<size_t>(1, base_tokens.size()));

    ShardedRouteMap shared(64);
    std::vector<std::future<std::map<size_t, size_t>>> tasks;
    tasks.reserve(workers);

    // Worker w handles base tokens w, w + workers, ...
    for (size_t w = 0; w < workers; ++w) {
        tasks.push_back(std::async(std::launch::async, [&, w]() {
            std::map<size_t, size_t> by_hops;
            for (size_t i = w; i < base_tokens.size(); i += workers) {
                TokenId base = base_tokens[i];
                if (base >= index.size()) {
                    throw std::logic_error("base token id " + std::to_string(base) + " is not indexed");
                }
                for (auto& cycle : enumerate_cycles(graph, base, config.min_hops, config.max_hops)) {
                    validate_cycle(cycle);
                    by_hops[cycle.hop_count()]++;

                    // Intermediate tokens only; each is unique within the cycle
                    for (size_t h = 1; h + 1 < cycle.hops.size(); ++h) {
                        shared.insert(cycle.hops[h], cycle);
                    }
                }
            }
            return by_hops;
        }));
    }

    RouteCache cache;
    for (auto& task : tasks) {
        for (const auto& [hops, count] : task.get()) {
            cache.stats_.routes_by_hops[hops] += count;
            cache.stats_.unique_routes += count;
        }
    }

    cache.by_token_ = shared.drain();
    cache.stats_.base_tokens = base_tokens.size();
    cache.stats_.indexed_tokens = cache.by_token_.size();
    cache.stats_.excluded_tokens = static_cast<size_t>(
        std::count(graph.tradable.begin(), graph.tradable.end(), false));
    cache.stats_.build_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    spdlog::info("Route cache built: {} routes over {} tokens from {} base tokens in {} ms",
                 cache.stats_.unique_routes, cache.stats_.indexed_tokens,
                 cache.stats_.base_tokens, cache.stats_.build_ms);
    return cache;
}

const std::vector<RoutePath>& RouteCache::routes_for(TokenId token) const {
    static const std::vector<RoutePath> empty;
    auto it = by_token_.find(token);
    return it != by_token_.end() ? it->second : empty;
}

std::vector<TokenId> resolve_base_tokens(const TokenIndex& index,
                                         const std::vector<BaseToken>& base_tokens) {
    std::vector<TokenId> ids;
    for (const auto& token : base_tokens) {
        if (auto id = index.find(token.address)) {
            ids.push_back(*id);
        } else {
            spdlog::debug("Base token {} ({}) has no pools", token.symbol, to_hex(token.address));
        }
    }
    return ids;
}

std::unordered_map<Address, BasePoolMap, AddressHash>
build_token_to_base_pools(const std::vector<PoolInfo>& pools,
                          const std::vector<Address>& base_tokens) {
    std::unordered_map<Address, BasePoolMap, AddressHash> map;
    for (const auto& pool : pools) {
        for (const auto& base : base_tokens) {
            if (pool.token0 == base) {
                map[pool.token1][base].push_back(pool.address);
            } else if (pool.token1 == base) {
                map[pool.token0][base].push_back(pool.address);
            }
        }
    }
    return map;
}

} // namespace arbscan
