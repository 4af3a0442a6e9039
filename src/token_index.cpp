#include "arbscan/token_index.hpp"
#include "arbscan/pool_feed.hpp"

#include <stdexcept>

namespace arbscan {

TokenIndex TokenIndex::from_pools(const std::vector<PoolInfo>& pools) {
    TokenIndex index;
    for (const auto& pool : pools) {
        index.get_or_assign(pool.token0);
        index.get_or_assign(pool.token1);
    }
    return index;
}

TokenId TokenIndex::get_or_assign(const Address& token) {
    auto it = ids_.find(token);
    if (it != ids_.end()) {
        return it->second;
    }

    TokenId id = static_cast<TokenId>(addresses_.size());
    ids_.emplace(token, id);
    addresses_.push_back(token);
    return id;
}

std::optional<TokenId> TokenIndex::find(const Address& token) const {
    auto it = ids_.find(token);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

const Address& TokenIndex::resolve(TokenId id) const {
    if (id >= addresses_.size()) {
        throw std::out_of_range("token id " + std::to_string(id) + " was never assigned");
    }
    return addresses_[id];
}

} // namespace arbscan
