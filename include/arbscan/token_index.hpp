#ifndef ARBSCAN_TOKEN_INDEX_HPP
#define ARBSCAN_TOKEN_INDEX_HPP

#include <optional>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace arbscan {

struct PoolInfo;

// =============================================================================
// TokenIndex - dense TokenId <-> Address bijection
// =============================================================================
//
// Populated once during start-up, then shared const. Ids are assigned in
// first-seen order starting at 0 and are never reused.

class TokenIndex {
public:
    TokenIndex() = default;

    // Scan pools in order, assigning token0 before token1
    static TokenIndex from_pools(const std::vector<PoolInfo>& pools);

    // Idempotent
    TokenId get_or_assign(const Address& token);

    std::optional<TokenId> find(const Address& token) const;

    // Throws std::out_of_range for an id that was never assigned
    const Address& resolve(TokenId id) const;

    bool contains(const Address& token) const { return ids_.count(token) != 0; }
    size_t size() const { return addresses_.size(); }

private:
    std::unordered_map<Address, TokenId, AddressHash> ids_;
    std::vector<Address> addresses_;
};

} // namespace arbscan

#endif // ARBSCAN_TOKEN_INDEX_HPP
