#ifndef ARBSCAN_TAX_HPP
#define ARBSCAN_TAX_HPP

#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace arbscan {

// =============================================================================
// Token Tax Info
// =============================================================================

struct TokenTaxInfo {
    double buy_tax = 0.0;        // percent, applied when withdrawn from a pool
    double sell_tax = 0.0;       // percent, applied when deposited into a pool
    double transfer_tax = 0.0;   // percent
    bool simulation_success = true;
};

// Parts-per-million kept after a percentage tax; 0 when tax >= 100%
uint32_t keep_ppm(double tax_percent) noexcept;

// =============================================================================
// TokenTaxTable - read-only after load
// =============================================================================

class TokenTaxTable {
public:
    TokenTaxTable() = default;

    // One JSON object per line:
    //   {"token": "0x..", "buyTax": 0, "sellTax": 0, "transferTax": 0, "simulationSuccess": true}
    // Malformed lines are skipped. Throws std::runtime_error if the file cannot be opened.
    static TokenTaxTable load_jsonl(const std::string& path);
    static TokenTaxTable parse_jsonl(std::istream& in);

    void insert(const Address& token, const TokenTaxInfo& info);

    std::optional<TokenTaxInfo> get(const Address& token) const;

    // Tokens without an entry are treated as tradable
    bool simulation_ok(const Address& token) const;

    size_t size() const { return taxes_.size(); }
    size_t skipped_lines() const { return skipped_; }

private:
    std::unordered_map<Address, TokenTaxInfo, AddressHash> taxes_;
    size_t skipped_ = 0;
};

} // namespace arbscan

#endif // ARBSCAN_TAX_HPP
