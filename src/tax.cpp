#include "arbscan/tax.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace arbscan {

using json = nlohmann::json;

uint32_t keep_ppm(double tax_percent) noexcept {
    if (!(tax_percent > 0.0)) return fees::V3_DENOMINATOR;  // also catches NaN
    if (tax_percent >= 100.0) return 0;
    double keep = std::round((100.0 - tax_percent) * 10000.0);
    return static_cast<uint32_t>(keep);
}

TokenTaxTable TokenTaxTable::load_jsonl(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open token tax file: " + path);
    }
    TokenTaxTable table = parse_jsonl(file);
    spdlog::info("Loaded {} token tax entries from {} ({} lines skipped)",
                 table.size(), path, table.skipped_lines());
    return table;
}

TokenTaxTable TokenTaxTable::parse_jsonl(std::istream& in) {
    TokenTaxTable table;
    std::string line;

    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        try {
            auto record = json::parse(line);
            Address token = parse_address(record.at("token").get<std::string>());

            TokenTaxInfo info;
            info.buy_tax = record.at("buyTax").get<double>();
            info.sell_tax = record.at("sellTax").get<double>();
            info.transfer_tax = record.at("transferTax").get<double>();
            info.simulation_success = record.at("simulationSuccess").get<bool>();
            table.insert(token, info);
        } catch (const std::exception& e) {
            table.skipped_++;
            spdlog::debug("Skipping tax record: {}", e.what());
        }
    }
    return table;
}

void TokenTaxTable::insert(const Address& token, const TokenTaxInfo& info) {
    taxes_[token] = info;
}

std::optional<TokenTaxInfo> TokenTaxTable::get(const Address& token) const {
    auto it = taxes_.find(token);
    if (it == taxes_.end()) return std::nullopt;
    return it->second;
}

bool TokenTaxTable::simulation_ok(const Address& token) const {
    auto it = taxes_.find(token);
    return it == taxes_.end() || it->second.simulation_success;
}

} // namespace arbscan
