#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "analytics_config.hpp"
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

enum class Severity {
    HIGH,
    MEDIUM,
    LOW
};

enum class FindingKind {
    OVERROUND,
    UNDERROUND,
    PARITY_BREAK,
    TERM_STRUCTURE,
    WIDE_SPREAD,
    THIN_LIQUIDITY,
    STALE_BOOK
};

struct ConsistencyFinding {
    Severity severity;
    FindingKind kind;
    std::string title;
    std::string detail;
    std::vector<types::MarketId> market_ids;

    ConsistencyFinding(Severity s, FindingKind k, std::string t, std::string d,
                       std::vector<types::MarketId> ids)
        : severity(s), kind(k), title(std::move(t)), detail(std::move(d)), market_ids(std::move(ids)) {}
};

struct SkippedMarket {
    types::MarketId market_id;
    Error error;

    SkippedMarket(types::MarketId id, Error e) : market_id(std::move(id)), error(std::move(e)) {}
};

struct ConsistencyReport {
    std::vector<ConsistencyFinding> findings;   // Truncated to max_findings, detection order
    size_t total_detected;
    std::vector<SkippedMarket> skipped;

    ConsistencyReport() : total_detected(0) {}
};

// Logical checks across a cluster of related markets.
// Detection order: exclusive-group sum, YES/NO parity, term structure, then per-market
// spread / liquidity / staleness.
class ConsistencyScanner {
public:
    explicit ConsistencyScanner(const ConsistencyConfig& config = ConsistencyConfig());

    ConsistencyReport scan(const std::vector<types::MarketInfo>& cluster) const;

    const ConsistencyConfig& config() const { return config_; }

private:
    ConsistencyConfig config_;

    void check_exclusive_sum(const std::vector<const types::MarketInfo*>& markets,
                             std::vector<ConsistencyFinding>& out) const;
    void check_parity(const std::vector<const types::MarketInfo*>& markets,
                      std::vector<ConsistencyFinding>& out) const;
    void check_term_structure(const std::vector<const types::MarketInfo*>& markets,
                              std::vector<ConsistencyFinding>& out) const;
    void check_market_quality(const std::vector<const types::MarketInfo*>& markets,
                              std::vector<ConsistencyFinding>& out) const;
};

std::string to_string(Severity severity);
std::string to_string(FindingKind kind);

} // namespace analytics
} // namespace pmx
