#include "consistency_scanner.hpp"
#include "utils/logger.hpp"
#include "utils/stats_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pmx {
namespace analytics {

using types::MarketInfo;
namespace format = utils::format;

namespace {

const std::string& label(const MarketInfo& market) {
    return market.title.empty() ? market.id : market.title;
}

Result<bool> check_metadata(const MarketInfo& market) {
    if (market.id.empty()) {
        return Result<bool>::error(ErrorKind::UPSTREAM_DATA_GAP, "market without id");
    }
    if (!std::isfinite(market.yes_mid) || !std::isfinite(market.no_mid)) {
        return Result<bool>::error(ErrorKind::INVALID_INPUT, "non-finite mid for " + market.id);
    }
    return Result<bool>::success(true);
}

} // namespace

ConsistencyScanner::ConsistencyScanner(const ConsistencyConfig& config)
    : config_(config) {
}

ConsistencyReport ConsistencyScanner::scan(const std::vector<MarketInfo>& cluster) const {
    ConsistencyReport report;

    std::vector<const MarketInfo*> markets;
    markets.reserve(cluster.size());
    for (const auto& market : cluster) {
        auto valid = check_metadata(market);
        if (valid.is_error()) {
            utils::Logger::warn("Skipping market {} in consistency scan: {}", market.id, valid.error().message);
            report.skipped.emplace_back(market.id, valid.error());
            continue;
        }
        markets.push_back(&market);
    }

    std::vector<ConsistencyFinding> findings;
    check_exclusive_sum(markets, findings);
    check_parity(markets, findings);
    check_term_structure(markets, findings);
    check_market_quality(markets, findings);

    report.total_detected = findings.size();
    if (findings.size() > config_.max_findings) {
        findings.erase(findings.begin() + static_cast<std::ptrdiff_t>(config_.max_findings), findings.end());
    }

    for (const auto& finding : findings) {
        utils::AnalyticsLogger::log_consistency_finding(to_string(finding.severity), finding.title, finding.detail);
    }

    report.findings = std::move(findings);
    return report;
}

void ConsistencyScanner::check_exclusive_sum(const std::vector<const MarketInfo*>& markets,
                                             std::vector<ConsistencyFinding>& out) const {
    std::vector<const MarketInfo*> exclusive;
    for (const auto* market : markets) {
        if (market->mutually_exclusive) {
            exclusive.push_back(market);
        }
    }
    if (exclusive.size() < 2) return;

    double sum = 0.0;
    for (const auto* market : exclusive) {
        sum += market->yes_mid;
    }

    if (sum > config_.overround_limit) {
        std::stable_sort(exclusive.begin(), exclusive.end(),
                         [](const MarketInfo* a, const MarketInfo* b) { return a->yes_mid > b->yes_mid; });

        const MarketInfo& first = *exclusive[0];
        const MarketInfo& second = *exclusive[1];
        out.emplace_back(Severity::HIGH, FindingKind::OVERROUND, "Overround high",
                         "Exclusive sum " + format::percent(sum) + ". Largest contributors: " +
                         label(first) + ", " + label(second) + ".",
                         std::vector<types::MarketId>{first.id, second.id});
    } else if (sum < config_.underround_limit) {
        std::vector<types::MarketId> ids;
        for (const auto* market : exclusive) {
            ids.push_back(market->id);
        }
        out.emplace_back(Severity::MEDIUM, FindingKind::UNDERROUND, "Underround suspicious",
                         "Exclusive sum " + format::percent(sum) + ". Check stale quotes.", ids);
    }
}

void ConsistencyScanner::check_parity(const std::vector<const MarketInfo*>& markets,
                                      std::vector<ConsistencyFinding>& out) const {
    for (const auto* market : markets) {
        const double parity = market->yes_mid + market->no_mid;
        if (std::fabs(parity - 1.0) > config_.parity_tolerance) {
            std::ostringstream detail;
            detail << label(*market) << ": yes+no = " << std::fixed << std::setprecision(2) << parity << ".";
            out.emplace_back(Severity::HIGH, FindingKind::PARITY_BREAK, "YES/NO parity break",
                             detail.str(), std::vector<types::MarketId>{market->id});
        }
    }
}

void ConsistencyScanner::check_term_structure(const std::vector<const MarketInfo*>& markets,
                                              std::vector<ConsistencyFinding>& out) const {
    // Groups in order of first appearance
    std::vector<std::pair<std::string, std::vector<const MarketInfo*>>> groups;
    for (const auto* market : markets) {
        if (market->term_key.empty()) continue;

        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& group) { return group.first == market->term_key; });
        if (it == groups.end()) {
            groups.emplace_back(market->term_key, std::vector<const MarketInfo*>{market});
        } else {
            it->second.push_back(market);
        }
    }

    for (auto& [term_key, group] : groups) {
        if (group.size() < 2) continue;

        std::stable_sort(group.begin(), group.end(), [](const MarketInfo* a, const MarketInfo* b) {
            return a->resolution_horizon_days < b->resolution_horizon_days;
        });

        for (size_t i = 1; i < group.size(); ++i) {
            const MarketInfo& shorter = *group[i - 1];
            const MarketInfo& longer = *group[i];
            if (shorter.yes_mid > longer.yes_mid + config_.term_structure_tolerance) {
                out.emplace_back(Severity::MEDIUM, FindingKind::TERM_STRUCTURE, "Term structure violation",
                                 label(shorter) + " (" + format::percent(shorter.yes_mid) + ") > " +
                                 label(longer) + " (" + format::percent(longer.yes_mid) + ").",
                                 std::vector<types::MarketId>{shorter.id, longer.id});
            }
        }
    }
}

void ConsistencyScanner::check_market_quality(const std::vector<const MarketInfo*>& markets,
                                              std::vector<ConsistencyFinding>& out) const {
    for (const auto* market : markets) {
        const std::vector<types::MarketId> ids{market->id};

        if (market->spread > config_.wide_spread) {
            out.emplace_back(Severity::MEDIUM, FindingKind::WIDE_SPREAD, "Wide spread",
                             label(*market) + " spread " + format::price(market->spread) + ".", ids);
        }
        if (market->liquidity < config_.thin_liquidity) {
            out.emplace_back(Severity::LOW, FindingKind::THIN_LIQUIDITY, "Thin liquidity",
                             label(*market) + " liquidity " + format::compact_usd(market->liquidity) + ".", ids);
        }
        if (market->last_update_age_minutes > config_.stale_minutes) {
            std::ostringstream detail;
            detail << label(*market) << " last update " << market->last_update_age_minutes << "m.";
            out.emplace_back(Severity::LOW, FindingKind::STALE_BOOK, "Stale book", detail.str(), ids);
        }
    }
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::HIGH: return "High";
        case Severity::MEDIUM: return "Medium";
        case Severity::LOW: return "Low";
        default: return "Low";
    }
}

std::string to_string(FindingKind kind) {
    switch (kind) {
        case FindingKind::OVERROUND: return "overround";
        case FindingKind::UNDERROUND: return "underround";
        case FindingKind::PARITY_BREAK: return "parity";
        case FindingKind::TERM_STRUCTURE: return "termStructure";
        case FindingKind::WIDE_SPREAD: return "wideSpread";
        case FindingKind::THIN_LIQUIDITY: return "thinLiquidity";
        case FindingKind::STALE_BOOK: return "staleBook";
        default: return "unknown";
    }
}

} // namespace analytics
} // namespace pmx
