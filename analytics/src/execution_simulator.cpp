#include "execution_simulator.hpp"
#include "orderbook_features.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace pmx {
namespace analytics {

using types::BookSide;
using types::OrderBook;
using types::OrderSide;

ExecutionSimulator::ExecutionSimulator(const ExecutionConfig& config)
    : config_(config) {
}

OrderBook ExecutionSimulator::synthetic_depth(types::Price mid, types::Amount liquidity) const {
    const double tick = std::max(mid * config_.tick_ratio, config_.min_tick);
    const double base = std::max(config_.min_base_size, liquidity * config_.liquidity_size_ratio);

    OrderBook book;
    for (size_t i = 1; i <= config_.synthetic_levels; ++i) {
        const double offset = static_cast<double>(i) * tick;
        const double size = base * (1.0 + static_cast<double>(i - 1) * config_.size_growth);
        book.asks.emplace_back(std::min(config_.max_price, mid + offset), size, BookSide::ASK);
        book.bids.emplace_back(std::max(config_.min_price, mid - offset), size, BookSide::BID);
    }
    return book;
}

FillSummary ExecutionSimulator::walk_levels(const std::vector<types::OrderBookLevel>& levels,
                                            types::Quantity size) {
    FillSummary fill;
    double remaining = size;
    for (const auto& level : levels) {
        if (remaining <= 0) break;
        const double take = std::min(remaining, level.size);
        fill.cost += take * level.price;
        fill.filled += take;
        remaining -= take;
    }
    return fill;
}

Result<ExecutionEstimate> ExecutionSimulator::simulate(const StrategyLeg& leg,
                                                       const types::MarketInfo& market) const {
    if (!types::is_valid_size(leg.size) || leg.size <= 0) {
        return Result<ExecutionEstimate>::error(ErrorKind::INVALID_INPUT,
            "leg size must be positive for " + leg.market_id);
    }

    const auto& real_book = market.book_for(leg.outcome);
    const bool has_book = real_book.has_value() && !real_book->empty();
    const double metadata_mid = market.mid_for(leg.outcome);
    const bool has_metadata_mid = std::isfinite(metadata_mid) && metadata_mid > 0.0 && metadata_mid <= 1.0;

    if (!has_book && !has_metadata_mid) {
        return Result<ExecutionEstimate>::error(ErrorKind::UPSTREAM_DATA_GAP,
            "no book and no usable mid for " + market.id + " " + types::to_string(leg.outcome));
    }

    const OrderBook book = has_book
        ? OrderbookFeatureExtractor::normalize(*real_book)
        : synthetic_depth(metadata_mid, market.liquidity);
    if (book.empty() && !has_metadata_mid) {
        return Result<ExecutionEstimate>::error(ErrorKind::UPSTREAM_DATA_GAP,
            "book for " + market.id + " has no valid levels and no usable mid");
    }

    // A two-sided real book sets the reference mid; one-sided books fall back to metadata
    double mid = has_metadata_mid ? metadata_mid : 0.0;
    if (has_book) {
        if (!book.bids.empty() && !book.asks.empty()) {
            mid = (book.bids.front().price + book.asks.front().price) / 2.0;
        } else if (!has_metadata_mid) {
            mid = book.bids.empty() ? book.asks.front().price : book.bids.front().price;
        }
    }

    const auto& levels = leg.side == OrderSide::BUY ? book.asks : book.bids;
    const FillSummary fill = walk_levels(levels, leg.size);

    ExecutionEstimate estimate;
    estimate.market_id = market.id;
    estimate.outcome = leg.outcome;
    estimate.side = leg.side;
    estimate.requested = leg.size;
    estimate.filled = fill.filled;
    estimate.vwap = fill.vwap();
    estimate.mid = mid;
    estimate.slippage = fill.filled > 0 ? estimate.vwap - estimate.mid : 0.0;
    estimate.synthetic_depth = !has_book;
    estimate.shortfall = std::max(0.0, leg.size - fill.filled);
    estimate.partial_fill = estimate.shortfall > 0;

    if (estimate.partial_fill) {
        utils::AnalyticsLogger::log_execution_shortfall(market.id, types::to_string(leg.outcome),
                                                        estimate.requested, estimate.filled);
    }
    return Result<ExecutionEstimate>::success(std::move(estimate));
}

std::vector<BatchSlot<ExecutionEstimate>> ExecutionSimulator::simulate_all(
    const Strategy& strategy, const std::vector<types::MarketInfo>& markets) const {
    std::vector<BatchSlot<ExecutionEstimate>> slots;
    slots.reserve(strategy.legs.size());

    for (const auto& leg : strategy.legs) {
        const std::string item_id = leg.market_id + "|" + types::to_string(leg.outcome);
        auto market = std::find_if(markets.begin(), markets.end(),
                                   [&](const types::MarketInfo& m) { return m.id == leg.market_id; });
        if (market == markets.end()) {
            slots.emplace_back(item_id, Result<ExecutionEstimate>::error(ErrorKind::UPSTREAM_DATA_GAP,
                "market " + leg.market_id + " missing for execution"));
        } else {
            slots.emplace_back(item_id, simulate(leg, *market));
        }

        const auto& outcome = slots.back().outcome;
        if (outcome.is_error()) {
            utils::AnalyticsLogger::log_batch_item_failed("execution", item_id,
                to_string(outcome.error().kind), outcome.error().message);
        }
    }
    return slots;
}

} // namespace analytics
} // namespace pmx
