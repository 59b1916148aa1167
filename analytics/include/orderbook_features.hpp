#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "analytics_config.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

// Display row for the top of a book side
struct BookLevelView {
    types::Price price;
    types::Quantity size;
    types::Quantity cumulative_size;

    BookLevelView() : price(0), size(0), cumulative_size(0) {}
    BookLevelView(types::Price p, types::Quantity s, types::Quantity cumulative)
        : price(p), size(s), cumulative_size(cumulative) {}
};

struct BookDepth {
    double bid;
    double ask;
    double total;

    BookDepth() : bid(0), ask(0), total(0) {}
};

// Relative slippage at the three reference sizes. Unfillable sizes carry ErrorKind::UNFILLABLE.
struct SlippageProfile {
    Result<double> small;
    Result<double> medium;
    Result<double> large;

    SlippageProfile()
        : small(Result<double>::error(ErrorKind::UPSTREAM_DATA_GAP, "not computed"))
        , medium(Result<double>::error(ErrorKind::UPSTREAM_DATA_GAP, "not computed"))
        , large(Result<double>::error(ErrorKind::UPSTREAM_DATA_GAP, "not computed")) {}
};

struct OrderbookFeatures {
    types::Price best_bid;
    types::Price best_ask;
    types::Price mid;
    double spread;
    double spread_percent;
    BookDepth depth;
    double imbalance;
    SlippageProfile slippage;
    std::vector<BookLevelView> top_bids;
    std::vector<BookLevelView> top_asks;
    bool crossed;
    std::string interpretation;

    OrderbookFeatures()
        : best_bid(0), best_ask(0), mid(0), spread(0), spread_percent(0)
        , imbalance(0), crossed(false) {}
};

class OrderbookFeatureExtractor {
public:
    explicit OrderbookFeatureExtractor(const OrderbookConfig& config = OrderbookConfig());

    // Accepts [[price, size], ...], [{"price": .., "size": ..}, ...] or {"price": size, ...}.
    // Numeric strings are coerced. null is an empty side; any other shape throws ValidationError.
    static std::vector<types::OrderBookLevel> normalize_side(const nlohmann::json& raw, types::BookSide side);
    static std::vector<types::OrderBookLevel> normalize_side(const std::vector<types::OrderBookLevel>& levels,
                                                             types::BookSide side);

    static types::OrderBook normalize(const types::OrderBook& book);

    // Payload of the form {"bids": ..., "asks": ...}
    static types::OrderBook parse_book(const nlohmann::json& payload);

    // Walks the top-N of a normalized ask side. Size must be positive and finite.
    Result<double> slippage(const std::vector<types::OrderBookLevel>& asks, double size) const;

    Result<OrderbookFeatures> extract(const types::OrderBook& book) const;
    Result<OrderbookFeatures> extract(const nlohmann::json& payload) const;

    const OrderbookConfig& config() const { return config_; }

private:
    OrderbookConfig config_;

    std::vector<BookLevelView> top_levels(const std::vector<types::OrderBookLevel>& levels) const;
    std::string interpret(const OrderbookFeatures& features, bool both_sides) const;
};

} // namespace analytics
} // namespace pmx
