#include "time_series.hpp"
#include <cstdlib>
#include <unordered_map>

namespace pmx {
namespace analytics {

TimeSeriesAligner::TimeSeriesAligner(const AlignmentConfig& config)
    : config_(config) {
}

AlignedSeries TimeSeriesAligner::align(const types::PriceSeries& a, const types::PriceSeries& b) const {
    if (config_.mode == AlignmentMode::NEAREST) {
        return align_nearest(a, b);
    }
    return align_exact(a, b);
}

AlignedSeries TimeSeriesAligner::align_exact(const types::PriceSeries& a, const types::PriceSeries& b) const {
    std::unordered_map<types::Timestamp, double> b_by_time;
    b_by_time.reserve(b.size());
    for (const auto& point : b) {
        b_by_time.emplace(point.timestamp, point.price);  // first point per timestamp wins
    }

    AlignedSeries aligned;
    for (const auto& point : a) {
        auto it = b_by_time.find(point.timestamp);
        if (it != b_by_time.end()) {
            aligned.timestamps.push_back(point.timestamp);
            aligned.a.push_back(point.price);
            aligned.b.push_back(it->second);
        }
    }
    return aligned;
}

AlignedSeries TimeSeriesAligner::align_nearest(const types::PriceSeries& a, const types::PriceSeries& b) const {
    AlignedSeries aligned;
    size_t cursor = 0;

    for (const auto& point : a) {
        // Skip b points too old to match this or any later a point
        while (cursor < b.size() && b[cursor].timestamp < point.timestamp - config_.tolerance_ms) {
            ++cursor;
        }

        size_t best = b.size();
        int64_t best_distance = 0;
        for (size_t j = cursor; j < b.size(); ++j) {
            const int64_t distance = std::llabs(b[j].timestamp - point.timestamp);
            if (b[j].timestamp > point.timestamp + config_.tolerance_ms) {
                break;
            }
            if (best == b.size() || distance < best_distance) {
                best = j;
                best_distance = distance;
            }
        }

        if (best < b.size()) {
            aligned.timestamps.push_back(point.timestamp);
            aligned.a.push_back(point.price);
            aligned.b.push_back(b[best].price);
            cursor = best + 1;
        }
    }
    return aligned;
}

Result<bool> validate_series(const types::PriceSeries& series, const std::string& label) {
    if (series.empty()) {
        return Result<bool>::error(ErrorKind::UPSTREAM_DATA_GAP, "empty price series for " + label);
    }
    for (const auto& point : series) {
        if (!types::is_valid_probability(point.price)) {
            return Result<bool>::error(ErrorKind::INVALID_INPUT,
                "price " + std::to_string(point.price) + " outside [0, 1] in " + label);
        }
    }
    return Result<bool>::success(true);
}

std::vector<double> prices_of(const types::PriceSeries& series) {
    std::vector<double> prices;
    prices.reserve(series.size());
    for (const auto& point : series) {
        prices.push_back(point.price);
    }
    return prices;
}

} // namespace analytics
} // namespace pmx
