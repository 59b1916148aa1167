#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "analytics_config.hpp"
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

// Two equal-length price arrays paired by timestamp, in the first series' order
struct AlignedSeries {
    std::vector<types::Timestamp> timestamps;
    std::vector<double> a;
    std::vector<double> b;

    size_t size() const { return a.size(); }
    bool empty() const { return a.empty(); }
};

class TimeSeriesAligner {
public:
    explicit TimeSeriesAligner(const AlignmentConfig& config = AlignmentConfig());

    // EXACT keeps the first point of b per matching timestamp.
    // NEAREST pairs each point of a with the closest unused point of b within tolerance_ms,
    // consuming b monotonically.
    AlignedSeries align(const types::PriceSeries& a, const types::PriceSeries& b) const;

    const AlignmentConfig& config() const { return config_; }

private:
    AlignmentConfig config_;

    AlignedSeries align_exact(const types::PriceSeries& a, const types::PriceSeries& b) const;
    AlignedSeries align_nearest(const types::PriceSeries& a, const types::PriceSeries& b) const;
};

// UPSTREAM_DATA_GAP for an empty series, INVALID_INPUT for a price that is not a finite probability
Result<bool> validate_series(const types::PriceSeries& series, const std::string& label);

std::vector<double> prices_of(const types::PriceSeries& series);

} // namespace analytics
} // namespace pmx
