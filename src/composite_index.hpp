#ifndef INVESTCALC_COMPOSITE_INDEX_HPP
#define INVESTCALC_COMPOSITE_INDEX_HPP

#include "inputs.hpp"
#include <optional>
#include <string>

namespace investcalc {

enum class IndexRating {
    Optimal,
    Acceptable,
    Critical
};

std::string index_rating_to_string(IndexRating rating);

// Benchmark bands for one index. For lower-is-better indices a value
// below optimal is Optimal; for higher-is-better ones it must exceed it.
struct IndexBands {
    double optimal;
    double acceptable;
    double industry;            // Typical industry value, informational
    bool lower_is_better;
};

constexpr IndexBands OFI_BANDS{0.03, 0.08, 0.10, true};
constexpr IndexBands TFDI_BANDS{0.15, 0.25, 0.30, true};
constexpr IndexBands SER_BANDS{2.0, 1.0, 1.2, false};

IndexRating rate_index(double value, const IndexBands& bands);

// Annual manual cost / revenue
double calculate_ofi(const FrictionInputs& input);

// (maintenance share of team cost + annual incident cost) / team cost
double calculate_tfdi(const TechDebtInputs& input);

// Revenue growth / |burn change| with a 0.01 floor; x1.5 when burn falls
double calculate_ser(const EfficiencyInputs& input);

struct IndexValue {
    double value;               // Rounded to 4 decimals
    IndexRating rating;
};

struct CompositeResult {
    IndexValue ofi;
    IndexValue tfdi;
    IndexValue ser;
    double annual_manual_cost;
    std::optional<double> automation_savings;   // Only with automation_potential
};

// Validates each block of inputs and computes all three indices
CompositeResult calculate_composite_indices(const CompositeInputs& input);

} // namespace investcalc

#endif // INVESTCALC_COMPOSITE_INDEX_HPP
