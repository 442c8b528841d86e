#include "benchmark.hpp"
#include "io/csv_reader.hpp"
#include "numeric.hpp"
#include <cmath>
#include <fstream>

namespace investcalc {

namespace {

int tier_score(double value, const BenchmarkRange& range, Direction direction) {
    if (direction == Direction::HigherIsBetter) {
        if (value >= range.optimal) return 100;
        if (value >= range.p75) return 85;
        if (value >= range.median) return 70;
        if (value >= range.p25) return 50;
        return 30;
    }
    if (value <= range.optimal) return 100;
    if (value <= range.p25) return 85;
    if (value <= range.median) return 70;
    if (value <= range.p75) return 50;
    return 30;
}

std::string health_category(int score) {
    if (score >= 85) return "excellent";
    if (score >= 70) return "good";
    if (score >= 50) return "fair";
    return "poor";
}

} // anonymous namespace

std::string percentile_bucket_to_string(PercentileBucket bucket) {
    switch (bucket) {
        case PercentileBucket::Top25: return "top25";
        case PercentileBucket::AboveMedian: return "aboveMedian";
        case PercentileBucket::BelowMedian: return "belowMedian";
        case PercentileBucket::Bottom25: return "bottom25";
    }
    return "unknown";
}

Direction default_direction_for(const std::string& metric) {
    if (metric.find("Cost") != std::string::npos || metric.rfind("days", 0) == 0) {
        return Direction::LowerIsBetter;
    }
    return Direction::HigherIsBetter;
}

PercentileBucket compare(double value, const BenchmarkRange& range, Direction direction) {
    if (direction == Direction::HigherIsBetter) {
        if (value >= range.p75) return PercentileBucket::Top25;
        if (value >= range.median) return PercentileBucket::AboveMedian;
        if (value >= range.p25) return PercentileBucket::BelowMedian;
        return PercentileBucket::Bottom25;
    }
    if (value <= range.p25) return PercentileBucket::Top25;
    if (value <= range.median) return PercentileBucket::AboveMedian;
    if (value <= range.p75) return PercentileBucket::BelowMedian;
    return PercentileBucket::Bottom25;
}

// ============================================================================
// BenchmarkTable Implementation
// ============================================================================

BenchmarkTable BenchmarkTable::load_from_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open benchmark file: " + path);
    }
    return load_from_csv(file);
}

BenchmarkTable BenchmarkTable::load_from_csv(std::istream& is) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        throw std::runtime_error("Empty benchmark CSV");
    }

    size_t col_industry = CsvReader::column_index(header, "industry");
    size_t col_name = CsvReader::column_index(header, "display_name");
    size_t col_metric = CsvReader::column_index(header, "metric");
    size_t col_p25 = CsvReader::column_index(header, "p25");
    size_t col_median = CsvReader::column_index(header, "median");
    size_t col_p75 = CsvReader::column_index(header, "p75");
    size_t col_optimal = CsvReader::column_index(header, "optimal");

    BenchmarkTable table;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;
        if (row.size() < header.size()) {
            throw std::runtime_error("Benchmark CSV line " + std::to_string(reader.line_number()) +
                                     " has " + std::to_string(row.size()) + " columns, expected " +
                                     std::to_string(header.size()));
        }

        BenchmarkRange range{
            reader.parse_double(row[col_p25]),
            reader.parse_double(row[col_median]),
            reader.parse_double(row[col_p75]),
            reader.parse_double(row[col_optimal])
        };

        Industry& industry = table.industries_[row[col_industry]];
        industry.display_name = row[col_name];
        industry.metrics[row[col_metric]] = range;
    }

    return table;
}

bool BenchmarkTable::has_industry(const std::string& industry) const {
    return industries_.count(industry) > 0;
}

std::vector<std::string> BenchmarkTable::industries() const {
    std::vector<std::string> names;
    names.reserve(industries_.size());
    for (const auto& [name, industry] : industries_) {
        names.push_back(name);
    }
    return names;
}

const BenchmarkTable::Industry& BenchmarkTable::find_industry(const std::string& industry) const {
    auto it = industries_.find(industry);
    if (it == industries_.end()) {
        throw BenchmarkLookupError("Industry not found: " + industry);
    }
    return it->second;
}

const std::string& BenchmarkTable::display_name(const std::string& industry) const {
    return find_industry(industry).display_name;
}

const std::map<std::string, BenchmarkRange>& BenchmarkTable::metrics(const std::string& industry) const {
    return find_industry(industry).metrics;
}

const BenchmarkRange& BenchmarkTable::range(const std::string& industry, const std::string& metric) const {
    const auto& metrics = find_industry(industry).metrics;
    auto it = metrics.find(metric);
    if (it == metrics.end()) {
        throw BenchmarkLookupError("Metric not found for " + industry + ": " + metric);
    }
    return it->second;
}

// ============================================================================
// Comparison and health score
// ============================================================================

BenchmarkComparison compare_detailed(const BenchmarkTable& table, const std::string& industry,
                                     const std::string& metric, double value) {
    BenchmarkComparison comparison;
    comparison.metric = metric;
    comparison.value = value;
    comparison.range = table.range(industry, metric);
    comparison.direction = default_direction_for(metric);
    comparison.bucket = compare(value, comparison.range, comparison.direction);

    const BenchmarkRange& range = comparison.range;
    comparison.vs_median = round_to(safe_divide(value - range.median, range.median) * 100.0, 1);
    comparison.vs_optimal = round_to(safe_divide(value - range.optimal, range.optimal) * 100.0, 1);

    switch (comparison.bucket) {
        case PercentileBucket::Top25:
            comparison.message = "Your " + metric + " is in the top 25% of the industry.";
            break;
        case PercentileBucket::AboveMedian:
            comparison.message = "Your " + metric + " is above the industry median.";
            break;
        case PercentileBucket::BelowMedian:
            comparison.message = "Your " + metric + " is below the industry median.";
            break;
        case PercentileBucket::Bottom25:
            comparison.message = "Your " + metric + " is in the bottom 25% of the industry.";
            break;
    }

    return comparison;
}

const std::map<std::string, double>& health_score_weights() {
    static const std::map<std::string, double> weights = {
        {"grossMarginPercent", 25.0},
        {"netMarginPercent", 20.0},
        {"currentRatio", 15.0},
        {"laborCostPercent", 15.0},
        {"revenueGrowthPercent", 15.0},
        {"inventoryTurnover", 10.0},
    };
    return weights;
}

HealthScore health_score(const BenchmarkTable& table, const std::string& industry,
                         const std::map<std::string, double>& values) {
    if (!table.has_industry(industry)) {
        throw BenchmarkLookupError("Industry not found: " + industry);
    }
    const auto& weights = health_score_weights();

    HealthScore result;
    result.overall_score = 0;

    double total_weight = 0.0;
    double weighted_score = 0.0;

    for (const auto& [metric, value] : values) {
        auto weight_it = weights.find(metric);
        if (weight_it == weights.end()) {
            continue;
        }

        const BenchmarkRange& range = table.range(industry, metric);
        int score = tier_score(value, range, default_direction_for(metric));

        result.breakdown.push_back(HealthScoreItem{metric, value, score, weight_it->second});
        total_weight += weight_it->second;
        weighted_score += score * weight_it->second;
    }

    if (total_weight > 0.0) {
        result.overall_score = static_cast<int>(std::round(weighted_score / total_weight));
    }
    result.category = health_category(result.overall_score);
    return result;
}

} // namespace investcalc
