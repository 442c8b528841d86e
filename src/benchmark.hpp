#ifndef INVESTCALC_BENCHMARK_HPP
#define INVESTCALC_BENCHMARK_HPP

#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace investcalc {

// Raised for an unknown industry or metric
class BenchmarkLookupError : public std::out_of_range {
public:
    explicit BenchmarkLookupError(const std::string& message)
        : std::out_of_range(message) {}
};

// Percentile bands of one metric within one industry
struct BenchmarkRange {
    double p25;
    double median;
    double p75;
    double optimal;
};

enum class Direction {
    HigherIsBetter,
    LowerIsBetter
};

enum class PercentileBucket {
    Top25,
    AboveMedian,
    BelowMedian,
    Bottom25
};

std::string percentile_bucket_to_string(PercentileBucket bucket);

// Cost ratios ("...Cost...") and day counts ("days...") are lower-is-better
Direction default_direction_for(const std::string& metric);

// Place a value in the quartile buckets. For lower-is-better metrics the
// comparisons invert: value <= p25 is Top25.
PercentileBucket compare(double value, const BenchmarkRange& range, Direction direction);

// Static industry benchmark data, loaded once and read-only afterwards
class BenchmarkTable {
public:
    BenchmarkTable() = default;

    // CSV columns: industry,display_name,metric,p25,median,p75,optimal
    static BenchmarkTable load_from_csv(const std::string& path);
    static BenchmarkTable load_from_csv(std::istream& is);

    bool has_industry(const std::string& industry) const;
    std::vector<std::string> industries() const;
    size_t size() const { return industries_.size(); }

    const std::string& display_name(const std::string& industry) const;
    const std::map<std::string, BenchmarkRange>& metrics(const std::string& industry) const;
    const BenchmarkRange& range(const std::string& industry, const std::string& metric) const;

private:
    struct Industry {
        std::string display_name;
        std::map<std::string, BenchmarkRange> metrics;
    };

    std::map<std::string, Industry> industries_;

    const Industry& find_industry(const std::string& industry) const;
};

struct BenchmarkComparison {
    std::string metric;
    double value;
    PercentileBucket bucket;
    Direction direction;
    double vs_median;           // % difference, 1 decimal
    double vs_optimal;          // % difference, 1 decimal
    std::string message;
    BenchmarkRange range;
};

BenchmarkComparison compare_detailed(const BenchmarkTable& table, const std::string& industry,
                                     const std::string& metric, double value);

// Weights of the metrics that contribute to the health score
const std::map<std::string, double>& health_score_weights();

struct HealthScoreItem {
    std::string metric;
    double value;
    int score;                  // 100, 85, 70, 50 or 30
    double weight;
};

struct HealthScore {
    int overall_score;          // Weighted mean, 0 when no weighted metric was supplied
    std::string category;       // excellent, good, fair or poor
    std::vector<HealthScoreItem> breakdown;
};

// Metrics without a weight are ignored
HealthScore health_score(const BenchmarkTable& table, const std::string& industry,
                         const std::map<std::string, double>& values);

} // namespace investcalc

#endif // INVESTCALC_BENCHMARK_HPP
