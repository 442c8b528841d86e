#include "numeric.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace investcalc {

ValidationError::ValidationError(const std::string& engine, const std::string& field,
                                 const std::string& reason)
    : std::invalid_argument(engine + ": " + field + " " + reason),
      engine_(engine),
      field_(field) {}

namespace {

std::string format_bound(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // anonymous namespace

void assert_finite(double value, const std::string& engine, const std::string& field) {
    if (!std::isfinite(value)) {
        throw ValidationError(engine, field, "must be a finite number");
    }
}

void assert_positive(double value, const std::string& engine, const std::string& field) {
    assert_finite(value, engine, field);
    if (value <= 0.0) {
        throw ValidationError(engine, field, "must be greater than zero");
    }
}

void assert_non_negative(double value, const std::string& engine, const std::string& field) {
    assert_finite(value, engine, field);
    if (value < 0.0) {
        throw ValidationError(engine, field, "must not be negative");
    }
}

void assert_range(double value, double min, double max,
                  const std::string& engine, const std::string& field) {
    assert_finite(value, engine, field);
    if (value < min || value > max) {
        throw ValidationError(engine, field,
            "must be between " + format_bound(min) + " and " + format_bound(max));
    }
}

double safe_divide(double numerator, double denominator, double default_value) {
    if (denominator == 0.0) {
        return default_value;
    }
    return numerator / denominator;
}

double round_to(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    double multiplier = std::pow(10.0, decimals);
    return std::round(value * multiplier) / multiplier;
}

std::string format_amount(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

} // namespace investcalc
