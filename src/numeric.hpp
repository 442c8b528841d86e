#ifndef INVESTCALC_NUMERIC_HPP
#define INVESTCALC_NUMERIC_HPP

#include <stdexcept>
#include <string>

namespace investcalc {

// Raised when an input field fails a validation rule.
// field() names the offending field so callers can highlight it.
class ValidationError : public std::invalid_argument {
public:
    ValidationError(const std::string& engine, const std::string& field,
                    const std::string& reason);

    const std::string& engine() const { return engine_; }
    const std::string& field() const { return field_; }

private:
    std::string engine_;
    std::string field_;
};

// ============================================================================
// Assertions (throw ValidationError)
// ============================================================================

void assert_finite(double value, const std::string& engine, const std::string& field);

// value > 0
void assert_positive(double value, const std::string& engine, const std::string& field);

// value >= 0
void assert_non_negative(double value, const std::string& engine, const std::string& field);

// min <= value <= max
void assert_range(double value, double min, double max,
                  const std::string& engine, const std::string& field);

// ============================================================================
// Arithmetic helpers (never throw)
// ============================================================================

// Returns default_value when denominator is exactly zero
double safe_divide(double numerator, double denominator, double default_value = 0.0);

// Round half away from zero to the given number of decimal places
double round_to(double value, int decimals = 2);

// Currency values are reported to the cent, ratio indices to 4 places
inline double round_currency(double value) { return round_to(value, 2); }
inline double round_ratio(double value) { return round_to(value, 4); }

// Fixed-point text for advisory messages, e.g. format_amount(1234.5) == "1234.50"
std::string format_amount(double value, int decimals = 2);

} // namespace investcalc

#endif // INVESTCALC_NUMERIC_HPP
