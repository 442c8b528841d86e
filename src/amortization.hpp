#ifndef INVESTCALC_AMORTIZATION_HPP
#define INVESTCALC_AMORTIZATION_HPP

#include "inputs.hpp"
#include <optional>
#include <string>
#include <vector>

namespace investcalc {

// One row of the amortization schedule (balance is after the payment)
struct AmortizationEntry {
    int month;
    double payment;
    double principal;
    double interest;
    double balance;
};

// Debt service as a share of monthly net cash flow. All fields are empty
// when revenue or expenses were not supplied: affordability is unknown,
// which is not the same as unaffordable.
struct Affordability {
    std::optional<double> debt_service_ratio;       // %
    std::optional<bool> is_affordable;              // ratio <= 40
    std::optional<double> max_affordable_payment;   // 40% of net cash flow
    std::optional<double> cushion_after_payment;

    bool known() const { return is_affordable.has_value(); }
};

struct PayoffSummary {
    int halfway_point;                  // floor(term / 2)
    double principal_at_halfway;        // Balance after the halfway month
};

struct LoanResult {
    double monthly_payment;
    double total_payment;
    double total_interest;
    double effective_annual_rate;       // Simplified approximation, see calculate_effective_rate
    double origination_fees;
    double total_cost_with_fees;
    std::vector<AmortizationEntry> schedule;
    double first_year_principal;
    double first_year_interest;
    Affordability affordability;
    PayoffSummary payoff_summary;

    LoanResult();
};

constexpr double MAX_DEBT_SERVICE_RATIO = 40.0;

// Annuity payment; straight-line P/n when monthly_rate == 0
double calculate_monthly_payment(double principal, double monthly_rate, int term_months);

std::vector<AmortizationEntry> build_schedule(double principal, double monthly_rate,
                                              int term_months, double monthly_payment);

// (total_paid - net_proceeds) / (net_proceeds / 2) / years * 100
// Approximates the cost of credit including fees; it is not an exact APR.
double calculate_effective_rate(double net_proceeds, double monthly_payment, int term_months);

Affordability calculate_affordability(const LoanInput& input, double monthly_payment);

// Validate and evaluate one loan offer
LoanResult calculate_loan(const LoanInput& input);

struct LoanOption {
    LoanInput input;
    double monthly_payment;
    double total_cost;                  // Total payments plus fees
};

struct LoanComparison {
    std::vector<LoanOption> options;    // Input order
    size_t best_option;                 // Index of the cheapest total cost
    double savings;                     // Worst total cost minus best
};

// Throws ValidationError when loans is empty or any offer is invalid
LoanComparison compare_loan_options(const std::vector<LoanInput>& loans);

// Advisory notes on interest cost, affordability, rate and term
std::vector<std::string> loan_recommendations(const LoanResult& result, const LoanInput& input);

} // namespace investcalc

#endif // INVESTCALC_AMORTIZATION_HPP
