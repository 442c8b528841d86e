#include "amortization.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include "validator.hpp"
#include <algorithm>
#include <cmath>

namespace investcalc {

LoanResult::LoanResult()
    : monthly_payment(0.0),
      total_payment(0.0),
      total_interest(0.0),
      effective_annual_rate(0.0),
      origination_fees(0.0),
      total_cost_with_fees(0.0),
      first_year_principal(0.0),
      first_year_interest(0.0),
      payoff_summary{0, 0.0} {}

namespace {

constexpr int MONTHS_PER_YEAR = 12;
constexpr double HIGH_RATE_THRESHOLD = 15.0;
constexpr double LOW_RATE_THRESHOLD = 5.0;
constexpr int LONG_TERM_MONTHS = 84;

} // anonymous namespace

// ============================================================================
// Payment and schedule
// ============================================================================

double calculate_monthly_payment(double principal, double monthly_rate, int term_months) {
    if (monthly_rate == 0.0) {
        return principal / static_cast<double>(term_months);
    }
    double growth = std::pow(1.0 + monthly_rate, term_months);
    return principal * (monthly_rate * growth) / (growth - 1.0);
}

std::vector<AmortizationEntry> build_schedule(double principal, double monthly_rate,
                                              int term_months, double monthly_payment) {
    std::vector<AmortizationEntry> schedule;
    schedule.reserve(static_cast<size_t>(std::max(term_months, 0)));

    double balance = principal;
    for (int month = 1; month <= term_months; ++month) {
        double interest = balance * monthly_rate;
        double principal_paid = monthly_payment - interest;
        balance -= principal_paid;

        // Absorb floating-point drift on the last payment
        if (month == term_months || balance < 0.0) {
            balance = std::max(0.0, balance);
        }

        schedule.push_back(AmortizationEntry{month, monthly_payment, principal_paid, interest, balance});
    }
    return schedule;
}

double calculate_effective_rate(double net_proceeds, double monthly_payment, int term_months) {
    double total_paid = monthly_payment * term_months;
    double total_interest = total_paid - net_proceeds;
    double average_balance = net_proceeds / 2.0;
    double years = static_cast<double>(term_months) / MONTHS_PER_YEAR;

    return safe_divide(safe_divide(total_interest, average_balance), years) * 100.0;
}

Affordability calculate_affordability(const LoanInput& input, double monthly_payment) {
    Affordability affordability;
    if (!input.monthly_revenue || !input.monthly_expenses) {
        return affordability;
    }

    double net_cash_flow = *input.monthly_revenue - *input.monthly_expenses;
    affordability.cushion_after_payment = net_cash_flow - monthly_payment;

    if (net_cash_flow <= 0.0) {
        // No surplus to service debt: any payment is unaffordable
        affordability.is_affordable = false;
        affordability.max_affordable_payment = 0.0;
        return affordability;
    }

    double ratio = monthly_payment / net_cash_flow * 100.0;
    affordability.debt_service_ratio = ratio;
    affordability.is_affordable = ratio <= MAX_DEBT_SERVICE_RATIO;
    affordability.max_affordable_payment = net_cash_flow * MAX_DEBT_SERVICE_RATIO / 100.0;
    return affordability;
}

// ============================================================================
// Loan evaluation
// ============================================================================

LoanResult calculate_loan(const LoanInput& input) {
    CalculationContext ctx(engine_names::AMORTIZATION, "calculate_loan");
    validate_logged(input, ctx);

    double monthly_rate = input.annual_rate / 100.0 / MONTHS_PER_YEAR;

    LoanResult result;
    result.monthly_payment = calculate_monthly_payment(input.principal, monthly_rate, input.term_months);
    result.schedule = build_schedule(input.principal, monthly_rate, input.term_months, result.monthly_payment);

    result.total_payment = result.monthly_payment * input.term_months;
    result.total_interest = result.total_payment - input.principal;

    double fee_percent = input.origination_fee_percent.value_or(0.0);
    result.origination_fees = input.principal * fee_percent / 100.0;
    result.total_cost_with_fees = result.total_payment + result.origination_fees;
    result.effective_annual_rate = calculate_effective_rate(
        input.principal - result.origination_fees, result.monthly_payment, input.term_months);

    size_t first_year = std::min(result.schedule.size(), static_cast<size_t>(MONTHS_PER_YEAR));
    for (size_t i = 0; i < first_year; ++i) {
        result.first_year_principal += result.schedule[i].principal;
        result.first_year_interest += result.schedule[i].interest;
    }

    result.affordability = calculate_affordability(input, result.monthly_payment);

    result.payoff_summary.halfway_point = input.term_months / 2;
    if (result.payoff_summary.halfway_point > 0) {
        result.payoff_summary.principal_at_halfway =
            result.schedule[static_cast<size_t>(result.payoff_summary.halfway_point - 1)].balance;
    }

    Logger& logger = Logger::get_instance();
    logger.log_calculation(ctx, "monthly_payment", result.monthly_payment);
    logger.log_calculation(ctx, "total_interest", result.total_interest);
    logger.log_calculation(ctx, "effective_annual_rate", result.effective_annual_rate);

    return result;
}

LoanComparison compare_loan_options(const std::vector<LoanInput>& loans) {
    if (loans.empty()) {
        throw ValidationError(engine_names::AMORTIZATION, "loans", "must contain at least one option");
    }

    LoanComparison comparison;
    comparison.options.reserve(loans.size());
    for (const auto& loan : loans) {
        LoanResult result = calculate_loan(loan);
        comparison.options.push_back(LoanOption{loan, result.monthly_payment, result.total_cost_with_fees});
    }

    auto by_cost = [](const LoanOption& a, const LoanOption& b) { return a.total_cost < b.total_cost; };
    auto best = std::min_element(comparison.options.begin(), comparison.options.end(), by_cost);
    auto worst = std::max_element(comparison.options.begin(), comparison.options.end(), by_cost);

    comparison.best_option = static_cast<size_t>(best - comparison.options.begin());
    comparison.savings = worst->total_cost - best->total_cost;
    return comparison;
}

std::vector<std::string> loan_recommendations(const LoanResult& result, const LoanInput& input) {
    std::vector<std::string> notes;

    double interest_ratio = safe_divide(result.total_interest, input.principal) * 100.0;
    notes.push_back("Total interest cost: " + format_amount(interest_ratio, 1) +
                    "% of principal (" + format_amount(result.total_interest) + ")");

    const Affordability& affordability = result.affordability;
    if (affordability.is_affordable.has_value()) {
        if (!*affordability.is_affordable) {
            notes.push_back("WARNING: This loan may stretch your cash flow too thin.");
            notes.push_back("Maximum affordable payment: " +
                            format_amount(affordability.max_affordable_payment.value_or(0.0)) + "/month");
            notes.push_back("Consider a longer term, a smaller amount or a lower rate.");
        } else {
            notes.push_back("Loan is affordable. Cash cushion after payment: " +
                            format_amount(affordability.cushion_after_payment.value_or(0.0)) + "/month");
        }
    }

    if (input.annual_rate > HIGH_RATE_THRESHOLD) {
        notes.push_back("High interest rate. Explore SBA loans or credit unions for better rates.");
    } else if (input.annual_rate < LOW_RATE_THRESHOLD) {
        notes.push_back("Excellent interest rate. This is a competitive offer.");
    }

    if (input.term_months > LONG_TERM_MONTHS) {
        notes.push_back("Long term means more interest paid. Consider a shorter term if affordable.");
    }

    return notes;
}

} // namespace investcalc
