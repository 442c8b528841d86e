#ifndef INVESTCALC_PARQUET_WRITER_HPP
#define INVESTCALC_PARQUET_WRITER_HPP

#include "../amortization.hpp"
#include "../cash_flow_forecast.hpp"
#include "../sensitivity.hpp"
#include "../standard_metrics.hpp"
#include <string>

namespace investcalc {

class ParquetWriter {
public:
    /**
     * Write the monthly cash flow series of a scenario.
     *
     * Output schema:
     *   - month: int32 (1-based)
     *   - cash_flow: float64
     *   - cumulative_cash_flow: float64 (starts from -initial_investment)
     *
     * @throws std::runtime_error if the file cannot be written
     */
    static void write_cash_flows(const MetricsResult& result, const std::string& filepath);

    /**
     * Write a loan amortization schedule.
     *
     * Output schema:
     *   - month: int32
     *   - payment, principal, interest, balance: float64
     */
    static void write_schedule(const LoanResult& result, const std::string& filepath);

    /**
     * Write a month-by-month cash forecast.
     *
     * Output schema:
     *   - month: int32
     *   - month_name: utf8
     *   - revenue, expenses, net_cash_flow, ending_cash: float64
     *   - is_deficit: bool
     */
    static void write_forecast(const ForecastResult& result, const std::string& filepath);

    /**
     * Write every cell of a sensitivity grid, variable-major.
     *
     * Output schema:
     *   - variable: utf8
     *   - variation_percent, npv, roi: float64
     */
    static void write_sensitivity(const SensitivityMatrix& matrix, const std::string& filepath);
};

} // namespace investcalc

#endif // INVESTCALC_PARQUET_WRITER_HPP
