#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace investcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

// Build a finished column from values, one builder per Arrow type
template <typename Builder, typename T>
std::shared_ptr<arrow::Array> make_column(const std::vector<T>& values, const std::string& name) {
    Builder builder;
    check(builder.Reserve(static_cast<int64_t>(values.size())), "reserve memory for " + name + " column");
    for (const auto& value : values) {
        check(builder.Append(value), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

// arrow::BooleanBuilder takes bool, std::vector<bool> hands out proxies
std::shared_ptr<arrow::Array> make_bool_column(const std::vector<bool>& values, const std::string& name) {
    arrow::BooleanBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(values.size())), "reserve memory for " + name + " column");
    for (bool value : values) {
        check(builder.Append(value), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

void write_table(const std::shared_ptr<arrow::Schema>& schema,
                 const std::vector<std::shared_ptr<arrow::Array>>& columns,
                 const std::string& filepath) {
    auto table = arrow::Table::Make(schema, columns);

    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

std::vector<int32_t> month_numbers(size_t count) {
    std::vector<int32_t> months(count);
    for (size_t i = 0; i < count; ++i) {
        months[i] = static_cast<int32_t>(i + 1);
    }
    return months;
}

} // anonymous namespace

void ParquetWriter::write_cash_flows(const MetricsResult& result, const std::string& filepath) {
    if (result.monthly_cash_flow.empty()) {
        throw std::runtime_error("MetricsResult has no monthly cash flows to write");
    }

    auto schema = arrow::schema({
        arrow::field("month", arrow::int32()),
        arrow::field("cash_flow", arrow::float64()),
        arrow::field("cumulative_cash_flow", arrow::float64())
    });

    write_table(schema, {
        make_column<arrow::Int32Builder>(month_numbers(result.monthly_cash_flow.size()), "month"),
        make_column<arrow::DoubleBuilder>(result.monthly_cash_flow, "cash_flow"),
        make_column<arrow::DoubleBuilder>(result.cumulative_cash_flow, "cumulative_cash_flow")
    }, filepath);
}

void ParquetWriter::write_schedule(const LoanResult& result, const std::string& filepath) {
    if (result.schedule.empty()) {
        throw std::runtime_error("LoanResult has no amortization schedule to write");
    }

    std::vector<int32_t> months;
    std::vector<double> payments, principals, interests, balances;
    for (const auto& entry : result.schedule) {
        months.push_back(entry.month);
        payments.push_back(entry.payment);
        principals.push_back(entry.principal);
        interests.push_back(entry.interest);
        balances.push_back(entry.balance);
    }

    auto schema = arrow::schema({
        arrow::field("month", arrow::int32()),
        arrow::field("payment", arrow::float64()),
        arrow::field("principal", arrow::float64()),
        arrow::field("interest", arrow::float64()),
        arrow::field("balance", arrow::float64())
    });

    write_table(schema, {
        make_column<arrow::Int32Builder>(months, "month"),
        make_column<arrow::DoubleBuilder>(payments, "payment"),
        make_column<arrow::DoubleBuilder>(principals, "principal"),
        make_column<arrow::DoubleBuilder>(interests, "interest"),
        make_column<arrow::DoubleBuilder>(balances, "balance")
    }, filepath);
}

void ParquetWriter::write_forecast(const ForecastResult& result, const std::string& filepath) {
    if (result.months.empty()) {
        throw std::runtime_error("ForecastResult has no months to write");
    }

    std::vector<int32_t> months;
    std::vector<std::string> names;
    std::vector<double> revenue, expenses, net, ending;
    std::vector<bool> deficit;
    for (const auto& month : result.months) {
        months.push_back(month.month);
        names.push_back(month.month_name);
        revenue.push_back(month.revenue);
        expenses.push_back(month.expenses);
        net.push_back(month.net_cash_flow);
        ending.push_back(month.ending_cash);
        deficit.push_back(month.is_deficit);
    }

    auto schema = arrow::schema({
        arrow::field("month", arrow::int32()),
        arrow::field("month_name", arrow::utf8()),
        arrow::field("revenue", arrow::float64()),
        arrow::field("expenses", arrow::float64()),
        arrow::field("net_cash_flow", arrow::float64()),
        arrow::field("ending_cash", arrow::float64()),
        arrow::field("is_deficit", arrow::boolean())
    });

    write_table(schema, {
        make_column<arrow::Int32Builder>(months, "month"),
        make_column<arrow::StringBuilder>(names, "month_name"),
        make_column<arrow::DoubleBuilder>(revenue, "revenue"),
        make_column<arrow::DoubleBuilder>(expenses, "expenses"),
        make_column<arrow::DoubleBuilder>(net, "net_cash_flow"),
        make_column<arrow::DoubleBuilder>(ending, "ending_cash"),
        make_bool_column(deficit, "is_deficit")
    }, filepath);
}

void ParquetWriter::write_sensitivity(const SensitivityMatrix& matrix, const std::string& filepath) {
    if (matrix.size() == 0) {
        throw std::runtime_error("SensitivityMatrix has no cells to write");
    }

    std::vector<std::string> variables;
    std::vector<double> variations, npvs, rois;
    for (const auto& point : matrix.points()) {
        variables.push_back(sensitivity_variable_to_string(point.variable));
        variations.push_back(point.variation_percent);
        npvs.push_back(point.npv);
        rois.push_back(point.roi);
    }

    auto schema = arrow::schema({
        arrow::field("variable", arrow::utf8()),
        arrow::field("variation_percent", arrow::float64()),
        arrow::field("npv", arrow::float64()),
        arrow::field("roi", arrow::float64())
    });

    write_table(schema, {
        make_column<arrow::StringBuilder>(variables, "variable"),
        make_column<arrow::DoubleBuilder>(variations, "variation_percent"),
        make_column<arrow::DoubleBuilder>(npvs, "npv"),
        make_column<arrow::DoubleBuilder>(rois, "roi")
    }, filepath);
}

#else // !HAVE_ARROW

namespace {

[[noreturn]] void arrow_unavailable() {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

} // anonymous namespace

void ParquetWriter::write_cash_flows(const MetricsResult& /* result */, const std::string& /* filepath */) {
    arrow_unavailable();
}

void ParquetWriter::write_schedule(const LoanResult& /* result */, const std::string& /* filepath */) {
    arrow_unavailable();
}

void ParquetWriter::write_forecast(const ForecastResult& /* result */, const std::string& /* filepath */) {
    arrow_unavailable();
}

void ParquetWriter::write_sensitivity(const SensitivityMatrix& /* matrix */, const std::string& /* filepath */) {
    arrow_unavailable();
}

#endif // HAVE_ARROW

} // namespace investcalc
