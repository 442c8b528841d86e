#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/parquet_writer.hpp"
#include <cstdio>
#include <fstream>

using namespace investcalc;
using Catch::Matchers::ContainsSubstring;

namespace {

MetricsResult sample_metrics() {
    return calculate_metrics(ScenarioInput(50000.0, 10.0, 24, 36000.0, 5.0, 8000.0, 2000.0));
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // anonymous namespace

#ifdef HAVE_ARROW

TEST_CASE("Row data is written as Parquet", "[parquet]") {
    SECTION("cash flows") {
        std::string path = "/tmp/investcalc_test_cash_flows.parquet";
        std::remove(path.c_str());
        ParquetWriter::write_cash_flows(sample_metrics(), path);
        REQUIRE(file_exists(path));
        std::remove(path.c_str());
    }

    SECTION("amortization schedule") {
        std::string path = "/tmp/investcalc_test_schedule.parquet";
        std::remove(path.c_str());
        ParquetWriter::write_schedule(calculate_loan(LoanInput(100000.0, 8.0, 60)), path);
        REQUIRE(file_exists(path));
        std::remove(path.c_str());
    }

    SECTION("forecast") {
        std::string path = "/tmp/investcalc_test_forecast.parquet";
        std::remove(path.c_str());
        ParquetWriter::write_forecast(calculate_forecast(ForecastInput(20000.0, 15000.0, 14000.0)), path);
        REQUIRE(file_exists(path));
        std::remove(path.c_str());
    }

    SECTION("sensitivity grid") {
        std::string path = "/tmp/investcalc_test_sensitivity.parquet";
        std::remove(path.c_str());
        ParquetWriter::write_sensitivity(
            run_sensitivity(ScenarioInput(50000.0, 10.0, 24, 36000.0, 5.0, 8000.0, 2000.0)), path);
        REQUIRE(file_exists(path));
        std::remove(path.c_str());
    }
}

TEST_CASE("Parquet write failures", "[parquet]") {
    SECTION("empty series") {
        REQUIRE_THROWS_AS(ParquetWriter::write_cash_flows(MetricsResult(), "/tmp/investcalc_test_empty.parquet"),
                          std::runtime_error);
    }

    SECTION("unwritable path") {
        REQUIRE_THROWS_AS(ParquetWriter::write_cash_flows(sample_metrics(), "/nonexistent/dir/out.parquet"),
                          std::runtime_error);
    }
}

#else // !HAVE_ARROW

TEST_CASE("Parquet export requires Apache Arrow", "[parquet]") {
    std::remove("/tmp/investcalc_test.parquet");
    REQUIRE_THROWS_WITH(ParquetWriter::write_cash_flows(sample_metrics(), "/tmp/investcalc_test.parquet"),
                        ContainsSubstring("Apache Arrow not available"));
    REQUIRE_THROWS_WITH(ParquetWriter::write_schedule(calculate_loan(LoanInput(100000.0, 8.0, 60)),
                                                      "/tmp/investcalc_test.parquet"),
                        ContainsSubstring("Apache Arrow not available"));
    REQUIRE_FALSE(file_exists("/tmp/investcalc_test.parquet"));
}

#endif // HAVE_ARROW
