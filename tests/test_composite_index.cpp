#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "composite_index.hpp"
#include "numeric.hpp"

using namespace investcalc;
using Catch::Approx;

namespace {

CompositeInputs sample_inputs() {
    CompositeInputs input;
    input.friction = FrictionInputs{20.0, 50.0, 1000000.0, 60.0};
    input.tech_debt = TechDebtInputs{30.0, 160.0, 600000.0, 2000.0};
    input.efficiency = EfficiencyInputs{1200000.0, 1000000.0, 90000.0, 80000.0};
    return input;
}

} // anonymous namespace

TEST_CASE("Operational Friction Index", "[composite]") {
    SECTION("annual manual cost over revenue") {
        FrictionInputs input{20.0, 50.0, 1000000.0, std::nullopt};
        REQUIRE(calculate_ofi(input) == Approx(0.052));
    }

    SECTION("zero manual hours or hourly cost are rejected") {
        REQUIRE_THROWS_AS(calculate_ofi(FrictionInputs{0.0, 50.0, 1000000.0, std::nullopt}), ValidationError);
        REQUIRE_THROWS_AS(calculate_ofi(FrictionInputs{20.0, 0.0, 1000000.0, std::nullopt}), ValidationError);
    }

    SECTION("rounded to 4 decimals") {
        FrictionInputs input{7.0, 33.0, 123457.0, std::nullopt};
        double value = calculate_ofi(input);
        REQUIRE(value == round_ratio(value));
    }

    SECTION("zero revenue is rejected") {
        FrictionInputs input{20.0, 50.0, 0.0, std::nullopt};
        REQUIRE_THROWS_AS(calculate_ofi(input), ValidationError);
    }
}

TEST_CASE("Tech-Debt Financial Drag Index", "[composite]") {
    SECTION("maintenance share plus incident cost") {
        TechDebtInputs input{30.0, 160.0, 600000.0, 2000.0};
        // (0.1875 * 600000 + 24000) / 600000
        REQUIRE(calculate_tfdi(input) == Approx(0.2275));
    }

    SECTION("quarter of the sprint on maintenance") {
        TechDebtInputs input{40.0, 160.0, 500000.0, 1000.0};
        // (0.25 * 500000 + 12000) / 500000
        REQUIRE(calculate_tfdi(input) == Approx(0.274));
    }

    SECTION("maintenance above total is rejected") {
        TechDebtInputs input{200.0, 160.0, 600000.0, 2000.0};
        REQUIRE_THROWS_AS(calculate_tfdi(input), ValidationError);
    }

    SECTION("zero maintenance hours or incident cost are rejected") {
        REQUIRE_THROWS_AS(calculate_tfdi(TechDebtInputs{0.0, 160.0, 600000.0, 2000.0}), ValidationError);
        REQUIRE_THROWS_AS(calculate_tfdi(TechDebtInputs{30.0, 160.0, 600000.0, 0.0}), ValidationError);
    }
}

TEST_CASE("Strategic Efficiency Ratio", "[composite]") {
    SECTION("revenue growth over burn growth") {
        EfficiencyInputs input{1200000.0, 1000000.0, 90000.0, 80000.0};
        REQUIRE(calculate_ser(input) == Approx(1.6));
    }

    SECTION("falling burn earns the 1.5x bonus") {
        EfficiencyInputs input{1100000.0, 1000000.0, 72000.0, 80000.0};
        // 0.10 / 0.10 * 1.5
        REQUIRE(calculate_ser(input) == Approx(1.5));
    }

    SECTION("flat burn is floored at 1%") {
        EfficiencyInputs input{1050000.0, 1000000.0, 80000.0, 80000.0};
        REQUIRE(calculate_ser(input) == Approx(5.0));
    }

    SECTION("shrinking revenue gives a negative ratio") {
        EfficiencyInputs input{900000.0, 1000000.0, 88000.0, 80000.0};
        REQUIRE(calculate_ser(input) < 0.0);
    }

    SECTION("zero current revenue or burn is rejected") {
        REQUIRE_THROWS_AS(calculate_ser(EfficiencyInputs{0.0, 100.0, 0.0, 100.0}), ValidationError);
        REQUIRE_THROWS_AS(calculate_ser(EfficiencyInputs{0.0, 100.0, 90.0, 100.0}), ValidationError);
        REQUIRE_THROWS_AS(calculate_ser(EfficiencyInputs{120.0, 100.0, 0.0, 100.0}), ValidationError);
    }
}

TEST_CASE("Index ratings", "[composite]") {
    SECTION("lower is better for OFI and TFDI") {
        REQUIRE(rate_index(0.02, OFI_BANDS) == IndexRating::Optimal);
        REQUIRE(rate_index(0.052, OFI_BANDS) == IndexRating::Acceptable);
        REQUIRE(rate_index(0.08, OFI_BANDS) == IndexRating::Critical);
        REQUIRE(rate_index(0.30, TFDI_BANDS) == IndexRating::Critical);
    }

    SECTION("higher is better for SER") {
        REQUIRE(rate_index(2.5, SER_BANDS) == IndexRating::Optimal);
        REQUIRE(rate_index(1.6, SER_BANDS) == IndexRating::Acceptable);
        REQUIRE(rate_index(1.0, SER_BANDS) == IndexRating::Critical);
    }

    SECTION("names") {
        REQUIRE(index_rating_to_string(IndexRating::Optimal) == "optimal");
        REQUIRE(index_rating_to_string(IndexRating::Critical) == "critical");
    }
}

TEST_CASE("Combined indices", "[composite]") {
    CompositeResult result = calculate_composite_indices(sample_inputs());

    REQUIRE(result.ofi.value == Approx(0.052));
    REQUIRE(result.ofi.rating == IndexRating::Acceptable);
    REQUIRE(result.tfdi.value == Approx(0.2275));
    REQUIRE(result.tfdi.rating == IndexRating::Acceptable);
    REQUIRE(result.ser.value == Approx(1.6));
    REQUIRE(result.ser.rating == IndexRating::Acceptable);

    REQUIRE(result.annual_manual_cost == Approx(52000.0));
    REQUIRE(result.automation_savings.has_value());
    REQUIRE(*result.automation_savings == Approx(31200.0));

    SECTION("no automation potential, no savings estimate") {
        CompositeInputs input = sample_inputs();
        input.friction.automation_potential.reset();
        REQUIRE_FALSE(calculate_composite_indices(input).automation_savings.has_value());
    }

    SECTION("any invalid block rejects the whole request") {
        CompositeInputs input = sample_inputs();
        input.efficiency.previous_revenue = 0.0;
        REQUIRE_THROWS_AS(calculate_composite_indices(input), ValidationError);
    }
}
