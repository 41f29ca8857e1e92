/**
 * @file test_growth_model.cpp
 * @brief Unit tests for the daily crop and chamber integration
 */

#include <gtest/gtest.h>

#include "GrowthModel.hpp"
#include "ResponseFunctions.hpp"

#include <cmath>
#include <stdexcept>

using namespace TuberSim;

namespace {

// Chamber without electrical load below a warmer room: stays at the setpoint
ChamberParameters heldChamber() {
    ChamberParameters cp;
    cp.led_power_W = 0.0;
    cp.other_power_W = 0.0;
    cp.ambient_temp_C = 20.0;
    return cp;
}

void expectInvariants(const SimulationResult& res, int days) {
    const std::size_t n = static_cast<std::size_t>(days) + 1;
    ASSERT_EQ(res.numSamples(), n);
    for (const auto& name : SimulationResult::seriesNames()) {
        ASSERT_EQ(res.series(name).size(), n) << name;
    }

    for (std::size_t i = 0; i < n; ++i) {
        EXPECT_GE(res.leaf_dry_g[i], 0.0);
        EXPECT_GE(res.stem_dry_g[i], 0.0);
        EXPECT_GE(res.tuber_dry_g[i], 0.0);
        EXPECT_GE(res.total_dry_g[i], 0.0);
        EXPECT_TRUE(std::isfinite(res.total_dry_g[i]));
        if (i > 0) {
            EXPECT_GE(res.thermal_time[i], res.thermal_time[i - 1]);
        }
    }
}

}  // namespace

TEST(GrowthModelTest, ZeroDaysReturnsInitialConditions) {
    ScenarioInput scn;
    scn.days = 0;
    scn.initial_leaf_dry_g = 2.5;
    scn.target_chamber_temp_C = 16.0;

    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn);

    ASSERT_EQ(res.numSamples(), 1u);
    EXPECT_DOUBLE_EQ(res.days[0], 0.0);
    EXPECT_DOUBLE_EQ(res.leaf_dry_g[0], 2.5);
    EXPECT_DOUBLE_EQ(res.stem_dry_g[0], 0.0);
    EXPECT_DOUBLE_EQ(res.tuber_dry_g[0], 0.0);
    EXPECT_DOUBLE_EQ(res.tuber_fresh_g[0], 0.0);
    EXPECT_DOUBLE_EQ(res.fresh_total_g[0], 2.5 / 0.2);
    EXPECT_DOUBLE_EQ(res.chamber_temp_C[0], 16.0);
    EXPECT_DOUBLE_EQ(res.thermal_time[0], 0.0);
    EXPECT_DOUBLE_EQ(res.cum_energy_kWh[0], 0.0);
}

TEST(GrowthModelTest, NegativeDaysThrows) {
    ScenarioInput scn;
    scn.days = -1;
    PotatoGrowthModel model;
    EXPECT_THROW(model.simulate(scn), std::invalid_argument);
}

TEST(GrowthModelTest, DefaultScenarioLightAndFirstChamberStep) {
    ScenarioInput scn;   // 90 days, 350 umol/m2/s, 12 h, 800 ppm, 18 degC
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, GrowthParameters(), ChamberParameters());

    expectInvariants(res, 90);
    EXPECT_NEAR(res.dli_mol_m2_d, 15.12, 1e-12);

    // 480 W of heat into 1200 kJ/K with no loss or cooling at 18 degC
    EXPECT_DOUBLE_EQ(res.chamber_temp_C[0], 18.0);
    EXPECT_NEAR(res.chamber_temp_C[1], 18.0 + 41472.0 / 1200.0, 1e-9);
}

TEST(GrowthModelTest, FirstDayMatchesHandCalculation) {
    ScenarioInput scn;
    scn.days = 1;
    GrowthParameters gp;
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, gp, heldChamber());

    const double par = 15.12 * 0.219;
    const double fI = 1.0 - std::exp(-0.65 * 0.02);
    const double gross = 1.3 * par * fI * 1.0 * Response::co2Modifier(800.0, 400.0, 1200.0);
    const double net = gross - 0.003 * 1.0;
    const double f_tuber = 0.05 + 0.5 * 4.0 / 6.0;

    EXPECT_NEAR(res.tuber_dry_g[1], net * f_tuber, 1e-12);
    EXPECT_NEAR(res.leaf_dry_g[1], 1.0 + net * (1.0 - f_tuber) * 0.7, 1e-12);
    EXPECT_NEAR(res.stem_dry_g[1], net * (1.0 - f_tuber) * 0.3, 1e-12);
    EXPECT_DOUBLE_EQ(res.thermal_time[1], 11.0);
    EXPECT_DOUBLE_EQ(res.chamber_temp_C[1], 18.0);
}

TEST(GrowthModelTest, DayUpdateReadsOnlyCurrentThermalTime) {
    GrowthParameters gp;
    gp.tt_tuber_init = 11.0;     // reached at the end of the first day at 18 degC

    ScenarioInput scn;
    scn.photoperiod_h = 16.0;    // no photoperiod bonus

    PotatoGrowthModel model;
    ChamberThermalModel chamber(heldChamber());

    PotatoGrowthModel::DaySnapshot today{1.0, 0.0, 0.0, 18.0, 0.0, 0.0};
    auto inc = model.advanceDay(today, scn, gp, chamber, 5.0, 0.0, 0.0);

    EXPECT_DOUBLE_EQ(inc.thermal_time, 11.0);
    EXPECT_DOUBLE_EQ(inc.tuber_fraction, 0.05);
    EXPECT_GT(inc.net_dry_g, 0.0);
    EXPECT_NEAR(inc.leaf_dry_g - 1.0, inc.net_dry_g * 0.95 * 0.7, 1e-12);

    // The following day sees the new thermal time
    PotatoGrowthModel::DaySnapshot tomorrow{inc.leaf_dry_g, inc.stem_dry_g, inc.tuber_dry_g,
                                            inc.chamber_temp_C, inc.thermal_time, inc.cum_energy_kWh};
    auto inc2 = model.advanceDay(tomorrow, scn, gp, chamber, 5.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(inc2.tuber_fraction, 0.4);
}

TEST(GrowthModelTest, TemperatureFactorUsesCurrentChamberTemperature) {
    ScenarioInput scn;
    scn.days = 1;
    PotatoGrowthModel model;

    // Day 0 is at the 18 degC optimum even though day 1 is 52.56 degC
    SimulationResult res = model.simulate(scn, GrowthParameters(), ChamberParameters());
    EXPECT_GT(res.tuber_dry_g[1], 0.0);
    EXPECT_DOUBLE_EQ(res.thermal_time[1], 11.0);
}

TEST(GrowthModelTest, PhotoperiodSixteenHoursAllocatesBaseFractionOnly) {
    ScenarioInput scn;
    scn.days = 1;
    scn.photoperiod_h = 16.0;
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, GrowthParameters(), heldChamber());

    const double grown = res.total_dry_g[1] - res.total_dry_g[0];
    ASSERT_GT(grown, 0.0);
    EXPECT_NEAR(res.tuber_dry_g[1] / grown, 0.05, 1e-12);
}

TEST(GrowthModelTest, RespirationNeverShrinksBiomass) {
    ScenarioInput scn;
    scn.days = 30;
    scn.ppfd_umol_m2_s = 0.0;
    scn.initial_leaf_dry_g = 5.0;

    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, GrowthParameters(), heldChamber());

    expectInvariants(res, 30);
    for (std::size_t i = 0; i < res.numSamples(); ++i) {
        EXPECT_DOUBLE_EQ(res.leaf_dry_g[i], 5.0);
        EXPECT_DOUBLE_EQ(res.tuber_dry_g[i], 0.0);
    }
}

TEST(GrowthModelTest, EnergyIsLinearInDayIndex) {
    ScenarioInput scn;
    scn.days = 120;
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, GrowthParameters(), ChamberParameters());

    const double per_day = 0.4 * 12.0 + 0.08 * 24.0;
    for (std::size_t i = 1; i < res.numSamples(); ++i) {
        EXPECT_GT(res.cum_energy_kWh[i], res.cum_energy_kWh[i - 1]);
        EXPECT_NEAR(res.cum_energy_kWh[i], per_day * static_cast<double>(i), 1e-9);
    }

    // Independent of the thermal and crop state
    SimulationResult held = model.simulate(scn, GrowthParameters(), [] {
        ChamberParameters cp;
        cp.cooling_capacity_kJ_per_day = 0.0;
        cp.ambient_temp_C = 35.0;
        return cp;
    }());
    EXPECT_EQ(held.cum_energy_kWh, res.cum_energy_kWh);
}

TEST(GrowthModelTest, EnergyAccumulatesLedThenContinuousLoad) {
    ScenarioInput scn;
    scn.days = 365;
    scn.photoperiod_h = 13.7;
    ChamberParameters cp;
    cp.led_power_W = 437.3;
    cp.other_power_W = 61.9;

    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, GrowthParameters(), cp);

    const double led = 437.3 * 13.7 / 1000.0;
    const double other = 61.9 * 24.0 / 1000.0;
    double expected = 0.0;
    for (std::size_t i = 1; i < res.numSamples(); ++i) {
        expected = expected + led + other;
        EXPECT_EQ(res.cum_energy_kWh[i], expected) << "day " << i;
    }
}

TEST(GrowthModelTest, FreshMassConversions) {
    ScenarioInput scn;
    scn.days = 60;
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, GrowthParameters(), heldChamber());

    for (std::size_t i = 0; i < res.numSamples(); ++i) {
        const double total = res.leaf_dry_g[i] + res.stem_dry_g[i] + res.tuber_dry_g[i];
        EXPECT_DOUBLE_EQ(res.total_dry_g[i], total);
        EXPECT_DOUBLE_EQ(res.fresh_total_g[i], total / 0.2);
        EXPECT_DOUBLE_EQ(res.tuber_fresh_g[i], res.tuber_dry_g[i] / 0.22);
    }
    EXPECT_GT(res.tuber_fresh_g.back(), 0.0);
}

TEST(GrowthModelTest, RepeatedRunsAreBitIdentical) {
    ScenarioInput scn;
    GrowthParameters gp;
    ChamberParameters cp;
    PotatoGrowthModel model;

    SimulationResult a = model.simulate(scn, gp, cp);
    SimulationResult b = model.simulate(scn, gp, cp);

    for (const auto& name : SimulationResult::seriesNames()) {
        EXPECT_EQ(a.series(name), b.series(name)) << name;
    }
    EXPECT_EQ(a.dli_mol_m2_d, b.dli_mol_m2_d);
}

TEST(GrowthModelTest, InvariantsHoldAcrossScenarios) {
    PotatoGrowthModel model;
    const double photoperiods[] = {0.0, 10.0, 16.0, 24.0};
    const double ppfds[] = {0.0, 350.0, 800.0};
    const double targets[] = {5.0, 18.0, 28.0};

    for (double photo : photoperiods) {
        for (double ppfd : ppfds) {
            for (double target : targets) {
                ScenarioInput scn;
                scn.days = 150;
                scn.photoperiod_h = photo;
                scn.ppfd_umol_m2_s = ppfd;
                scn.target_chamber_temp_C = target;

                SimulationResult res = model.simulate(scn);
                SCOPED_TRACE("photoperiod " + std::to_string(photo) + ", ppfd " +
                             std::to_string(ppfd) + ", target " + std::to_string(target));
                expectInvariants(res, 150);
            }
        }
    }
}

TEST(GrowthModelTest, SeriesLookupByName) {
    ScenarioInput scn;
    scn.days = 5;
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn);

    EXPECT_EQ(&res.series("tuber_fresh_g"), &res.tuber_fresh_g);
    EXPECT_EQ(&res.series("cum_energy_kWh"), &res.cum_energy_kWh);
    EXPECT_EQ(res.series("days").back(), 5.0);
    EXPECT_THROW(res.series("yield"), std::out_of_range);
}

TEST(GrowthModelTest, SummaryReportsPhenologyDays) {
    ScenarioInput scn;     // 90 days held at 18 degC: 11 degC-day per day
    GrowthParameters gp;
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, gp, heldChamber());

    RunSummary s = summarize(res, gp);
    EXPECT_EQ(s.days, 90);
    EXPECT_EQ(s.emergence_day, 11);
    EXPECT_EQ(s.tuber_init_day, 32);
    EXPECT_EQ(s.maturity_day, -1);
    EXPECT_EQ(s.final_stage, PhenologyStage::TUBER_BULKING);
    EXPECT_DOUBLE_EQ(s.final_thermal_time, 990.0);
    EXPECT_DOUBLE_EQ(s.final_tuber_fresh_g, res.tuber_fresh_g.back());
    EXPECT_DOUBLE_EQ(s.peak_chamber_temp_C, 18.0);

    // No electrical load, so no yield per kWh
    EXPECT_DOUBLE_EQ(s.total_energy_kWh, 0.0);
    EXPECT_DOUBLE_EQ(s.tuber_fresh_g_per_kWh, 0.0);
}

TEST(GrowthModelTest, TubersGrowFasterAfterInitiation) {
    ScenarioInput scn;
    scn.photoperiod_h = 16.0;
    GrowthParameters gp;
    PotatoGrowthModel model;
    SimulationResult res = model.simulate(scn, gp, heldChamber());

    // Day 31 (tt 341) allocates 5 %, day 32 (tt 352) allocates 40 %
    const double grown31 = res.total_dry_g[32] - res.total_dry_g[31];
    const double grown32 = res.total_dry_g[33] - res.total_dry_g[32];
    ASSERT_GT(grown31, 0.0);
    ASSERT_GT(grown32, 0.0);
    EXPECT_NEAR((res.tuber_dry_g[32] - res.tuber_dry_g[31]) / grown31, 0.05, 1e-9);
    EXPECT_NEAR((res.tuber_dry_g[33] - res.tuber_dry_g[32]) / grown32, 0.4, 1e-9);
}
