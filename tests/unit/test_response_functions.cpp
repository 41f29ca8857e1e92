/**
 * @file test_response_functions.cpp
 * @brief Unit tests for light, temperature, CO2, canopy and partition responses
 */

#include <gtest/gtest.h>

#include "ResponseFunctions.hpp"

#include <cmath>

using namespace TuberSim;

TEST(ResponseFunctionsTest, DailyLightIntegralIsExactConversion) {
    EXPECT_NEAR(Response::dailyLightIntegral(350.0, 12.0), 15.12, 1e-12);
    EXPECT_DOUBLE_EQ(Response::dailyLightIntegral(0.0, 16.0), 0.0);
    EXPECT_DOUBLE_EQ(Response::dailyLightIntegral(500.0, 0.0), 0.0);
    EXPECT_NEAR(Response::dailyLightIntegral(1000.0, 24.0), 86.4, 1e-12);
}

TEST(ResponseFunctionsTest, ParEnergyUsesFixedPhotonEnergy) {
    EXPECT_NEAR(Response::parEnergyMJ(1.0), 0.219, 1e-15);
    EXPECT_NEAR(Response::parEnergyMJ(15.12), 15.12 * 0.219, 1e-12);
}

TEST(ResponseFunctionsTest, TemperatureModifierIsTriangular) {
    const double base = 7.0, opt = 18.0, max_t = 30.0;

    EXPECT_DOUBLE_EQ(Response::temperatureModifier(base, base, opt, max_t), 0.0);
    EXPECT_DOUBLE_EQ(Response::temperatureModifier(max_t, base, opt, max_t), 0.0);
    EXPECT_DOUBLE_EQ(Response::temperatureModifier(-5.0, base, opt, max_t), 0.0);
    EXPECT_DOUBLE_EQ(Response::temperatureModifier(45.0, base, opt, max_t), 0.0);
    EXPECT_DOUBLE_EQ(Response::temperatureModifier(opt, base, opt, max_t), 1.0);

    EXPECT_NEAR(Response::temperatureModifier(12.5, base, opt, max_t), 0.5, 1e-12);
    EXPECT_NEAR(Response::temperatureModifier(24.0, base, opt, max_t), 0.5, 1e-12);
}

TEST(ResponseFunctionsTest, TemperatureModifierMonotoneOnEachSide) {
    const double base = 7.0, opt = 18.0, max_t = 30.0;

    double prev = 0.0;
    for (double T = base + 0.1; T < opt; T += 0.1) {
        double f = Response::temperatureModifier(T, base, opt, max_t);
        EXPECT_GT(f, prev) << "T = " << T;
        EXPECT_GE(f, 0.0);
        EXPECT_LE(f, 1.0);
        prev = f;
    }

    prev = 1.0;
    for (double T = opt + 0.1; T < max_t; T += 0.1) {
        double f = Response::temperatureModifier(T, base, opt, max_t);
        EXPECT_LT(f, prev) << "T = " << T;
        EXPECT_GE(f, 0.0);
        prev = f;
    }
}

TEST(ResponseFunctionsTest, Co2ModifierReferencePoints) {
    EXPECT_DOUBLE_EQ(Response::co2Modifier(0.0, 400.0, 1200.0), 0.0);
    EXPECT_DOUBLE_EQ(Response::co2Modifier(-50.0, 400.0, 1200.0), 0.0);

    EXPECT_DOUBLE_EQ(Response::co2Modifier(400.0, 400.0, 1200.0), 0.5);
    // Below the reference the response floors at 0.5
    EXPECT_DOUBLE_EQ(Response::co2Modifier(200.0, 400.0, 1200.0), 0.5);

    EXPECT_NEAR(Response::co2Modifier(800.0, 400.0, 1200.0), 0.75, 1e-9);
    EXPECT_NEAR(Response::co2Modifier(1200.0, 400.0, 1200.0), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(Response::co2Modifier(2000.0, 400.0, 1200.0), 1.0);
}

TEST(ResponseFunctionsTest, CanopyInterceptionBeerLambert) {
    GrowthParameters gp;

    EXPECT_DOUBLE_EQ(Response::canopyInterception(0.0, gp, 1.0), 0.0);

    // 50 g leaf * 0.02 m2/g over 1 m2 -> LAI 1
    EXPECT_NEAR(Response::leafAreaIndex(50.0, gp.SLA_m2_per_g_dry, 1.0), 1.0, 1e-12);
    EXPECT_NEAR(Response::canopyInterception(50.0, gp, 1.0), 1.0 - std::exp(-0.65), 1e-12);

    // Halving the area doubles LAI
    EXPECT_NEAR(Response::canopyInterception(50.0, gp, 0.5), 1.0 - std::exp(-1.3), 1e-12);

    EXPECT_NEAR(Response::canopyInterception(1.0e6, gp, 1.0), 1.0, 1e-12);
}

TEST(ResponseFunctionsTest, CanopyInterceptionMonotoneInLeafMass) {
    GrowthParameters gp;
    double prev = Response::canopyInterception(0.0, gp, 1.0);
    for (double leaf = 1.0; leaf < 2000.0; leaf *= 1.5) {
        double f = Response::canopyInterception(leaf, gp, 1.0);
        EXPECT_GE(f, prev);
        EXPECT_LE(f, 1.0);
        prev = f;
    }
}

TEST(ResponseFunctionsTest, CanopyInterceptionZeroAreaStaysFinite) {
    GrowthParameters gp;
    double f = Response::canopyInterception(10.0, gp, 0.0);
    EXPECT_TRUE(std::isfinite(f));
    EXPECT_NEAR(f, 1.0, 1e-12);
}

TEST(ResponseFunctionsTest, TuberPartitionStepsAtInitiation) {
    GrowthParameters gp;

    // Long days: no photoperiod bonus
    EXPECT_DOUBLE_EQ(Response::tuberPartitionFraction(0.0, 16.0, gp), 0.05);
    EXPECT_DOUBLE_EQ(Response::tuberPartitionFraction(gp.tt_tuber_init - 1e-6, 16.0, gp), 0.05);
    EXPECT_DOUBLE_EQ(Response::tuberPartitionFraction(gp.tt_tuber_init, 16.0, gp), 0.4);
    EXPECT_DOUBLE_EQ(Response::tuberPartitionFraction(2000.0, 20.0, gp), 0.4);
}

TEST(ResponseFunctionsTest, TuberPartitionPhotoperiodBonus) {
    GrowthParameters gp;

    // 12 h: (16 - 12) / 6 * 0.5 = 1/3
    EXPECT_NEAR(Response::tuberPartitionFraction(0.0, 12.0, gp), 0.05 + 0.5 * 4.0 / 6.0, 1e-12);
    EXPECT_NEAR(Response::tuberPartitionFraction(400.0, 12.0, gp), 0.4 + 0.5 * 4.0 / 6.0, 1e-12);

    // 10 h or shorter: full bonus, clamped at 0.9 after initiation
    EXPECT_NEAR(Response::tuberPartitionFraction(0.0, 10.0, gp), 0.55, 1e-12);
    EXPECT_DOUBLE_EQ(Response::tuberPartitionFraction(400.0, 8.0, gp), 0.9);
}

TEST(ResponseFunctionsTest, LeafBiasShiftsAtInitiation) {
    GrowthParameters gp;
    EXPECT_DOUBLE_EQ(Response::leafBias(0.0, gp), 0.7);
    EXPECT_DOUBLE_EQ(Response::leafBias(gp.tt_tuber_init, gp), 0.5);
}

TEST(ResponseFunctionsTest, ThermalTimeIncrementNeverNegative) {
    EXPECT_DOUBLE_EQ(Response::thermalTimeIncrement(18.0, 7.0), 11.0);
    EXPECT_DOUBLE_EQ(Response::thermalTimeIncrement(7.0, 7.0), 0.0);
    EXPECT_DOUBLE_EQ(Response::thermalTimeIncrement(2.0, 7.0), 0.0);
}

TEST(ResponseFunctionsTest, PhenologyStageBoundaries) {
    GrowthParameters gp;
    EXPECT_EQ(Response::phenologyStage(0.0, gp), PhenologyStage::PRE_EMERGENCE);
    EXPECT_EQ(Response::phenologyStage(gp.tt_emergence, gp), PhenologyStage::VEGETATIVE);
    EXPECT_EQ(Response::phenologyStage(gp.tt_tuber_init, gp), PhenologyStage::TUBER_BULKING);
    EXPECT_EQ(Response::phenologyStage(gp.tt_maturity + 1.0, gp), PhenologyStage::MATURE);
}
