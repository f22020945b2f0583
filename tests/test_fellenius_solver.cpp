/**
 * @file test_fellenius_solver.cpp
 * @brief Ordinary method of slices
 */

#include <gtest/gtest.h>
#include "calculators/limit_equilibrium/fellenius_solver.h"
#include "calculators/stability_core/slice_discretizer.h"
#include "calculators/stability_core/stability_errors.h"
#include <cmath>

namespace {

Slice makeSlice(int index, double alphaDegrees, double weight, double width,
                double porePressure, double cohesion, double frictionAngle) {
    double alpha = alphaDegrees * M_PI / 180.0;
    Slice slice;
    slice.index = index;
    slice.xLeft = index * width;
    slice.xRight = slice.xLeft + width;
    slice.xCenter = slice.xLeft + 0.5 * width;
    slice.width = width;
    slice.yBase = 0.0;
    slice.ySurface = 1.0;
    slice.height = 1.0;
    slice.alpha = alpha;
    slice.arcLength = width / std::cos(alpha);
    slice.weight = weight;
    slice.porePressure = porePressure;
    slice.cohesion = cohesion;
    slice.frictionAngle = frictionAngle;
    return slice;
}

}

class FelleniusSolverTest : public ::testing::Test {
protected:
    std::vector<Slice> scenarioSlices() const {
        TerrainProfile terrain({{0.0, 12.0}, {25.0, 8.0}, {40.0, 0.0}});
        SliceOptions options;
        options.numSlices = 10;
        SliceDiscretizer discretizer(terrain, SoilProfile::homogeneous(15.0, 20.0, 19.0), std::nullopt, options);
        return discretizer.discretize({22.0, 2.67, 13.0});
    }
};

TEST_F(FelleniusSolverTest, HandComputedTwoSlices) {
    std::vector<Slice> slices = {makeSlice(0, 30.0, 100.0, 2.0, 0.0, 10.0, 30.0),
                                 makeSlice(1, 10.0, 80.0, 2.0, 5.0, 10.0, 30.0)};

    AnalysisResult result = FelleniusSolver(slices).solve();

    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.method, AnalysisMethod::Fellenius);
    EXPECT_NEAR(*result.factorOfSafety, 2.08205, 1e-4);
    ASSERT_EQ(result.slices.size(), 2u);
    EXPECT_NEAR(result.slices[0].drivingForce + result.slices[1].drivingForce, 63.8919, 1e-3);
    EXPECT_FALSE(result.slices[0].mAlpha.has_value());
}

TEST_F(FelleniusSolverTest, ConcreteScenario) {
    AnalysisResult result = FelleniusSolver(scenarioSlices()).solve();

    ASSERT_TRUE(result.factorOfSafety.has_value());
    EXPECT_TRUE(std::isfinite(*result.factorOfSafety));
    EXPECT_GT(*result.factorOfSafety, 0.0);
    EXPECT_NEAR(*result.factorOfSafety, 4.8813, 1e-3);

    double driving = 0.0;
    for (const auto& slice : result.slices) {
        driving += slice.drivingForce;
    }
    EXPECT_NEAR(driving, 599.49, 0.01);
}

TEST_F(FelleniusSolverTest, NegativeNormalForceIsClippedAndFlagged) {
    // Pore pressure large enough to lift the slice
    std::vector<Slice> slices = {makeSlice(0, 30.0, 100.0, 2.0, 0.0, 10.0, 30.0),
                                 makeSlice(1, 20.0, 50.0, 2.0, 100.0, 10.0, 30.0)};

    AnalysisResult result = FelleniusSolver(slices).solve();

    EXPECT_FALSE(result.slices[0].inTension);
    EXPECT_TRUE(result.slices[1].inTension);
    EXPECT_NEAR(result.slices[1].resistingForce, 10.0 * slices[1].arcLength, 1e-9);
}

TEST_F(FelleniusSolverTest, NonPositiveDrivingSumIsRejected) {
    std::vector<Slice> slices = {makeSlice(0, -20.0, 100.0, 2.0, 0.0, 10.0, 30.0),
                                 makeSlice(1, -5.0, 80.0, 2.0, 0.0, 10.0, 30.0)};

    try {
        FelleniusSolver(slices).solve();
        FAIL() << "Expected InvalidSlipSurfaceError";
    } catch (const InvalidSlipSurfaceError& e) {
        EXPECT_LT(e.drivingSum(), 0.0);
    }
}

TEST_F(FelleniusSolverTest, NoShearResistanceIsParameterError) {
    // Cohesionless soil with pore pressure above the normal stress on every base
    std::vector<Slice> slices = {makeSlice(0, 30.0, 100.0, 2.0, 100.0, 0.0, 30.0),
                                 makeSlice(1, 10.0, 80.0, 2.0, 100.0, 0.0, 30.0)};

    try {
        FelleniusSolver(slices).solve();
        FAIL() << "Expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "shear_resistance");
        EXPECT_DOUBLE_EQ(e.value(), 0.0);
    }
}

TEST_F(FelleniusSolverTest, ArcOnTheWrongSideOfTheCenterIsRejected) {
    // Ground descends toward +x but the whole arc lies right of the center
    TerrainProfile terrain({{0.0, 10.0}, {40.0, 0.0}});
    SliceOptions options;
    options.numSlices = 10;
    SliceDiscretizer discretizer(terrain, SoilProfile::homogeneous(10.0, 20.0, 18.0), std::nullopt, options);
    std::vector<Slice> slices = discretizer.discretize({0.0, 14.0, 12.0});

    EXPECT_THROW(FelleniusSolver(slices).solve(), InvalidSlipSurfaceError);
}
