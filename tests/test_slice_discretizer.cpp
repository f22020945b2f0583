/**
 * @file test_slice_discretizer.cpp
 * @brief Tests for cutting the sliding mass into vertical slices
 */

#include <gtest/gtest.h>
#include "calculators/stability_core/slice_discretizer.h"
#include "calculators/stability_core/stability_errors.h"
#include <cmath>

class SliceDiscretizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.numSlices = 10;
    }

    TerrainProfile terrain{{{0.0, 12.0}, {25.0, 8.0}, {40.0, 0.0}}};
    SoilProfile soil = SoilProfile::homogeneous(15.0, 20.0, 19.0);
    FailureCircle circle{22.0, 2.67, 13.0};
    SliceOptions options;
};

TEST_F(SliceDiscretizerTest, ProducesOrderedValidSlices) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    std::vector<Slice> slices = discretizer.discretize(circle);

    ASSERT_EQ(slices.size(), 10u);
    for (size_t i = 0; i < slices.size(); ++i) {
        EXPECT_EQ(slices[i].index, static_cast<int>(i));
        EXPECT_GT(slices[i].width, 0.0);
        EXPECT_GT(slices[i].height, 0.0);
        EXPECT_GT(slices[i].weight, 0.0);
        EXPECT_LE(std::abs(slices[i].alpha), 80.0 * M_PI / 180.0);
        EXPECT_NEAR(slices[i].height, slices[i].ySurface - slices[i].yBase, 1e-12);
        EXPECT_DOUBLE_EQ(slices[i].porePressure, 0.0);
        if (i > 0) {
            EXPECT_GT(slices[i].xCenter, slices[i - 1].xCenter);
        }
    }

    // Effective range [9, 35]
    EXPECT_NEAR(slices.front().xLeft, 9.0, 1e-12);
    EXPECT_NEAR(slices.back().xRight, 35.0, 1e-12);
}

TEST_F(SliceDiscretizerTest, BaseAngleIsPositiveOnTheDownslopeSide) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    std::vector<Slice> slices = discretizer.discretize(circle);

    // Ground descends toward +x: slices left of the center push the mass downslope
    for (const auto& slice : slices) {
        if (slice.xCenter < circle.xc) {
            EXPECT_GT(slice.alpha, 0.0);
        } else {
            EXPECT_LT(slice.alpha, 0.0);
        }
    }
    EXPECT_NEAR(slices.front().alpha * 180.0 / M_PI, 64.16, 0.01);
    EXPECT_NEAR(slices.back().alpha * 180.0 / M_PI, -64.16, 0.01);
}

TEST_F(SliceDiscretizerTest, BaseAngleSignFollowsSlideDirection) {
    TerrainProfile rising = TerrainProfile::simpleSlope(8.0, 35.0);
    FailureCircle deep{13.656, 12.829, 12.914};
    SliceOptions searchOptions;
    SliceDiscretizer discretizer(rising, SoilProfile::homogeneous(25.0, 28.0, 19.0), std::nullopt, searchOptions);

    for (const auto& slice : discretizer.discretize(deep)) {
        if (slice.xCenter > deep.xc) {
            EXPECT_GT(slice.alpha, 0.0);
        } else {
            EXPECT_LT(slice.alpha, 0.0);
        }
    }
}

TEST_F(SliceDiscretizerTest, ArcLengthsCoverTheArc) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    double total = 0.0;
    for (const auto& slice : discretizer.discretize(circle)) {
        total += slice.arcLength;
    }
    // All ten slices are kept and span the full lower half circle
    EXPECT_NEAR(total, circle.radius * M_PI, 1e-9);
}

TEST_F(SliceDiscretizerTest, SteepBasesAreDroppedAndIndicesRenumbered) {
    // sin(alpha) runs 0.9, 0.7, 0.5 ... -0.9 across the ten columns
    options.maxBaseAngle = 40.0;
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    std::vector<Slice> slices = discretizer.discretize(circle);

    ASSERT_EQ(slices.size(), 6u);
    for (size_t i = 0; i < slices.size(); ++i) {
        EXPECT_EQ(slices[i].index, static_cast<int>(i));
        EXPECT_LE(std::abs(slices[i].alpha), 40.0 * M_PI / 180.0);
    }
    EXPECT_NEAR(slices.front().xLeft, 14.2, 1e-9);
    EXPECT_NEAR(slices.front().alpha * 180.0 / M_PI, 30.0, 0.01);
    EXPECT_NEAR(slices.back().xRight, 29.8, 1e-9);
    EXPECT_NEAR(slices.back().alpha * 180.0 / M_PI, -30.0, 0.01);
}

TEST_F(SliceDiscretizerTest, TooFewGentleBasesIsGeometryError) {
    options.maxBaseAngle = 40.0;
    options.minValidSlices = 7;
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    try {
        discretizer.discretize(circle);
        FAIL() << "Expected GeometryError";
    } catch (const GeometryError& e) {
        EXPECT_EQ(e.validSlices(), 6);
    }
}

TEST_F(SliceDiscretizerTest, DiscretizationIsRepeatable) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    std::vector<Slice> first = discretizer.discretize(circle);
    std::vector<Slice> second = discretizer.discretize(circle);
    EXPECT_TRUE(first == second);
}

TEST_F(SliceDiscretizerTest, CircleAboveTerrainIsGeometryError) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    try {
        discretizer.discretize({20.0, 40.0, 5.0});
        FAIL() << "Expected GeometryError";
    } catch (const GeometryError& e) {
        EXPECT_EQ(e.validSlices(), 0);
    }
}

TEST_F(SliceDiscretizerTest, CircleBesideTerrainIsGeometryError) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    EXPECT_THROW(discretizer.discretize({100.0, 5.0, 10.0}), GeometryError);
}

TEST_F(SliceDiscretizerTest, RejectsSliceCountOutOfRange) {
    options.numSlices = 4;
    EXPECT_THROW(SliceDiscretizer discretizer(terrain, soil, std::nullopt, options), ParameterError);
    options.numSlices = 501;
    EXPECT_THROW(SliceDiscretizer discretizer(terrain, soil, std::nullopt, options), ParameterError);
}

TEST_F(SliceDiscretizerTest, RejectsNonPositiveRadius) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    EXPECT_THROW(discretizer.discretize({22.0, 2.67, 0.0}), ParameterError);
}

TEST_F(SliceDiscretizerTest, BaseElevationUsesLowerArc) {
    FailureCircle unit{0.0, 10.0, 5.0};
    EXPECT_NEAR(*SliceDiscretizer::baseElevation(unit, 3.0), 6.0, 1e-12);
    EXPECT_NEAR(*SliceDiscretizer::baseElevation(unit, 0.0), 5.0, 1e-12);
    EXPECT_FALSE(SliceDiscretizer::baseElevation(unit, 6.0).has_value());
}

// ============================================================================
// Layered soil and pore pressure
// ============================================================================

class LayeredSliceTest : public ::testing::Test {
protected:
    TerrainProfile terrain = TerrainProfile::simpleSlope(8.0, 35.0);
    SoilProfile soil{{SoilLayer{"Sand", 10.0, 25.0, 18.0, 20.0, 4.0},
                      SoilLayer{"Clay", 20.0, 18.0, 19.0, 21.0, std::nullopt}}};
    WaterTable water = WaterTable::horizontal(3.0, terrain);
    FailureCircle circle{13.656, 12.829, 12.914};
    SliceOptions options;
};

TEST_F(LayeredSliceTest, PorePressureFromWaterHead) {
    SliceDiscretizer discretizer(terrain, soil, water, options);
    std::vector<Slice> slices = discretizer.discretize(circle);

    bool anyWet = false;
    for (const auto& slice : slices) {
        double expected = std::max(0.0, 3.0 - slice.yBase) * 9.81;
        EXPECT_NEAR(slice.porePressure, expected, 1e-9);
        anyWet = anyWet || slice.porePressure > 0.0;
    }
    EXPECT_TRUE(anyWet);
}

TEST_F(LayeredSliceTest, BaseStrengthComesFromLayerAtTheBase) {
    SliceDiscretizer discretizer(terrain, soil, water, options);
    std::vector<Slice> slices = discretizer.discretize(circle);

    int inSand = 0;
    int inClay = 0;
    for (const auto& slice : slices) {
        if (slice.yBase > 4.0) {
            EXPECT_DOUBLE_EQ(slice.cohesion, 10.0);
            EXPECT_DOUBLE_EQ(slice.frictionAngle, 25.0);
            inSand++;
        } else {
            EXPECT_DOUBLE_EQ(slice.cohesion, 20.0);
            EXPECT_DOUBLE_EQ(slice.frictionAngle, 18.0);
            inClay++;
        }
    }
    EXPECT_GT(inSand, 0);
    EXPECT_GT(inClay, 0);
}

TEST_F(LayeredSliceTest, WeightMatchesColumnOfLayers) {
    SliceDiscretizer discretizer(terrain, soil, water, options);
    for (const auto& slice : discretizer.discretize(circle)) {
        double expected = soil.columnWeight(slice.yBase, slice.ySurface, slice.width,
                                            water.elevationAt(slice.xCenter));
        EXPECT_DOUBLE_EQ(slice.weight, expected);
    }
}

TEST_F(LayeredSliceTest, NoWaterMeansNoPorePressure) {
    SliceDiscretizer discretizer(terrain, soil, std::nullopt, options);
    for (const auto& slice : discretizer.discretize(circle)) {
        EXPECT_DOUBLE_EQ(slice.porePressure, 0.0);
    }
}
