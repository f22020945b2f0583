/**
 * @file test_input_validator.cpp
 * @brief Range checks on soil, geometry and configuration inputs
 */

#include <gtest/gtest.h>
#include "calculators/stability_core/circle_constraints.h"
#include "calculators/stability_core/circle_search.h"
#include "utils/file_readers.h"
#include "utils/validation/input_validator.h"
#include "utils/validation/result_validator.h"

class InputValidatorTest : public ::testing::Test {
protected:
    SoilLayer clay() const {
        return SoilLayer{"Clay", 15.0, 20.0, 19.0, std::nullopt, std::nullopt};
    }
};

// ============================================================================
// Soil layers
// ============================================================================

TEST_F(InputValidatorTest, AcceptsPlausibleLayer) {
    EXPECT_NO_THROW(InputValidator::validateSoilLayer(clay()));
}

TEST_F(InputValidatorTest, RejectsNegativeCohesion) {
    SoilLayer layer = clay();
    layer.cohesion = -1.0;
    EXPECT_THROW(InputValidator::validateSoilLayer(layer), ParameterError);
}

TEST_F(InputValidatorTest, FrictionAngleErrorCarriesNameAndValue) {
    SoilLayer layer = clay();
    layer.frictionAngle = 50.0;
    try {
        InputValidator::validateSoilLayer(layer);
        FAIL() << "Expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "friction_angle");
        EXPECT_DOUBLE_EQ(e.value(), 50.0);
    }
}

TEST_F(InputValidatorTest, RejectsNonPositiveUnitWeight) {
    SoilLayer layer = clay();
    layer.unitWeight = 0.0;
    EXPECT_THROW(InputValidator::validateSoilLayer(layer), ParameterError);
}

TEST_F(InputValidatorTest, SaturatedWeightMustExceedUnitWeight) {
    SoilLayer layer = clay();
    layer.saturatedUnitWeight = 19.0;
    EXPECT_THROW(InputValidator::validateSoilLayer(layer), ParameterError);
    layer.saturatedUnitWeight = 20.5;
    EXPECT_NO_THROW(InputValidator::validateSoilLayer(layer));
}

TEST_F(InputValidatorTest, RejectsLayerWithoutShearStrength) {
    SoilLayer layer = clay();
    layer.cohesion = 0.0;
    layer.frictionAngle = 0.0;
    EXPECT_THROW(InputValidator::validateSoilLayer(layer), ParameterError);
}

TEST_F(InputValidatorTest, StackNeedsDecreasingBottoms) {
    SoilLayer top = clay();
    SoilLayer bottom = clay();

    EXPECT_THROW(InputValidator::validateSoilLayers({}), ParameterError);

    // Only the last layer may be unbounded
    EXPECT_THROW(InputValidator::validateSoilLayers({top, bottom}), ParameterError);

    top.bottomElevation = 4.0;
    bottom.bottomElevation = 6.0;
    EXPECT_THROW(InputValidator::validateSoilLayers({top, bottom}), ParameterError);

    bottom.bottomElevation = std::nullopt;
    EXPECT_NO_THROW(InputValidator::validateSoilLayers({top, bottom}));
}

// ============================================================================
// Geometry and options
// ============================================================================

TEST_F(InputValidatorTest, CircleNeedsPositiveRadius) {
    EXPECT_THROW(InputValidator::validateCircle({10.0, 5.0, 0.0}), ParameterError);
    EXPECT_THROW(InputValidator::validateCircle({10.0, 5.0, -3.0}), ParameterError);
    EXPECT_NO_THROW(InputValidator::validateCircle({10.0, 5.0, 3.0}));
}

TEST_F(InputValidatorTest, SliceCountLimits) {
    SliceOptions options;
    options.numSlices = 4;
    EXPECT_THROW(InputValidator::validateSliceOptions(options), ParameterError);
    options.numSlices = 501;
    EXPECT_THROW(InputValidator::validateSliceOptions(options), ParameterError);
    options.numSlices = 5;
    EXPECT_NO_THROW(InputValidator::validateSliceOptions(options));
    options.numSlices = 500;
    EXPECT_NO_THROW(InputValidator::validateSliceOptions(options));
}

TEST_F(InputValidatorTest, BishopOptions) {
    BishopOptions options;
    EXPECT_NO_THROW(InputValidator::validateBishopOptions(options));
    options.tolerance = 0.0;
    EXPECT_THROW(InputValidator::validateBishopOptions(options), ParameterError);
    options.tolerance = 0.001;
    options.maxIterations = 0;
    EXPECT_THROW(InputValidator::validateBishopOptions(options), ParameterError);
}

TEST_F(InputValidatorTest, ConstraintFactorsMustBeOrdered) {
    EXPECT_NO_THROW(InputValidator::validateConstraintFactors({0.5, 0.3, 2.0, 0.8, 2.5}));
    EXPECT_THROW(InputValidator::validateConstraintFactors({0.5, 2.0, 0.3, 0.8, 2.5}), ParameterError);
    EXPECT_THROW(InputValidator::validateConstraintFactors({0.5, 0.3, 2.0, 2.5, 0.8}), ParameterError);
    EXPECT_THROW(InputValidator::validateConstraintFactors({-0.1, 0.3, 2.0, 0.8, 2.5}), ParameterError);
}

TEST_F(InputValidatorTest, SearchConfigBudgets) {
    SearchConfig config;
    EXPECT_NO_THROW(InputValidator::validateSearchConfig(config));

    config.gridPoints = 1;
    EXPECT_THROW(InputValidator::validateSearchConfig(config), ParameterError);
    config.gridPoints = 8;

    config.mutationRate = 1.5;
    EXPECT_THROW(InputValidator::validateSearchConfig(config), ParameterError);
    config.mutationRate = 0.2;

    config.hintCircles.push_back({1.0, 2.0, -1.0});
    EXPECT_THROW(InputValidator::validateSearchConfig(config), ParameterError);
}

TEST_F(InputValidatorTest, ManualModeNeedsCircle) {
    AnalysisProperties properties;
    properties.mode = AnalysisMode::Manual;
    EXPECT_THROW(InputValidator::validateAnalysisProperties(properties), ParameterError);

    properties.circle = FailureCircle{22.0, 2.67, 13.0};
    EXPECT_NO_THROW(InputValidator::validateAnalysisProperties(properties));

    properties.mode = AnalysisMode::Search;
    properties.circle.reset();
    EXPECT_NO_THROW(InputValidator::validateAnalysisProperties(properties));
}

// ============================================================================
// Result plausibility
// ============================================================================

TEST_F(InputValidatorTest, FactorOfSafetyClassification) {
    EXPECT_EQ(ResultValidator::classifyFactorOfSafety(0.9), "unstable");
    EXPECT_EQ(ResultValidator::classifyFactorOfSafety(1.1), "marginal");
    EXPECT_EQ(ResultValidator::classifyFactorOfSafety(1.3), "stable");
    EXPECT_EQ(ResultValidator::classifyFactorOfSafety(1.5), "very stable");

    EXPECT_TRUE(ResultValidator::checkFactorOfSafety(2.0).empty());
    EXPECT_EQ(ResultValidator::checkFactorOfSafety(12.0).size(), 1u);
    EXPECT_EQ(ResultValidator::checkFactorOfSafety(0.8).size(), 1u);
}

TEST_F(InputValidatorTest, MethodAgreementSpread) {
    MethodAgreement close = ResultValidator::compareMethods(2.0, 2.2);
    EXPECT_TRUE(close.withinTypicalSpread);
    EXPECT_NEAR(close.ratio, 1.1, 1e-12);

    MethodAgreement wide = ResultValidator::compareMethods(2.0, 2.8);
    EXPECT_FALSE(wide.withinTypicalSpread);
    EXPECT_FALSE(wide.message.empty());

    EXPECT_FALSE(ResultValidator::compareMethods(2.0, 1.9).withinTypicalSpread);
}
