// src/calculators/stability_core/circle_constraints.h
#pragma once
#include "failure_circle.h"
#include "terrain_profile.h"
#include <optional>
#include <string>
#include <vector>

// Multiples of the slope height H that size the search box
struct ConstraintFactors {
    double lateralMargin;     // Center x margin beyond crest and toe
    double centerHeightMin;   // Center y above the crest, lower limit
    double centerHeightMax;   // Center y above the crest, upper limit
    double radiusMin;
    double radiusMax;
};

enum class SlopeClass {
    Gentle,        // face angle <= 15°
    Steep,         // <= 30°
    Critical,      // <= 50°
    Conservative   // steeper faces
};

enum class BoundViolation {
    CenterXBelowMin,
    CenterXAboveMax,
    CenterYBelowMin,
    CenterYAboveMax,
    RadiusBelowMin,
    RadiusAboveMax
};

enum class SamplingDistribution {
    Uniform,
    Gaussian   // Centered in the box, sigma = range / 6, clamped to the bounds
};

struct CircleValidation {
    bool isValid;
    std::vector<BoundViolation> violations;
    std::optional<FailureCircle> correctedCircle;   // Only filled when auto-correcting
};

std::string slopeClassName(SlopeClass slopeClass);
std::string violationName(BoundViolation violation);

class CircleConstraintCalculator {
public:
    static SlopeClass classifySlope(double faceAngleDegrees);
    static ConstraintFactors presetFactors(SlopeClass slopeClass);

    // Throws ParameterError for a flat terrain or inconsistent factors
    static SearchBounds calculateBounds(const TerrainProfile& terrain,
                                        const std::optional<ConstraintFactors>& factors = std::nullopt);

    static CircleValidation validateAndCorrect(const FailureCircle& circle,
                                               const SearchBounds& bounds,
                                               bool autoCorrect);

    // Circle-polyline intersection points sorted by x
    static std::vector<ProfilePoint> terrainIntersections(const FailureCircle& circle,
                                                          const TerrainProfile& terrain);

    // True when the arc beneath the center emerges at the ground on both sides within the profile
    static bool exitsGround(const FailureCircle& circle, const TerrainProfile& terrain);

    static std::vector<FailureCircle> generateCircles(const SearchBounds& bounds,
                                                      int count,
                                                      SamplingDistribution distribution,
                                                      unsigned int seed);
};
