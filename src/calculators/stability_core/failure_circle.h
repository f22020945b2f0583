// src/calculators/stability_core/failure_circle.h
#pragma once
#include "terrain_profile.h"

struct FailureCircle {
    double xc;      // Center x (m)
    double yc;      // Center y (m)
    double radius;  // Radius (m)
};

// Box of admissible circle parameters derived from the slope geometry
struct SearchBounds {
    double centerXMin;
    double centerXMax;
    double centerYMin;
    double centerYMax;
    double radiusMin;
    double radiusMax;
    SlopeGeometry geometry;

    bool contains(const FailureCircle& circle) const {
        return circle.xc >= centerXMin && circle.xc <= centerXMax &&
               circle.yc >= centerYMin && circle.yc <= centerYMax &&
               circle.radius >= radiusMin && circle.radius <= radiusMax;
    }
};
