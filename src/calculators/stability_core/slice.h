// src/calculators/stability_core/slice.h
#pragma once

struct Slice {
    int index;              // Position among the kept slices, increasing with x
    double xLeft;           // Left boundary (m)
    double xRight;          // Right boundary (m)
    double xCenter;         // Midpoint (m)
    double width;           // Δx (m)
    double yBase;           // Slip surface elevation at xCenter (m)
    double ySurface;        // Ground elevation at xCenter (m)
    double height;          // ySurface - yBase (m)
    double alpha;           // Base inclination (radians), positive in the sliding direction
    double arcLength;       // Base arc length ΔL (m)
    double weight;          // W in kN per m run
    double porePressure;    // u at the base in kPa
    double cohesion;        // c' of the base layer in kPa
    double frictionAngle;   // phi' of the base layer in degrees
};

inline bool operator==(const Slice& a, const Slice& b) {
    return a.index == b.index && a.xLeft == b.xLeft && a.xRight == b.xRight &&
           a.xCenter == b.xCenter && a.width == b.width && a.yBase == b.yBase &&
           a.ySurface == b.ySurface && a.height == b.height && a.alpha == b.alpha &&
           a.arcLength == b.arcLength && a.weight == b.weight &&
           a.porePressure == b.porePressure && a.cohesion == b.cohesion &&
           a.frictionAngle == b.frictionAngle;
}
