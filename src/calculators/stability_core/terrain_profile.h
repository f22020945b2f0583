// src/calculators/stability_core/terrain_profile.h
#pragma once
#include <optional>
#include <vector>

struct ProfilePoint {
    double x;  // Horizontal coordinate (m)
    double y;  // Elevation (m)
};

// Descriptors of the slope face derived from a terrain profile
struct SlopeGeometry {
    double height;          // yMax - yMin (m)
    double crestX;          // x where the profile leaves the top (m)
    double toeX;            // x where the profile reaches the bottom (m)
    double faceAngle;       // Face inclination (degrees)
    int slideDirection;     // +1 when the mass moves toward +x, -1 otherwise
    double xMin;
    double xMax;
    double yMin;
    double yMax;
};

class TerrainProfile {
public:
    // Throws ParameterError unless there are at least 2 points with strictly increasing x
    explicit TerrainProfile(std::vector<ProfilePoint> points);

    // Toe plateau, rising face and crest plateau for a slope of the given height and angle
    static TerrainProfile simpleSlope(double height, double angleDegrees);

    // Linear interpolation of the ground elevation; absent outside [xMin, xMax]
    std::optional<double> elevationAt(double x) const;

    const std::vector<ProfilePoint>& points() const { return points_; }

    double xMin() const { return points_.front().x; }
    double xMax() const { return points_.back().x; }
    double yMin() const;
    double yMax() const;

    // +1 if the ground descends toward +x (highest point left of the lowest), else -1
    int slideDirection() const;

    SlopeGeometry slopeGeometry() const;

private:
    std::vector<ProfilePoint> points_;
};

// Piezometric line with the same shape as the terrain profile
class WaterTable {
public:
    explicit WaterTable(std::vector<ProfilePoint> points);

    // Horizontal phreatic line spanning the terrain
    static WaterTable horizontal(double elevation, const TerrainProfile& terrain);

    // Absent outside the table's x-range, meaning no water there
    std::optional<double> elevationAt(double x) const { return profile_.elevationAt(x); }

    const std::vector<ProfilePoint>& points() const { return profile_.points(); }

private:
    TerrainProfile profile_;
};
