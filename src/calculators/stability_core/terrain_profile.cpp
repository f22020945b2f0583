// src/calculators/stability_core/terrain_profile.cpp
#include "terrain_profile.h"
#include "stability_errors.h"
#include "../../utils/validation/input_validator.h"
#include <algorithm>
#include <cmath>
#include <iterator>

TerrainProfile::TerrainProfile(std::vector<ProfilePoint> points)
    : points_(std::move(points)) {
    InputValidator::validateProfilePoints(points_, "terrain");
}

TerrainProfile TerrainProfile::simpleSlope(double height, double angleDegrees) {
    if (height <= 0.0) {
        throw ParameterError("slope_height", height, "Slope height must be > 0");
    }
    if (angleDegrees <= 0.0 || angleDegrees >= 90.0) {
        throw ParameterError("slope_angle", angleDegrees, "Slope angle must be within (0, 90) degrees");
    }

    double faceWidth = height / std::tan(angleDegrees * M_PI / 180.0);
    // Plateaus long enough for deep circles to emerge inside the profile
    double extension = std::max(faceWidth, 1.5 * height);

    return TerrainProfile({{0.0, 0.0},
                           {extension, 0.0},
                           {extension + faceWidth, height},
                           {2.0 * extension + faceWidth, height}});
}

std::optional<double> TerrainProfile::elevationAt(double x) const {
    if (x < points_.front().x || x > points_.back().x) {
        return std::nullopt;
    }

    // Find the profile points that bracket the requested x
    auto it = std::lower_bound(points_.begin(), points_.end(), x,
                               [](const ProfilePoint& point, double value) {
                                   return point.x < value;
                               });

    if (it == points_.begin()) {
        return it->y;
    }

    auto prev = std::prev(it);
    double ratio = (x - prev->x) / (it->x - prev->x);
    return prev->y * (1 - ratio) + it->y * ratio;
}

double TerrainProfile::yMin() const {
    return std::min_element(points_.begin(), points_.end(),
                            [](const ProfilePoint& a, const ProfilePoint& b) { return a.y < b.y; })->y;
}

double TerrainProfile::yMax() const {
    return std::max_element(points_.begin(), points_.end(),
                            [](const ProfilePoint& a, const ProfilePoint& b) { return a.y < b.y; })->y;
}

int TerrainProfile::slideDirection() const {
    auto highest = std::max_element(points_.begin(), points_.end(),
                                    [](const ProfilePoint& a, const ProfilePoint& b) { return a.y < b.y; });
    auto lowest = std::min_element(points_.begin(), points_.end(),
                                   [](const ProfilePoint& a, const ProfilePoint& b) { return a.y < b.y; });
    return (highest->x < lowest->x) ? 1 : -1;
}

SlopeGeometry TerrainProfile::slopeGeometry() const {
    SlopeGeometry geometry;
    geometry.xMin = xMin();
    geometry.xMax = xMax();
    geometry.yMin = yMin();
    geometry.yMax = yMax();
    geometry.height = geometry.yMax - geometry.yMin;
    geometry.slideDirection = slideDirection();

    // Walk the profile in the sliding direction: crest is the last top point
    // before the first bottom point (the toe)
    std::vector<ProfilePoint> walk = points_;
    if (geometry.slideDirection < 0) {
        std::reverse(walk.begin(), walk.end());
    }

    double tolerance = std::max(0.02 * geometry.height, 1e-9);
    auto toe = std::find_if(walk.begin(), walk.end(), [&](const ProfilePoint& p) {
        return p.y <= geometry.yMin + tolerance;
    });
    if (toe == walk.end()) {
        toe = std::prev(walk.end());
    }

    auto crest = walk.end();
    for (auto it = walk.begin(); it != toe; ++it) {
        if (it->y >= geometry.yMax - tolerance) {
            crest = it;
        }
    }
    if (crest == walk.end()) {
        crest = std::max_element(walk.begin(), walk.end(),
                                 [](const ProfilePoint& a, const ProfilePoint& b) { return a.y < b.y; });
    }

    geometry.crestX = crest->x;
    geometry.toeX = toe->x;

    double faceWidth = std::abs(geometry.toeX - geometry.crestX);
    if (faceWidth > 0.0) {
        geometry.faceAngle = std::atan(geometry.height / faceWidth) * 180.0 / M_PI;
    } else {
        geometry.faceAngle = 90.0;
    }

    return geometry;
}

WaterTable::WaterTable(std::vector<ProfilePoint> points)
    : profile_(std::move(points)) {}

WaterTable WaterTable::horizontal(double elevation, const TerrainProfile& terrain) {
    return WaterTable({{terrain.xMin(), elevation}, {terrain.xMax(), elevation}});
}
