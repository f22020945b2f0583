// src/calculators/stability_core/soil_layer.cpp
#include "soil_layer.h"
#include "../../utils/validation/input_validator.h"
#include <algorithm>
#include <cmath>
#include <limits>

double SoilLayer::tanPhi() const {
    return std::tan(frictionAngle * M_PI / 180.0);
}

SoilProfile::SoilProfile(std::vector<SoilLayer> layers)
    : layers_(std::move(layers)) {
    InputValidator::validateSoilLayers(layers_);
}

SoilProfile SoilProfile::homogeneous(double cohesion, double frictionAngle, double unitWeight,
                                     const std::string& name) {
    SoilLayer layer;
    layer.name = name;
    layer.cohesion = cohesion;
    layer.frictionAngle = frictionAngle;
    layer.unitWeight = unitWeight;
    return SoilProfile({layer});
}

const SoilLayer& SoilProfile::layerAt(double elevation) const {
    // The last layer extends downward without limit
    for (size_t i = 0; i + 1 < layers_.size(); ++i) {
        if (elevation > *layers_[i].bottomElevation) {
            return layers_[i];
        }
    }
    return layers_.back();
}

double SoilProfile::columnWeight(double yBase, double ySurface, double width,
                                 std::optional<double> waterElevation) const {
    const double infinity = std::numeric_limits<double>::infinity();
    double weightPerWidth = 0.0;
    double top = infinity;

    for (size_t i = 0; i < layers_.size(); ++i) {
        const SoilLayer& layer = layers_[i];
        bool isLast = (i + 1 == layers_.size());
        double bottom = isLast ? -infinity : *layer.bottomElevation;

        double lower = std::max(yBase, bottom);
        double upper = std::min(ySurface, top);
        top = bottom;

        if (upper <= lower) {
            continue;
        }

        if (waterElevation && layer.saturatedUnitWeight && *waterElevation > lower) {
            double waterSplit = std::min(upper, *waterElevation);
            weightPerWidth += *layer.saturatedUnitWeight * (waterSplit - lower);
            weightPerWidth += layer.unitWeight * (upper - waterSplit);
        } else {
            weightPerWidth += layer.unitWeight * (upper - lower);
        }
    }

    return weightPerWidth * width;
}
