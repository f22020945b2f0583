// src/calculators/stability_core/soil_layer.h
#pragma once
#include <optional>
#include <string>
#include <vector>

struct SoilLayer {
    std::string name;                           // Layer name
    double cohesion;                            // Effective cohesion c' in kPa
    double frictionAngle;                       // Effective friction angle phi' in degrees
    double unitWeight;                          // Unit weight gamma in kN/m³
    std::optional<double> saturatedUnitWeight;  // gamma_sat in kN/m³, used below the water table
    std::optional<double> bottomElevation;      // Lower limit of the layer (m); absent = unbounded

    double tanPhi() const;
};

// Layers ordered top to bottom; each spans from the bottom of the layer above down to its own bottom
class SoilProfile {
public:
    explicit SoilProfile(std::vector<SoilLayer> layers);

    static SoilProfile homogeneous(double cohesion, double frictionAngle, double unitWeight,
                                   const std::string& name = "Homogeneous");

    // Layer containing the given elevation; a point on a boundary belongs to the layer below
    const SoilLayer& layerAt(double elevation) const;

    // Weight of a soil column of the given width between yBase and ySurface (kN per m run)
    double columnWeight(double yBase, double ySurface, double width,
                        std::optional<double> waterElevation) const;

    const std::vector<SoilLayer>& layers() const { return layers_; }

private:
    std::vector<SoilLayer> layers_;
};
