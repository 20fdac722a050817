/*
 * <Configuration of cluster measurements>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#pragma once

#include "src/core/global.h"

#include <map>
#include <string>

class ConfigManager;

namespace ClusterLens {

/* formal charge and the coordination number its ionic radius refers to */
struct FormalCharge {
    int charge = 0;
    int coordination = 0;
};

typedef std::map<std::string, FormalCharge> FormalChargeTable;

/* target element -> neighbor element -> distance in Angstrom, directional */
typedef std::map<std::string, std::map<std::string, double>> ThresholdMap;

enum class VolumeMethod {
    IonicRadius,
    RadiusOfGyration,
    ConvexHull,
    CoherentScattering,
    OutwardFacing
};

enum class RgShape {
    Sphere,
    Ellipsoid
};

/*! \brief Selected volume estimator, shape is read by RadiusOfGyration only, energy by CoherentScattering only */
struct VolumeSettings {
    VolumeMethod method = VolumeMethod::IonicRadius;
    RgShape shape = RgShape::Sphere;
    double energy = 17000.0; // eV
};

struct ClusterSettings {
    StringList target_elements;
    StringList neighbor_elements;
    ThresholdMap thresholds;
    FormalChargeTable charges;
    VolumeSettings volume;

    bool IsTarget(const std::string& element) const;
    bool IsNeighbor(const std::string& element) const;

    /* formal charge of the element, 0 if not in the table */
    int Charge(const std::string& element) const;
};

/* "ionic_radius", "radius_of_gyration", "convex_hull", "coherent_scattering", "outward_facing" */
VolumeMethod ParseVolumeMethod(const std::string& name);
std::string VolumeMethodName(VolumeMethod method);

/* "sphere" or "ellipsoid" */
RgShape ParseShape(const std::string& name);
std::string ShapeName(RgShape shape);

/* {"Pb": [2, 6], "I": [-1, 6]} */
FormalChargeTable ParseCharges(const json& charges);

/* {"Pb": {"I": 3.6, "O": 3.0}} */
ThresholdMap ParseThresholds(const json& thresholds);

/*! \brief Builds and validates the settings, throws UnknownConfiguration */
ClusterSettings ParseClusterSettings(const ConfigManager& config);
}
