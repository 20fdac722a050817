/*
 * <Geometric volume estimators for clusters>
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

#include "cluster_config.h"
#include "radius_lookup.h"

#include "src/core/global.h"
#include "src/core/structure.h"

#include <map>
#include <string>
#include <vector>

class ReferenceDataProvider;

namespace ClusterLens {

/* oxidation states assumed by the outward facing hull, other elements are rejected */
static const std::map<std::string, int> OutwardFacingOxidationStates = {
    { "Pb", 2 },
    { "I", -1 },
    { "S", -2 },
    { "O", -2 },
    { "H", 1 },
    { "C", 4 },
    { "N", -3 }
};

struct GyrationResult {
    double rg = 0;
    Position principal_radii = Position::Zero(); // Rgx >= Rgy >= Rgz, ellipsoid only
    double volume = 0;
};

/*! \brief Sum of ionic sphere volumes
 *
 * Atoms are grouped by (element, formal charge), charge 0 for elements missing
 * in the table. Every group needs a lookup entry with a radius, otherwise
 * MissingReferenceData is thrown.
 */
double IonicSphereVolume(const std::vector<Atom>& atoms, const FormalChargeTable& charges, const RadiusLookup& lookup);

/*! \brief Electron weighted radius of gyration of the given atoms
 *
 * Weights are Z - formal charge. Sphere: V = 4/3 pi Rg^3.
 * Ellipsoid: the weighted gyration tensor is diagonalised, principal radii
 * are sqrt(3 lambda_i) so that an isotropic cloud gives Rgx = Rgy = Rgz = Rg,
 * V = 4/3 pi Rgx Rgy Rgz.
 */
GyrationResult RadiusOfGyration(const std::vector<Atom>& atoms, const FormalChargeTable& charges, const ReferenceDataProvider& reference, RgShape shape);

/*! \brief Convex hull volume of all atom positions, 0 for fewer than four or flat point sets */
double ConvexHullVolume(const std::vector<Atom>& atoms);

/*! \brief Sum of spheres whose cross-section equals the coherent scattering cross-section
 *
 * A = sigma[cm^2/g] * 1e16 * M / N_A gives Angstrom^2 per atom, r = sqrt(A / pi).
 */
double CoherentScatteringVolume(const std::vector<Atom>& atoms, const ReferenceDataProvider& reference, double energy_ev);

/*! \brief Hull of the outward facing dodecahedron vertices of all atoms
 *
 * Each atom contributes the vertices of a dodecahedron with its ionic radius
 * (oxidation state from OutwardFacingOxidationStates) that point away from
 * the unweighted centroid. An atom on the centroid contributes nothing.
 */
double OutwardFacingVolume(const std::vector<Atom>& atoms, const ReferenceDataProvider& reference);

struct VolumeResult {
    double volume = 0;
    bool has_principal_radii = false;
    Position principal_radii = Position::Zero();
};

/*! \brief Dispatches to the estimator selected in VolumeSettings
 *
 * Holds references to shared read-only data only, one instance can serve
 * all worker threads.
 */
class VolumeEstimator {
public:
    VolumeEstimator(const ClusterSettings& settings, const ReferenceDataProvider& reference, const RadiusLookup& lookup);

    /* targets are the target atoms of the structure, used by the radius of gyration */
    VolumeResult Estimate(const ClusterStructure& structure, const std::vector<Atom>& targets) const;

    VolumeMethod Method() const { return m_settings.volume.method; }

private:
    const ClusterSettings& m_settings;
    const ReferenceDataProvider& m_reference;
    const RadiusLookup& m_lookup;
};
}
