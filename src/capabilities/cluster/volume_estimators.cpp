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

#include "volume_estimators.h"

#include "src/core/clusterlens_logger.h"
#include "src/core/errors.h"
#include "src/core/reference_data.h"

#include "src/tools/convexhull.h"
#include "src/tools/geometry.h"

#include <Eigen/Eigenvalues>

#include <fmt/core.h>

#include <cmath>
#include <utility>

namespace ClusterLens {

namespace {
Geometry Atoms2Geometry(const std::vector<Atom>& atoms)
{
    Geometry geom = Geometry::Zero(atoms.size(), 3);
    for (std::size_t i = 0; i < atoms.size(); ++i)
        geom.row(i) = atoms[i].position.transpose();
    return geom;
}

double HullVolume(const Geometry& points, const std::string& what)
{
    ConvexHull::HullResult hull = ConvexHull::Compute(points);
    if (hull.status == ConvexHull::HullStatus::TooFewPoints)
        ClusterLensLogger::warn_fmt("Only {} points for the {} hull, volume set to 0", points.rows(), what);
    else if (hull.status == ConvexHull::HullStatus::Degenerate)
        ClusterLensLogger::warn_fmt("Points of the {} hull are coplanar, volume set to 0", what);
    return hull.volume;
}
}

double IonicSphereVolume(const std::vector<Atom>& atoms, const FormalChargeTable& charges, const RadiusLookup& lookup)
{
    std::map<std::pair<std::string, int>, int> groups;
    for (const auto& atom : atoms) {
        auto it = charges.find(atom.element);
        int charge = it == charges.end() ? 0 : it->second.charge;
        groups[{ atom.element, charge }]++;
    }

    double volume = 0;
    for (const auto& [key, count] : groups) {
        const RadiusLookupEntry* entry = lookup.Find(key.first, key.second);
        if (entry == nullptr)
            throw MissingReferenceData(fmt::format("No radius entry for {} with charge {:+d}", key.first, key.second));
        if (!entry->volume)
            throw MissingReferenceData(fmt::format("Radius of {} with charge {:+d} is unknown", key.first, key.second));
        volume += count * *entry->volume;
    }
    return volume;
}

GyrationResult RadiusOfGyration(const std::vector<Atom>& atoms, const FormalChargeTable& charges, const ReferenceDataProvider& reference, RgShape shape)
{
    GyrationResult result;
    if (atoms.empty())
        return result;

    Vector weights(atoms.size());
    for (std::size_t i = 0; i < atoms.size(); ++i) {
        auto it = charges.find(atoms[i].element);
        int charge = it == charges.end() ? 0 : it->second.charge;
        weights(i) = reference.ElectronCount(atoms[i].element) - charge;
    }
    const double total = weights.sum();
    if (total <= 0)
        throw MissingReferenceData(fmt::format("Total electron count of {} atoms is {}", atoms.size(), total));

    const Geometry geom = Atoms2Geometry(atoms);
    const Position center = GeometryTools::WeightedCentroid(geom, weights);

    Eigen::Matrix3d tensor = Eigen::Matrix3d::Zero();
    for (std::size_t i = 0; i < atoms.size(); ++i) {
        const Position delta = atoms[i].position - center;
        tensor += weights(i) * delta * delta.transpose();
    }
    tensor /= total;

    result.rg = std::sqrt(std::max(0.0, tensor.trace()));

    if (shape == RgShape::Sphere) {
        result.volume = SphereVolume(result.rg);
        return result;
    }

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(tensor);
    if (solver.info() != Eigen::Success)
        throw std::runtime_error("Eigenvalue decomposition of the gyration tensor failed");

    // eigenvalues come in increasing order
    const Eigen::Vector3d eigenvalues = solver.eigenvalues();
    for (int i = 0; i < 3; ++i)
        result.principal_radii(i) = std::sqrt(3.0 * std::max(0.0, eigenvalues(2 - i)));

    result.volume = 4.0 / 3.0 * pi * result.principal_radii.prod();
    return result;
}

double ConvexHullVolume(const std::vector<Atom>& atoms)
{
    return HullVolume(Atoms2Geometry(atoms), "atom position");
}

double CoherentScatteringVolume(const std::vector<Atom>& atoms, const ReferenceDataProvider& reference, double energy_ev)
{
    // per element sphere volume, looked up once per cluster
    std::map<std::string, double> sphere;
    double volume = 0;
    for (const auto& atom : atoms) {
        auto it = sphere.find(atom.element);
        if (it == sphere.end()) {
            const double cross_section = reference.CoherentCrossSection(atom.element, energy_ev);
            const double area = cross_section * 1e16 * reference.AtomicMass(atom.element) / avogadro;
            const double radius = std::sqrt(area / pi);
            it = sphere.emplace(atom.element, SphereVolume(radius)).first;
            ClusterLensLogger::verbose_fmt("{}: sigma_coh = {:.4f} cm^2/g at {} eV, r = {:.4f} Å", atom.element, cross_section, energy_ev, radius);
        }
        volume += it->second;
    }
    return volume;
}

double OutwardFacingVolume(const std::vector<Atom>& atoms, const ReferenceDataProvider& reference)
{
    if (atoms.empty())
        return 0;

    std::map<std::string, double> radii;
    for (const auto& atom : atoms) {
        if (radii.count(atom.element))
            continue;
        auto state = OutwardFacingOxidationStates.find(atom.element);
        if (state == OutwardFacingOxidationStates.end())
            throw MissingReferenceData("No typical oxidation state for " + atom.element);
        auto radius = reference.TypicalIonicRadius(atom.element, state->second);
        if (!radius)
            throw MissingReferenceData(fmt::format("No ionic radius for {} with oxidation state {:+d}", atom.element, state->second));
        radii[atom.element] = *radius;
    }

    const Position center = GeometryTools::Centroid(Atoms2Geometry(atoms));
    const std::vector<Position> vertices = GeometryTools::DodecahedronVertices();

    std::vector<Position> points;
    for (const auto& atom : atoms) {
        Position direction = atom.position - center;
        const double norm = direction.norm();
        if (norm <= 1e-12)
            continue;
        direction /= norm;
        const double radius = radii[atom.element];
        for (const auto& vertex : vertices) {
            if (vertex.dot(direction) > 0)
                points.push_back(atom.position + radius * vertex);
        }
    }
    return HullVolume(GeometryTools::Positions2Geometry(points), "outward facing point");
}

VolumeEstimator::VolumeEstimator(const ClusterSettings& settings, const ReferenceDataProvider& reference, const RadiusLookup& lookup)
    : m_settings(settings)
    , m_reference(reference)
    , m_lookup(lookup)
{
}

VolumeResult VolumeEstimator::Estimate(const ClusterStructure& structure, const std::vector<Atom>& targets) const
{
    VolumeResult result;
    switch (m_settings.volume.method) {
    case VolumeMethod::IonicRadius:
        result.volume = IonicSphereVolume(structure.AllAtoms(), m_settings.charges, m_lookup);
        break;
    case VolumeMethod::RadiusOfGyration: {
        GyrationResult gyration = RadiusOfGyration(targets, m_settings.charges, m_reference, m_settings.volume.shape);
        result.volume = gyration.volume;
        if (m_settings.volume.shape == RgShape::Ellipsoid) {
            result.has_principal_radii = true;
            result.principal_radii = gyration.principal_radii;
        }
        break;
    }
    case VolumeMethod::ConvexHull:
        result.volume = ConvexHullVolume(structure.AllAtoms());
        break;
    case VolumeMethod::CoherentScattering:
        result.volume = CoherentScatteringVolume(structure.AllAtoms(), m_reference, m_settings.volume.energy);
        break;
    case VolumeMethod::OutwardFacing:
        result.volume = OutwardFacingVolume(structure.AllAtoms(), m_reference);
        break;
    }
    return result;
}
}
