/*
 * <Tests for the cluster volume estimators>
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

#include "src/core/clusterlens_logger.h"
#include "src/core/errors.h"
#include "src/core/reference_data.h"

#include "src/capabilities/cluster/volume_estimators.h"

#include "src/tools/convexhull.h"

#include "test_helper.h"

#include <cmath>

namespace {
Atom MakeAtom(const std::string& element, double x, double y, double z)
{
    Atom atom;
    atom.element = element;
    atom.position = Position(x, y, z);
    return atom;
}

std::vector<Atom> Octahedron(const std::string& element, double a)
{
    return { MakeAtom(element, a, 0, 0), MakeAtom(element, -a, 0, 0),
        MakeAtom(element, 0, a, 0), MakeAtom(element, 0, -a, 0),
        MakeAtom(element, 0, 0, a), MakeAtom(element, 0, 0, -a) };
}

class NoRadiiReference : public ReferenceDataProvider {
public:
    int ElectronCount(const std::string& element) const override { throw MissingReferenceData(element); }
    std::optional<double> IonicRadius(const std::string&, int, const std::string&) const override { return std::nullopt; }
    std::optional<double> TypicalIonicRadius(const std::string&, int) const override { return std::nullopt; }
    std::optional<double> CovalentRadius(const std::string&) const override { return std::nullopt; }
    double CoherentCrossSection(const std::string& element, double) const override { throw MissingReferenceData(element); }
    double AtomicMass(const std::string& element) const override { throw MissingReferenceData(element); }
};
}

int main()
{
    ClusterLensLogger::initialize(0, false);
    ClusterLensTest test;
    TabulatedReferenceData reference;

    ClusterLens::FormalChargeTable charges;
    charges["Pb"] = { 2, 6 };
    charges["I"] = { -1, 6 };
    ClusterLens::RadiusLookup lookup = ClusterLens::RadiusLookup::Build(charges, reference);

    std::cout << "\n=== Convex hull ===" << std::endl;
    {
        const double s = 1.0 / (2.0 * std::sqrt(2.0));
        std::vector<Atom> tetrahedron = { MakeAtom("Pb", s, s, s), MakeAtom("Pb", s, -s, -s),
            MakeAtom("Pb", -s, s, -s), MakeAtom("Pb", -s, -s, s) };
        test.assert_near(1.0 / (6.0 * std::sqrt(2.0)), ClusterLens::ConvexHullVolume(tetrahedron), 1e-10, "regular tetrahedron with unit edge");

        std::vector<Atom> cube;
        for (double x : { -1.0, 1.0 })
            for (double y : { -1.0, 1.0 })
                for (double z : { -1.0, 1.0 })
                    cube.push_back(MakeAtom("I", x, y, z));
        cube.push_back(MakeAtom("Pb", 0.1, -0.2, 0.3));
        cube.push_back(MakeAtom("Pb", 1.0, 0.0, 0.0)); // on a face
        test.assert_near(8.0, ClusterLens::ConvexHullVolume(cube), 1e-10, "cube with interior and face points");

        test.assert_near(4.0 / 3.0, ClusterLens::ConvexHullVolume(Octahedron("I", 1.0)), 1e-10, "octahedron");

        std::vector<Atom> three = { MakeAtom("Pb", 0, 0, 0), MakeAtom("I", 1, 0, 0), MakeAtom("I", 0, 1, 0) };
        test.assert_near(0.0, ClusterLens::ConvexHullVolume(three), 0.0, "three points have no volume");

        std::vector<Atom> flat = { MakeAtom("Pb", 0, 0, 0), MakeAtom("I", 1, 0, 0), MakeAtom("I", 0, 1, 0), MakeAtom("I", 1, 1, 0), MakeAtom("I", 0.5, 0.3, 0) };
        test.assert_near(0.0, ClusterLens::ConvexHullVolume(flat), 0.0, "coplanar points have no volume");

        Geometry points = Geometry::Zero(2, 3);
        test.assert_true(ConvexHull::Compute(points).status == ConvexHull::HullStatus::TooFewPoints, "status for two points");
        Geometry line = Geometry::Zero(5, 3);
        for (int i = 0; i < 5; ++i)
            line(i, 0) = i;
        test.assert_true(ConvexHull::Compute(line).status == ConvexHull::HullStatus::Degenerate, "status for collinear points");
    }

    std::cout << "\n=== Ionic spheres ===" << std::endl;
    {
        const double lead = 4.0 / 3.0 * pi * std::pow(1.19, 3);
        const double iodide = 4.0 / 3.0 * pi * std::pow(2.20, 3);
        std::vector<Atom> atoms = { MakeAtom("Pb", 0, 0, 0), MakeAtom("I", 3, 0, 0), MakeAtom("I", -3, 0, 0) };
        test.assert_near(lead + 2 * iodide, ClusterLens::IonicSphereVolume(atoms, charges, lookup), 1e-9, "PbI2 sphere volume");

        atoms.push_back(MakeAtom("I", 0, 3, 0));
        test.assert_near(lead + 3 * iodide, ClusterLens::IonicSphereVolume(atoms, charges, lookup), 1e-9, "every atom contributes its sphere");

        std::vector<Atom> solvated = atoms;
        solvated.push_back(MakeAtom("S", 0, 0, 4));
        test.assert_throws<MissingReferenceData>([&]() { ClusterLens::IonicSphereVolume(solvated, charges, lookup); }, "missing radius throws");
        test.assert_near(0.0, ClusterLens::IonicSphereVolume({}, charges, lookup), 0.0, "empty cluster");

        NoRadiiReference empty;
        ClusterLens::RadiusLookup absent = ClusterLens::RadiusLookup::Build(charges, empty);
        std::vector<Atom> lone = { MakeAtom("Pb", 0, 0, 0) };
        test.assert_throws<MissingReferenceData>([&]() { ClusterLens::IonicSphereVolume(lone, charges, absent); }, "entry without a radius throws");
    }

    std::cout << "\n=== Radius of gyration ===" << std::endl;
    {
        ClusterLens::GyrationResult sphere = ClusterLens::RadiusOfGyration(Octahedron("Pb", 2.0), charges, reference, ClusterLens::RgShape::Sphere);
        test.assert_near(2.0, sphere.rg, 1e-12, "Rg of an octahedron");
        test.assert_near(4.0 / 3.0 * pi * 8.0, sphere.volume, 1e-9, "sphere volume from Rg");

        ClusterLens::GyrationResult ellipsoid = ClusterLens::RadiusOfGyration(Octahedron("Pb", 2.0), charges, reference, ClusterLens::RgShape::Ellipsoid);
        test.assert_near(2.0, ellipsoid.principal_radii(0), 1e-10, "isotropic Rgx = Rg");
        test.assert_near(2.0, ellipsoid.principal_radii(2), 1e-10, "isotropic Rgz = Rg");
        test.assert_near(sphere.volume, ellipsoid.volume, 1e-8, "isotropic ellipsoid equals the sphere");

        std::vector<Atom> rectangle = { MakeAtom("Pb", 3, 1, 0), MakeAtom("Pb", -3, 1, 0), MakeAtom("Pb", 3, -1, 0), MakeAtom("Pb", -3, -1, 0) };
        ClusterLens::GyrationResult flat = ClusterLens::RadiusOfGyration(rectangle, charges, reference, ClusterLens::RgShape::Ellipsoid);
        test.assert_near(std::sqrt(27.0), flat.principal_radii(0), 1e-10, "largest principal radius first");
        test.assert_near(std::sqrt(3.0), flat.principal_radii(1), 1e-10, "second principal radius");
        test.assert_near(0.0, flat.principal_radii(2), 1e-7, "flat cluster has no third axis");
        test.assert_near(std::sqrt(10.0), flat.rg, 1e-12, "Rg of the rectangle");

        // weights are Z - q: 80 for Pb2+, 54 for I-
        std::vector<Atom> pair = { MakeAtom("Pb", 0, 0, 0), MakeAtom("I", 4, 0, 0) };
        const double center = 4.0 * 54.0 / 134.0;
        const double rg = std::sqrt((80.0 * center * center + 54.0 * (4.0 - center) * (4.0 - center)) / 134.0);
        test.assert_near(rg, ClusterLens::RadiusOfGyration(pair, charges, reference, ClusterLens::RgShape::Sphere).rg, 1e-12, "electron weighted Rg");

        test.assert_near(0.0, ClusterLens::RadiusOfGyration({}, charges, reference, ClusterLens::RgShape::Sphere).volume, 0.0, "no atoms");
    }

    std::cout << "\n=== Coherent scattering ===" << std::endl;
    {
        const double sigma = reference.CoherentCrossSection("O", 17000);
        const double radius = std::sqrt(sigma * 1e16 * reference.AtomicMass("O") / avogadro / pi);
        std::vector<Atom> water = { MakeAtom("O", 0, 0, 0) };
        const double single = ClusterLens::CoherentScatteringVolume(water, reference, 17000);
        test.assert_near(4.0 / 3.0 * pi * radius * radius * radius, single, 1e-12, "sphere of the coherent cross-section");
        water.push_back(MakeAtom("O", 3, 0, 0));
        test.assert_near(2 * single, ClusterLens::CoherentScatteringVolume(water, reference, 17000), 1e-12, "volumes add up");
        water.push_back(MakeAtom("Pb", 0, 3, 0));
        test.assert_true(ClusterLens::CoherentScatteringVolume(water, reference, 17000) > 2 * single, "lead adds a larger sphere");
    }

    std::cout << "\n=== Outward facing hull ===" << std::endl;
    {
        std::vector<Atom> single = { MakeAtom("Pb", 1, 1, 1) };
        test.assert_near(0.0, ClusterLens::OutwardFacingVolume(single, reference), 0.0, "an atom on the centroid contributes nothing");

        std::vector<Atom> dimer = { MakeAtom("Pb", -5, 0, 0), MakeAtom("Pb", 5, 0, 0) };
        const double dimer_volume = ClusterLens::OutwardFacingVolume(dimer, reference);
        test.assert_true(dimer_volume > 0, "lead dimer spans a volume");

        // dodecahedron vertices on the unit sphere with a positive x component, Pb2+ radius 0.98
        const double phi = (1.0 + std::sqrt(5.0)) / 2.0;
        const double scale = 0.98 / std::sqrt(3.0);
        const std::vector<Position> facing = {
            Position(1, 1, 1), Position(1, 1, -1), Position(1, -1, 1), Position(1, -1, -1),
            Position(1 / phi, phi, 0), Position(1 / phi, -phi, 0),
            Position(phi, 0, 1 / phi), Position(phi, 0, -1 / phi)
        };
        Geometry expected(2 * facing.size(), 3);
        for (std::size_t i = 0; i < facing.size(); ++i) {
            const Position outer = Position(5, 0, 0) + scale * facing[i];
            expected.row(i) = outer.transpose();
            expected.row(i + facing.size()) = Position(-outer(0), outer(1), outer(2)).transpose();
        }
        test.assert_near(ConvexHull::Compute(expected).volume, dimer_volume, 1e-9, "lead dimer hull of the sixteen facing vertices");
        // contains the square prism between the (1, +-1, +-1) corners, fits in the bounding box
        const double inner = 2.0 * (5.0 + scale) * 4.0 * scale * scale;
        const double outer = 2.0 * (5.0 + scale * phi) * 4.0 * scale * phi * scale * phi;
        test.assert_true(dimer_volume > inner && dimer_volume < outer, "dimer volume lies between the inner prism and the bounding box");

        std::vector<Atom> iodide = { MakeAtom("I", -5, 0, 0), MakeAtom("I", 5, 0, 0) };
        test.assert_true(ClusterLens::OutwardFacingVolume(iodide, reference) > dimer_volume, "larger radius gives a larger hull");

        std::vector<Atom> sodium = { MakeAtom("Na", -5, 0, 0), MakeAtom("Pb", 5, 0, 0) };
        test.assert_throws<MissingReferenceData>([&]() { ClusterLens::OutwardFacingVolume(sodium, reference); }, "no oxidation state for Na");
    }

    std::cout << "\n=== Dispatch ===" << std::endl;
    {
        ClusterLens::ClusterSettings settings;
        settings.target_elements = { "Pb" };
        settings.charges = charges;
        settings.volume.method = ClusterLens::VolumeMethod::RadiusOfGyration;
        settings.volume.shape = ClusterLens::RgShape::Ellipsoid;
        ClusterLens::VolumeEstimator estimator(settings, reference, lookup);

        ClusterStructure structure;
        structure.core = Octahedron("Pb", 2.0);
        structure.shell = { MakeAtom("O", 20, 0, 0) };
        ClusterLens::VolumeResult result = estimator.Estimate(structure, structure.core);
        test.assert_true(result.has_principal_radii, "ellipsoid reports principal radii");
        test.assert_near(4.0 / 3.0 * pi * 8.0, result.volume, 1e-8, "Rg uses the target atoms only");

        settings.volume.method = ClusterLens::VolumeMethod::ConvexHull;
        result = estimator.Estimate(structure, structure.core);
        test.assert_false(result.has_principal_radii, "hull has no principal radii");
        test.assert_true(result.volume > 4.0 / 3.0 * 8.0, "hull includes the shell atoms");
    }

    test.print_summary();
    return test.exit_code();
}
