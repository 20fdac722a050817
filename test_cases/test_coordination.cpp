/*
 * <Tests for coordination numbers and cluster charge>
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

#include "src/capabilities/cluster/coordination.h"

#include "test_helper.h"

namespace {
Atom MakeAtom(const std::string& element, double x, double y, double z)
{
    Atom atom;
    atom.element = element;
    atom.position = Position(x, y, z);
    return atom;
}

ClusterLens::ClusterSettings LeadIodide()
{
    ClusterLens::ClusterSettings settings;
    settings.target_elements = { "Pb" };
    settings.neighbor_elements = { "I", "O" };
    settings.thresholds["Pb"]["I"] = 3.6;
    settings.thresholds["Pb"]["O"] = 3.0;
    return settings;
}
}

int main()
{
    ClusterLensLogger::initialize(0, false);
    ClusterLensTest test;

    std::vector<Atom> atoms = {
        MakeAtom("Pb", 0, 0, 0),
        MakeAtom("I", 3.0, 0, 0),
        MakeAtom("I", 0, 0, 3.6), // exactly on the threshold
        MakeAtom("I", 0, -3.7, 0),
        MakeAtom("O", 0, 2.9, 0),
        MakeAtom("Pb", 10, 0, 0),
        MakeAtom("I", 13, 0, 0)
    };
    std::vector<int> targets = { 0, 5 };

    std::cout << "\n=== Pair statistics ===" << std::endl;
    ClusterLens::CoordinationStats stats = ClusterLens::ComputeCoordination(atoms, targets, LeadIodide());
    test.assert_equal(2, static_cast<int>(stats.size()), "one entry per configured neighbor");
    const auto& lead_iodide = stats[{ "Pb", "I" }];
    test.assert_near(1.5, lead_iodide.mean, 1e-12, "Pb-I mean, threshold is inclusive");
    test.assert_near(0.5, lead_iodide.std, 1e-12, "Pb-I population std");
    const auto& lead_oxygen = stats[{ "Pb", "O" }];
    test.assert_near(0.5, lead_oxygen.mean, 1e-12, "Pb-O mean");
    test.assert_near(0.5, lead_oxygen.std, 1e-12, "Pb-O std");
    test.assert_equal(std::string("Pb-I"), ClusterLens::PairName({ "Pb", "I" }), "pair name");

    std::cout << "\n=== Directional thresholds ===" << std::endl;
    {
        ClusterLens::ClusterSettings settings = LeadIodide();
        settings.thresholds.clear();
        settings.thresholds["I"]["Pb"] = 5.0;
        ClusterLens::CoordinationStats reverse = ClusterLens::ComputeCoordination(atoms, targets, settings);
        test.assert_near(0.0, reverse[{ "Pb", "I" }].mean, 1e-12, "an I-Pb threshold does not apply to Pb-I");
        test.assert_near(0.0, reverse[{ "Pb", "O" }].mean, 1e-12, "zero coordination is still reported");
    }

    std::cout << "\n=== Self exclusion ===" << std::endl;
    {
        ClusterLens::ClusterSettings settings = LeadIodide();
        settings.neighbor_elements = { "Pb" };
        settings.thresholds["Pb"]["Pb"] = 11.0;
        ClusterLens::CoordinationStats lead = ClusterLens::ComputeCoordination(atoms, targets, settings);
        test.assert_near(1.0, lead[{ "Pb", "Pb" }].mean, 1e-12, "a target atom does not count itself");
        test.assert_near(0.0, lead[{ "Pb", "Pb" }].std, 1e-12, "both lead atoms see each other");
    }

    std::cout << "\n=== No targets ===" << std::endl;
    test.assert_true(ClusterLens::ComputeCoordination(atoms, {}, LeadIodide()).empty(), "no target atoms give no statistics");

    test.print_summary();
    return test.exit_code();
}
