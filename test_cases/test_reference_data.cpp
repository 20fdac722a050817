/*
 * <Tests for the tabulated element reference data>
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
#include "src/core/form_factors.h"
#include "src/core/ionic_radii.h"
#include "src/core/reference_data.h"

#include "test_helper.h"

int main()
{
    ClusterLensLogger::initialize(0, false);
    ClusterLensTest test;
    TabulatedReferenceData reference;

    std::cout << "\n=== Electron counts ===" << std::endl;
    test.assert_equal(82, reference.ElectronCount("Pb"), "Pb has 82 electrons");
    test.assert_equal(53, reference.ElectronCount("I"), "I has 53 electrons");
    test.assert_equal(82, reference.ElectronCount("PB"), "symbols are case insensitive");
    test.assert_throws<MissingReferenceData>([&]() { reference.ElectronCount("Xx"); }, "unknown element throws");

    std::cout << "\n=== Ionic radii ===" << std::endl;
    auto pb_vi = reference.IonicRadius("Pb", 2, "VI");
    test.assert_true(pb_vi.has_value(), "Pb2+ VI is tabulated");
    test.assert_near(1.19, pb_vi.value_or(0), 1e-12, "Pb2+ VI = 1.19 Å");
    test.assert_near(2.20, reference.IonicRadius("I", -1, "VI").value_or(0), 1e-12, "I- VI = 2.20 Å");
    test.assert_false(reference.IonicRadius("Pb", 2, "V").has_value(), "Pb2+ V is not tabulated");
    test.assert_false(reference.IonicRadius("Pb", 3, "VI").has_value(), "Pb3+ is not tabulated");
    test.assert_near(0.98, reference.TypicalIonicRadius("Pb", 2).value_or(0), 1e-12, "typical Pb2+ radius is the first entry");
    test.assert_near(-0.38, reference.TypicalIonicRadius("H", 1).value_or(0), 1e-12, "negative radii are kept");

    test.assert_equal(std::string("VI"), IonicRadii::RomanNumeral(6), "6 -> VI");
    test.assert_equal(std::string("XV"), IonicRadii::RomanNumeral(15), "15 -> XV");
    test.assert_equal(std::string(""), IonicRadii::RomanNumeral(0), "0 has no label");
    test.assert_equal(std::string(""), IonicRadii::RomanNumeral(16), "16 has no label");

    std::cout << "\n=== Covalent radii and masses ===" << std::endl;
    test.assert_near(0.63, reference.CovalentRadius("O").value_or(0), 1e-12, "covalent radius of O");
    test.assert_false(reference.CovalentRadius("Xx").has_value(), "no covalent radius for unknown symbols");
    test.assert_near(207.2, reference.AtomicMass("Pb"), 1e-9, "mass of Pb");

    std::cout << "\n=== Coherent scattering ===" << std::endl;
    // f(0) is close to Z for the neutral atom
    test.assert_near(8.0, FormFactors::getAtomicFormFactor(8, 0.0), 0.05, "f(0) of O");
    test.assert_near(82.0, FormFactors::getAtomicFormFactor(82, 0.0), 0.2, "f(0) of Pb");
    test.assert_true(FormFactors::getAtomicFormFactor(8, 4.0) < FormFactors::getAtomicFormFactor(8, 1.0), "form factor decays with q");

    // long wavelength limit: sigma -> 8/3 pi r_e^2 f(0)^2
    const double f0 = FormFactors::getAtomicFormFactor(8, 0.0);
    const double thomson = 8.0 / 3.0 * M_PI * FormFactors::ELECTRON_RADIUS * FormFactors::ELECTRON_RADIUS * f0 * f0;
    const double sigma_low = FormFactors::getCoherentCrossSection(8, 1.0);
    test.assert_near(1.0, sigma_low / thomson, 1e-4, "long wavelength limit of O");

    const double sigma_o = reference.CoherentCrossSection("O", 17000);
    const double sigma_pb = reference.CoherentCrossSection("Pb", 17000);
    test.assert_true(sigma_o > 0, "O cross-section is positive");
    test.assert_true(sigma_pb > sigma_o, "Pb scatters more per gram than O");
    test.assert_true(reference.CoherentCrossSection("O", 8000) > sigma_o, "cross-section drops with energy");
    test.assert_throws<MissingReferenceData>([&]() { reference.CoherentCrossSection("U", 17000); }, "no form factor for U");
    test.assert_true(FormFactors::getCoherentCrossSection(92, 17000) < 0, "negative result without parameters");

    test.print_summary();
    return test.exit_code();
}
