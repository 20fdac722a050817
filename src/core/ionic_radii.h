/*
 * <Effective ionic radii after Shannon>
 * Copyright (C) 2019 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include <string>
#include <vector>

/*! \brief Effective ionic radii
 *
 * R. D. Shannon, Acta Cryst. A32 (1976) 751-767
 * 10.1107/S0567739476001551
 *
 * Radii in Angstrom. Coordination is given as the crystallographic label,
 * a PY suffix marks square pyramidal environments. Entries of one ion are
 * listed with increasing coordination, high spin where Shannon lists both.
 */
namespace IonicRadii {

struct IonicRadiusEntry {
    std::string element;
    int charge;
    std::string coordination;
    double radius;
};

static const std::vector<IonicRadiusEntry> ShannonRadii = {
    { "H", 1, "I", -0.38 },
    { "H", 1, "II", -0.18 },
    { "Li", 1, "IV", 0.59 },
    { "Li", 1, "VI", 0.76 },
    { "Li", 1, "VIII", 0.92 },
    { "Be", 2, "III", 0.16 },
    { "Be", 2, "IV", 0.27 },
    { "Be", 2, "VI", 0.45 },
    { "B", 3, "III", 0.01 },
    { "B", 3, "IV", 0.11 },
    { "B", 3, "VI", 0.27 },
    { "C", 4, "III", -0.08 },
    { "C", 4, "IV", 0.15 },
    { "C", 4, "VI", 0.16 },
    { "N", -3, "IV", 1.46 },
    { "N", 3, "VI", 0.16 },
    { "N", 5, "III", -0.104 },
    { "N", 5, "VI", 0.13 },
    { "O", -2, "II", 1.35 },
    { "O", -2, "III", 1.36 },
    { "O", -2, "IV", 1.38 },
    { "O", -2, "VI", 1.40 },
    { "O", -2, "VIII", 1.42 },
    { "F", -1, "II", 1.285 },
    { "F", -1, "III", 1.30 },
    { "F", -1, "IV", 1.31 },
    { "F", -1, "VI", 1.33 },
    { "Na", 1, "IV", 0.99 },
    { "Na", 1, "V", 1.00 },
    { "Na", 1, "VI", 1.02 },
    { "Na", 1, "VII", 1.12 },
    { "Na", 1, "VIII", 1.18 },
    { "Na", 1, "IX", 1.24 },
    { "Na", 1, "XII", 1.39 },
    { "Mg", 2, "IV", 0.57 },
    { "Mg", 2, "V", 0.66 },
    { "Mg", 2, "VI", 0.72 },
    { "Mg", 2, "VIII", 0.89 },
    { "Al", 3, "IV", 0.39 },
    { "Al", 3, "V", 0.48 },
    { "Al", 3, "VI", 0.535 },
    { "Si", 4, "IV", 0.26 },
    { "Si", 4, "VI", 0.40 },
    { "P", 3, "VI", 0.44 },
    { "P", 5, "IV", 0.17 },
    { "P", 5, "V", 0.29 },
    { "P", 5, "VI", 0.38 },
    { "S", -2, "VI", 1.84 },
    { "S", 4, "VI", 0.37 },
    { "S", 6, "IV", 0.12 },
    { "S", 6, "VI", 0.29 },
    { "Cl", -1, "VI", 1.81 },
    { "Cl", 7, "IV", 0.08 },
    { "Cl", 7, "VI", 0.27 },
    { "K", 1, "IV", 1.37 },
    { "K", 1, "VI", 1.38 },
    { "K", 1, "VII", 1.46 },
    { "K", 1, "VIII", 1.51 },
    { "K", 1, "IX", 1.55 },
    { "K", 1, "X", 1.59 },
    { "K", 1, "XII", 1.64 },
    { "Ca", 2, "VI", 1.00 },
    { "Ca", 2, "VII", 1.06 },
    { "Ca", 2, "VIII", 1.12 },
    { "Ca", 2, "IX", 1.18 },
    { "Ca", 2, "X", 1.23 },
    { "Ca", 2, "XII", 1.34 },
    { "Ti", 4, "IV", 0.42 },
    { "Ti", 4, "V", 0.51 },
    { "Ti", 4, "VI", 0.605 },
    { "Ti", 4, "VIII", 0.74 },
    { "Mn", 2, "IV", 0.66 },
    { "Mn", 2, "VI", 0.83 },
    { "Fe", 2, "IV", 0.63 },
    { "Fe", 2, "VI", 0.78 },
    { "Fe", 3, "IV", 0.49 },
    { "Fe", 3, "VI", 0.645 },
    { "Co", 2, "IV", 0.58 },
    { "Co", 2, "VI", 0.745 },
    { "Ni", 2, "IV", 0.55 },
    { "Ni", 2, "VI", 0.69 },
    { "Cu", 1, "II", 0.46 },
    { "Cu", 1, "IV", 0.60 },
    { "Cu", 1, "VI", 0.77 },
    { "Cu", 2, "IV", 0.57 },
    { "Cu", 2, "V", 0.65 },
    { "Cu", 2, "VI", 0.73 },
    { "Zn", 2, "IV", 0.60 },
    { "Zn", 2, "V", 0.68 },
    { "Zn", 2, "VI", 0.74 },
    { "Zn", 2, "VIII", 0.90 },
    { "Ge", 2, "VI", 0.73 },
    { "Ge", 4, "IV", 0.39 },
    { "Ge", 4, "VI", 0.53 },
    { "Se", -2, "VI", 1.98 },
    { "Br", -1, "VI", 1.96 },
    { "Rb", 1, "VI", 1.52 },
    { "Rb", 1, "VII", 1.56 },
    { "Rb", 1, "VIII", 1.61 },
    { "Rb", 1, "IX", 1.63 },
    { "Rb", 1, "X", 1.66 },
    { "Rb", 1, "XI", 1.69 },
    { "Rb", 1, "XII", 1.72 },
    { "Rb", 1, "XIV", 1.83 },
    { "Sr", 2, "VI", 1.18 },
    { "Sr", 2, "VII", 1.21 },
    { "Sr", 2, "VIII", 1.26 },
    { "Sr", 2, "IX", 1.31 },
    { "Sr", 2, "X", 1.36 },
    { "Sr", 2, "XII", 1.44 },
    { "Ag", 1, "II", 0.67 },
    { "Ag", 1, "IV", 1.00 },
    { "Ag", 1, "V", 1.09 },
    { "Ag", 1, "VI", 1.15 },
    { "Ag", 1, "VII", 1.22 },
    { "Ag", 1, "VIII", 1.28 },
    { "Cd", 2, "IV", 0.78 },
    { "Cd", 2, "V", 0.87 },
    { "Cd", 2, "VI", 0.95 },
    { "Cd", 2, "VII", 1.03 },
    { "Cd", 2, "VIII", 1.10 },
    { "Cd", 2, "XII", 1.31 },
    { "In", 3, "IV", 0.62 },
    { "In", 3, "VI", 0.80 },
    { "In", 3, "VIII", 0.92 },
    { "Sn", 2, "VIII", 1.22 },
    { "Sn", 4, "IV", 0.55 },
    { "Sn", 4, "V", 0.62 },
    { "Sn", 4, "VI", 0.69 },
    { "Sn", 4, "VII", 0.75 },
    { "Sn", 4, "VIII", 0.81 },
    { "Sb", 3, "IVPY", 0.76 },
    { "Sb", 3, "V", 0.80 },
    { "Sb", 3, "VI", 0.76 },
    { "Sb", 5, "VI", 0.60 },
    { "Te", -2, "VI", 2.21 },
    { "I", -1, "VI", 2.20 },
    { "I", 5, "IIIPY", 0.44 },
    { "I", 5, "VI", 0.95 },
    { "I", 7, "IV", 0.42 },
    { "I", 7, "VI", 0.53 },
    { "Cs", 1, "VI", 1.67 },
    { "Cs", 1, "VIII", 1.74 },
    { "Cs", 1, "IX", 1.78 },
    { "Cs", 1, "X", 1.81 },
    { "Cs", 1, "XI", 1.85 },
    { "Cs", 1, "XII", 1.88 },
    { "Ba", 2, "VI", 1.35 },
    { "Ba", 2, "VII", 1.38 },
    { "Ba", 2, "VIII", 1.42 },
    { "Ba", 2, "IX", 1.47 },
    { "Ba", 2, "X", 1.52 },
    { "Ba", 2, "XI", 1.57 },
    { "Ba", 2, "XII", 1.61 },
    { "Tl", 1, "VI", 1.50 },
    { "Tl", 1, "VIII", 1.59 },
    { "Tl", 1, "XII", 1.70 },
    { "Tl", 3, "IV", 0.75 },
    { "Tl", 3, "VI", 0.885 },
    { "Tl", 3, "VIII", 0.98 },
    { "Pb", 2, "IVPY", 0.98 },
    { "Pb", 2, "VI", 1.19 },
    { "Pb", 2, "VII", 1.23 },
    { "Pb", 2, "VIII", 1.29 },
    { "Pb", 2, "IX", 1.35 },
    { "Pb", 2, "X", 1.40 },
    { "Pb", 2, "XI", 1.45 },
    { "Pb", 2, "XII", 1.49 },
    { "Pb", 4, "IV", 0.65 },
    { "Pb", 4, "V", 0.73 },
    { "Pb", 4, "VI", 0.775 },
    { "Pb", 4, "VIII", 0.94 },
    { "Bi", 3, "V", 0.96 },
    { "Bi", 3, "VI", 1.03 },
    { "Bi", 3, "VIII", 1.17 },
    { "Bi", 5, "VI", 0.76 },
};

/* 6 -> "VI"; coordination numbers outside 1..15 have no label */
inline std::string RomanNumeral(int number)
{
    static const std::vector<std::string> numerals = {
        "", "I", "II", "III", "IV", "V", "VI", "VII", "VIII", "IX", "X", "XI", "XII", "XIII", "XIV", "XV"
    };
    if (number < 1 || number >= static_cast<int>(numerals.size()))
        return "";
    return numerals[number];
}

/* exact match of charge and coordination label, nullptr otherwise */
inline const IonicRadiusEntry* FindRadius(const std::string& element, int charge, const std::string& coordination)
{
    for (const auto& entry : ShannonRadii) {
        if (entry.element == element && entry.charge == charge && entry.coordination == coordination)
            return &entry;
    }
    return nullptr;
}

/* first tabulated entry for the charge, regardless of coordination */
inline const IonicRadiusEntry* FindRadius(const std::string& element, int charge)
{
    for (const auto& entry : ShannonRadii) {
        if (entry.element == element && entry.charge == charge)
            return &entry;
    }
    return nullptr;
}
}
