/*
 * <Atomic form factors and coherent scattering cross-sections>
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

#include <algorithm>
#include <array>
#include <cmath>

/*! \brief Cromer-Mann form factors and integrated coherent cross-sections
 *
 * Data Source: International Tables for Crystallography, Vol. C, Table 6.1.1.4
 * Coverage: H (Z=1) to Xe (Z=54), Cs, Ba and Pb
 */

namespace FormFactors {

/*! \brief Cromer-Mann 9-parameter atomic form factor data
 *
 * Formula: f(q) = c + sum_i a_i exp(-b_i (q/4pi)^2)
 * where q is the scattering vector magnitude in 1/Angstrom
 */
struct CromerMannParams {
    double a1, b1;
    double a2, b2;
    double a3, b3;
    double a4, b4;
    double c;
};

constexpr std::array<CromerMannParams, 55> CROMER_MANN_DATA = {{
    // Index 0 - placeholder (unused)
    {0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0},

    // Z=1: H (Hydrogen)
    {0.493002, 10.5109, 0.322912, 26.1257, 0.140191, 3.14236, 0.040810, 57.7997, 0.003038},

    // Z=2: He (Helium)
    {0.873400, 9.10370, 0.630900, 3.35680, 0.311200, 22.9276, 0.178000, 0.98210, 0.006400},

    // Z=3: Li (Lithium)
    {1.128200, 3.95460, 0.750800, 1.05240, 0.617500, 85.3905, 0.465300, 168.261, 0.037700},

    // Z=4: Be (Beryllium)
    {1.591900, 43.6427, 1.127800, 1.86230, 0.539100, 103.483, 0.702900, 0.54200, 0.038500},

    // Z=5: B (Boron)
    {2.054500, 23.2185, 1.332600, 1.02100, 1.097900, 60.3498, 0.706800, 0.14030, -0.19320},

    // Z=6: C (Carbon)
    {2.310000, 20.8439, 1.020000, 10.2075, 1.588600, 0.56870, 0.865000, 51.6512, 0.215600},

    // Z=7: N (Nitrogen)
    {12.2126, 0.00570, 3.132200, 9.89330, 2.012500, 28.9975, 1.166300, 0.58260, -11.529},

    // Z=8: O (Oxygen)
    {3.048500, 13.2771, 2.286800, 5.70110, 1.546300, 0.32390, 0.867000, 32.9089, 0.250800},

    // Z=9: F (Fluorine)
    {3.539200, 10.2825, 2.641200, 4.29440, 1.517000, 0.26150, 1.024300, 26.1476, 0.277600},

    // Z=10: Ne (Neon)
    {3.955300, 8.40420, 3.112500, 3.42620, 1.454600, 0.23060, 1.125100, 21.7184, 0.351500},

    // Z=11: Na (Sodium)
    {4.762600, 3.28500, 3.173600, 8.84220, 1.267400, 0.31360, 1.112800, 129.424, 0.676000},

    // Z=12: Mg (Magnesium)
    {5.420400, 2.82750, 2.173500, 79.2611, 1.226900, 0.38080, 2.307300, 7.19370, 0.858400},

    // Z=13: Al (Aluminum)
    {6.420200, 3.03870, 1.900200, 0.74260, 1.593600, 31.5472, 1.964600, 85.0886, 1.115100},

    // Z=14: Si (Silicon)
    {6.291500, 2.43860, 3.035300, 32.3337, 1.989100, 0.67850, 1.541000, 81.6937, 1.140700},

    // Z=15: P (Phosphorus)
    {6.434500, 1.90670, 4.179100, 27.1570, 1.780000, 0.52600, 1.490800, 68.1645, 1.114900},

    // Z=16: S (Sulfur)
    {6.905300, 1.46790, 5.203400, 22.2151, 1.437900, 0.25360, 1.586300, 56.172, 0.866900},

    // Z=17: Cl (Chlorine)
    {11.4604, 0.01040, 7.196400, 1.16620, 6.255600, 18.5194, 1.645500, 47.7784, -9.5574},

    // Z=18: Ar (Argon)
    {7.484500, 0.90720, 6.772300, 14.8407, 0.653900, 43.8983, 1.644200, 33.3929, 1.444500},

    // Z=19: K (Potassium)
    {8.218600, 12.7949, 7.439800, 0.77480, 1.051900, 213.187, 0.865900, 41.6841, 1.422800},

    // Z=20: Ca (Calcium)
    {8.626600, 10.4421, 7.387300, 0.65990, 1.589900, 85.7484, 1.021100, 178.437, 1.375100},

    // Z=21: Sc (Scandium)
    {9.189000, 9.02130, 7.367900, 0.57290, 1.640900, 136.108, 1.468000, 51.3531, 1.332900},

    // Z=22: Ti (Titanium)
    {9.759500, 7.85080, 7.355800, 0.50000, 1.699100, 35.6338, 1.902100, 116.105, 1.280700},

    // Z=23: V (Vanadium)
    {10.2971, 6.86570, 7.351100, 0.43850, 2.070300, 26.8938, 2.057100, 102.478, 1.219900},

    // Z=24: Cr (Chromium)
    {10.6406, 6.10380, 7.353700, 0.39200, 3.324000, 20.2626, 1.492200, 98.7399, 1.183200},

    // Z=25: Mn (Manganese)
    {11.2819, 5.34090, 7.357300, 0.34320, 3.019300, 17.8674, 2.244100, 83.7543, 1.089600},

    // Z=26: Fe (Iron)
    {11.7695, 4.76110, 7.357300, 0.30720, 3.522200, 15.3535, 2.304500, 76.8805, 1.036900},

    // Z=27: Co (Cobalt)
    {12.2841, 4.27910, 7.340900, 0.27840, 4.003400, 13.5359, 2.348800, 71.1692, 1.011800},

    // Z=28: Ni (Nickel)
    {12.8376, 3.87850, 7.292000, 0.25650, 4.443800, 12.1763, 2.380000, 66.3421, 1.034100},

    // Z=29: Cu (Copper)
    {13.3380, 3.58280, 7.167600, 0.24700, 5.615800, 11.3966, 1.673500, 64.8126, 1.191000},

    // Z=30: Zn (Zinc)
    {14.0743, 3.26550, 7.031800, 0.23330, 5.162500, 10.3163, 2.410000, 58.7097, 1.304100},

    // Z=31: Ga (Gallium)
    {15.2354, 3.06690, 6.700600, 0.24120, 4.359100, 10.7805, 2.962300, 61.4135, 1.718900},

    // Z=32: Ge (Germanium)
    {16.0816, 2.85090, 6.374700, 0.25160, 3.706900, 11.4468, 3.683000, 54.7625, 2.131300},

    // Z=33: As (Arsenic)
    {16.6723, 2.63450, 6.070100, 0.26470, 3.431300, 12.9479, 4.277900, 47.7972, 2.531000},

    // Z=34: Se (Selenium)
    {17.0006, 2.40980, 5.819600, 0.27260, 3.973100, 15.2372, 4.354300, 43.8163, 2.840900},

    // Z=35: Br (Bromine)
    {17.1789, 2.17230, 5.235800, 16.5796, 5.637700, 0.26090, 3.985100, 41.4328, 2.955700},

    // Z=36: Kr (Krypton)
    {17.3555, 1.93840, 6.728600, 16.5623, 5.549300, 0.22610, 3.537500, 39.3972, 2.825000},

    // Z=37: Rb (Rubidium)
    {17.1784, 1.78880, 9.643500, 17.3151, 5.139900, 0.27480, 1.529200, 164.934, 3.487300},

    // Z=38: Sr (Strontium)
    {17.5663, 1.55640, 9.818400, 14.0988, 5.422000, 0.16640, 2.669400, 132.376, 2.506400},

    // Z=39: Y (Yttrium)
    {17.7760, 1.40290, 10.2946, 12.8006, 5.726290, 0.12560, 3.265880, 104.354, 1.912130},

    // Z=40: Zr (Zirconium)
    {17.8765, 1.27618, 10.9480, 11.9160, 5.417320, 0.11762, 3.657210, 87.6627, 2.069290},

    // Z=41: Nb (Niobium)
    {17.6142, 1.18865, 12.0144, 11.7660, 4.041830, 0.20478, 3.533460, 69.7957, 3.755910},

    // Z=42: Mo (Molybdenum)
    {3.70250, 0.27720, 17.2356, 1.09580, 12.8876, 11.0040, 3.742900, 61.6584, 4.387500},

    // Z=43: Tc (Technetium)
    {19.1301, 0.86413, 11.0948, 8.14487, 4.649010, 21.5707, 2.712630, 86.8472, 5.404280},

    // Z=44: Ru (Ruthenium)
    {19.2674, 0.80852, 12.9182, 8.43467, 4.863370, 24.7997, 1.567560, 94.2928, 5.378740},

    // Z=45: Rh (Rhodium)
    {19.2957, 0.75155, 14.3501, 8.21758, 4.734250, 25.8749, 1.289180, 98.6062, 5.328000},

    // Z=46: Pd (Palladium)
    {19.3319, 0.69866, 15.5017, 7.98929, 5.295370, 25.2052, 0.605844, 76.8986, 5.265930},

    // Z=47: Ag (Silver)
    {19.2808, 0.64460, 16.6885, 7.47260, 4.804500, 24.6605, 1.046300, 99.8156, 5.179000},

    // Z=48: Cd (Cadmium)
    {19.2214, 0.59460, 17.6444, 6.90890, 4.461000, 24.7008, 1.602900, 87.4825, 5.069400},

    // Z=49: In (Indium)
    {19.1624, 0.54760, 18.5596, 6.37760, 4.294800, 25.8499, 2.039600, 92.8029, 4.939100},

    // Z=50: Sn (Tin)
    {19.1889, 5.83030, 19.1005, 0.50310, 4.458500, 26.8909, 2.466300, 83.9571, 4.782100},

    // Z=51: Sb (Antimony)
    {19.6418, 5.30340, 19.0455, 0.46070, 5.037100, 27.9074, 2.682700, 75.2825, 4.590900},

    // Z=52: Te (Tellurium)
    {19.9644, 4.81742, 19.0138, 0.42080, 6.144870, 28.5284, 2.523900, 70.8403, 4.352000},

    // Z=53: I (Iodine)
    {20.1472, 4.34700, 18.9949, 0.38140, 7.513800, 27.7660, 2.273500, 66.8776, 4.071200},

    // Z=54: Xe (Xenon)
    {20.2933, 3.92820, 19.0298, 0.34400, 8.976700, 26.4659, 1.990000, 64.2658, 3.711800}
}};

struct HeavyElementParams {
    int Z;
    CromerMannParams params;
};

constexpr std::array<HeavyElementParams, 3> CROMER_MANN_HEAVY = { {
    // Z=55: Cs (Caesium)
    { 55, { 20.3892, 3.56900, 19.1062, 0.31070, 10.66200, 24.3879, 1.495300, 213.904, 3.335200 } },

    // Z=56: Ba (Barium)
    { 56, { 20.3361, 3.21600, 19.2970, 0.27560, 10.88800, 20.2073, 2.695900, 167.202, 2.773100 } },

    // Z=82: Pb (Lead)
    { 82, { 31.0617, 0.69020, 13.0637, 2.35760, 18.44200, 8.61800, 5.969600, 47.2579, 13.411800 } },
} };

/* classical electron radius in cm */
constexpr double ELECTRON_RADIUS = 2.8179403262e-13;

/* h*c in eV*Angstrom */
constexpr double HC_EV_ANGSTROM = 12398.419843;

/*! \brief Parameter set for atomic number Z, nullptr if not tabulated */
inline const CromerMannParams* getCromerMannParams(int Z)
{
    if (Z >= 1 && Z < static_cast<int>(CROMER_MANN_DATA.size()))
        return &CROMER_MANN_DATA[Z];
    for (const auto& heavy : CROMER_MANN_HEAVY) {
        if (heavy.Z == Z)
            return &heavy.params;
    }
    return nullptr;
}

/*! \brief Form factor at s = sin(theta)/lambda = q/4pi */
inline double evaluateCromerMann(const CromerMannParams& p, double s)
{
    const double s2 = s * s;
    return p.c
        + p.a1 * std::exp(-p.b1 * s2)
        + p.a2 * std::exp(-p.b2 * s2)
        + p.a3 * std::exp(-p.b3 * s2)
        + p.a4 * std::exp(-p.b4 * s2);
}

/*! \brief Atomic form factor f(q) in electron units
 *
 * \param Z Atomic number
 * \param q Scattering vector magnitude in 1/Angstrom
 * \return f(q), 0 for elements without parameters
 */
inline double getAtomicFormFactor(int Z, double q)
{
    const CromerMannParams* p = getCromerMannParams(Z);
    if (p == nullptr)
        return 0.0;
    return evaluateCromerMann(*p, q / (4.0 * M_PI));
}

/*! \brief Coherent (Rayleigh) scattering cross-section per atom in cm^2
 *
 * Thomson cross-section of an unpolarised beam weighted with the squared
 * form factor and integrated over the full solid angle:
 *
 *   sigma = pi r_e^2 int_{-1}^{1} (1 + mu^2) f(s)^2 dmu,
 *   mu = cos(2theta), s = sin(theta)/lambda
 *
 * Simpson rule with an even number of intervals. Anomalous dispersion is
 * neglected. Returns a negative value if Z has no form factor parameters.
 */
inline double getCoherentCrossSection(int Z, double energy_ev, int intervals = 2000)
{
    const CromerMannParams* p = getCromerMannParams(Z);
    if (p == nullptr || energy_ev <= 0.0)
        return -1.0;

    if (intervals % 2)
        ++intervals;

    const double lambda = HC_EV_ANGSTROM / energy_ev;
    const double h = 2.0 / intervals;

    auto integrand = [&](double mu) {
        const double s = std::sqrt(std::max(0.0, (1.0 - mu) / 2.0)) / lambda;
        const double f = evaluateCromerMann(*p, s);
        return (1.0 + mu * mu) * f * f;
    };

    double sum = integrand(-1.0) + integrand(1.0);
    for (int i = 1; i < intervals; ++i) {
        const double mu = -1.0 + i * h;
        sum += (i % 2 ? 4.0 : 2.0) * integrand(mu);
    }
    return M_PI * ELECTRON_RADIUS * ELECTRON_RADIUS * sum * h / 3.0;
}

} // namespace FormFactors
