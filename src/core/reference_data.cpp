/*
 * <Read-only access to tabulated element reference data>
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

#include "reference_data.h"

#include "src/core/elements.h"
#include "src/core/errors.h"
#include "src/core/form_factors.h"
#include "src/core/global.h"
#include "src/core/ionic_radii.h"

int TabulatedReferenceData::AtomicNumber(const std::string& element) const
{
    int Z = Elements::String2Element(element);
    if (Z == 0)
        throw MissingReferenceData("Unknown element " + element);
    return Z;
}

int TabulatedReferenceData::ElectronCount(const std::string& element) const
{
    return Elements::ElectronCount(AtomicNumber(element));
}

std::optional<double> TabulatedReferenceData::IonicRadius(const std::string& element, int charge, const std::string& coordination) const
{
    const std::string symbol = Elements::Element2String(Elements::String2Element(element));
    const IonicRadii::IonicRadiusEntry* entry = IonicRadii::FindRadius(symbol, charge, coordination);
    if (entry == nullptr)
        return std::nullopt;
    return entry->radius;
}

std::optional<double> TabulatedReferenceData::TypicalIonicRadius(const std::string& element, int charge) const
{
    const std::string symbol = Elements::Element2String(Elements::String2Element(element));
    const IonicRadii::IonicRadiusEntry* entry = IonicRadii::FindRadius(symbol, charge);
    if (entry == nullptr)
        return std::nullopt;
    return entry->radius;
}

std::optional<double> TabulatedReferenceData::CovalentRadius(const std::string& element) const
{
    int Z = Elements::String2Element(element);
    if (Z < 1 || Z >= static_cast<int>(Elements::CovalentRadius.size()))
        return std::nullopt;
    double radius = Elements::CovalentRadius[Z];
    if (radius <= 0)
        return std::nullopt;
    return radius;
}

double TabulatedReferenceData::CoherentCrossSection(const std::string& element, double energy_ev) const
{
    int Z = AtomicNumber(element);
    double per_atom = FormFactors::getCoherentCrossSection(Z, energy_ev);
    if (per_atom < 0)
        throw MissingReferenceData("No coherent scattering cross-section for " + element + " at " + std::to_string(energy_ev) + " eV");
    // cm^2/atom -> cm^2/g
    return per_atom * avogadro / AtomicMass(element);
}

double TabulatedReferenceData::AtomicMass(const std::string& element) const
{
    int Z = AtomicNumber(element);
    if (Z >= static_cast<int>(Elements::AtomicMass.size()) || Elements::AtomicMass[Z] <= 0)
        throw MissingReferenceData("No atomic mass for " + element);
    return Elements::AtomicMass[Z];
}
