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

#pragma once

#include <optional>
#include <string>

/*! \brief Read-only element reference data used by the cluster estimators
 *
 * Implementations must be safe for concurrent reads, one provider is shared by
 * all worker threads of a batch. Element symbols are accepted in any case.
 */
class ReferenceDataProvider {
public:
    virtual ~ReferenceDataProvider() = default;

    /*! \brief Electrons of the neutral atom, throws MissingReferenceData for unknown elements */
    virtual int ElectronCount(const std::string& element) const = 0;

    /*! \brief Ionic radius in Angstrom for an exact (charge, coordination label) match */
    virtual std::optional<double> IonicRadius(const std::string& element, int charge, const std::string& coordination) const = 0;

    /*! \brief First tabulated ionic radius in Angstrom for the charge, any coordination */
    virtual std::optional<double> TypicalIonicRadius(const std::string& element, int charge) const = 0;

    /*! \brief Covalent radius in Angstrom */
    virtual std::optional<double> CovalentRadius(const std::string& element) const = 0;

    /*! \brief Coherent scattering cross-section in cm^2/g at energy_ev, throws MissingReferenceData */
    virtual double CoherentCrossSection(const std::string& element, double energy_ev) const = 0;

    /*! \brief Atomic mass in g/mol, throws MissingReferenceData */
    virtual double AtomicMass(const std::string& element) const = 0;
};

/*! \brief Provider backed by the compiled-in tables
 *
 * Elements: symbols, masses and covalent radii
 * IonicRadii: Shannon effective ionic radii
 * FormFactors: Cromer-Mann parameters, integrated to coherent cross-sections
 */
class TabulatedReferenceData : public ReferenceDataProvider {
public:
    TabulatedReferenceData() = default;

    int ElectronCount(const std::string& element) const override;
    std::optional<double> IonicRadius(const std::string& element, int charge, const std::string& coordination) const override;
    std::optional<double> TypicalIonicRadius(const std::string& element, int charge) const override;
    std::optional<double> CovalentRadius(const std::string& element) const override;
    double CoherentCrossSection(const std::string& element, double energy_ev) const override;
    double AtomicMass(const std::string& element) const override;

private:
    /* atomic number or MissingReferenceData */
    int AtomicNumber(const std::string& element) const;
};
