/*
 * <PDB reader for solvated clusters>
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

#include "src/core/structure.h"

#include <string>

/*! \brief Reads ATOM and HETATM records of a PDB file
 *
 * The residue name (columns 18-20) decides the group: core residues end up in
 * ClusterStructure::core, shell residues in ClusterStructure::shell, all other
 * residues are ignored. The element is taken from columns 77-78 and derived
 * from the atom name (columns 13-16) if those are blank.
 */
class PDBStructureLoader : public StructureLoader {
public:
    PDBStructureLoader(const StringList& core_residues, const StringList& shell_residues);

    ClusterStructure Load(const std::string& file) const override;

    /*! \brief Parses one ATOM/HETATM line, returns false for any other record */
    bool ParseLine(const std::string& line, Atom& atom, std::string& residue) const;

private:
    std::string ElementFromAtomName(const std::string& name) const;

    StringList m_core_residues;
    StringList m_shell_residues;
};
