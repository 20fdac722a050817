/*
 * <Atoms of one cluster split into core and shell>
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

#include "src/core/global.h"

#include <string>
#include <vector>

enum class AtomGroup {
    Core,
    Shell
};

struct Atom {
    std::string element;
    Position position = Position::Zero();
    AtomGroup group = AtomGroup::Core;
};

/*! \brief One cluster, core (e.g. lead iodide) and shell (e.g. solvent) atoms kept apart */
struct ClusterStructure {
    std::vector<Atom> core;
    std::vector<Atom> shell;

    /* core atoms first, then shell atoms */
    std::vector<Atom> AllAtoms() const
    {
        std::vector<Atom> atoms(core);
        atoms.insert(atoms.end(), shell.begin(), shell.end());
        return atoms;
    }

    int AtomCount() const { return static_cast<int>(core.size() + shell.size()); }
};

/*! \brief Source of cluster structures, one structure per file identifier
 *
 * Load is called concurrently from worker threads and must not share mutable
 * state between calls. Failures are reported with StructureLoadError.
 */
class StructureLoader {
public:
    virtual ~StructureLoader() = default;

    virtual ClusterStructure Load(const std::string& file) const = 0;
};
