/*
 * <Net charge of a cluster>
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

#include "cluster_config.h"

#include "src/core/structure.h"

#include <vector>

namespace ClusterLens {

/* sum of formal charges, elements missing in the table count as neutral */
inline int ClusterCharge(const std::vector<Atom>& atoms, const FormalChargeTable& charges)
{
    int charge = 0;
    for (const auto& atom : atoms) {
        auto it = charges.find(atom.element);
        if (it != charges.end())
            charge += it->second.charge;
    }
    return charge;
}

inline int ClusterCharge(const ClusterStructure& structure, const FormalChargeTable& charges)
{
    return ClusterCharge(structure.core, charges) + ClusterCharge(structure.shell, charges);
}
}
