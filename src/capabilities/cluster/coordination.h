/*
 * <Coordination numbers around target atoms>
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

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ClusterLens {

struct PairStatistics {
    double mean = 0;
    double std = 0;
};

/* (target element, neighbor element) -> statistics over all target atoms */
typedef std::map<std::pair<std::string, std::string>, PairStatistics> CoordinationStats;

/*! \brief Counts configured neighbors within the directional thresholds
 *
 * \param atoms all atoms of the cluster, core and shell
 * \param targets indices into atoms of the target atoms
 *
 * Every target atom starts with a zero count for each configured neighbor
 * element. Another atom is counted if its element is a neighbor element, a
 * threshold for (target element, neighbor element) exists and the distance is
 * less than or equal to it. Returns mean and population standard deviation
 * per pair, one pair for every target element present and every configured
 * neighbor element.
 */
CoordinationStats ComputeCoordination(const std::vector<Atom>& atoms, const std::vector<int>& targets, const ClusterSettings& settings);

std::string PairName(const std::pair<std::string, std::string>& pair);
}
