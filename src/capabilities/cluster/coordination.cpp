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

#include "coordination.h"

#include "src/tools/geometry.h"

#include <cmath>

namespace ClusterLens {

CoordinationStats ComputeCoordination(const std::vector<Atom>& atoms, const std::vector<int>& targets, const ClusterSettings& settings)
{
    std::map<std::pair<std::string, std::string>, std::vector<int>> counts;

    for (int target : targets) {
        const Atom& center = atoms[target];
        std::map<std::string, int> neighbors;
        for (const auto& element : settings.neighbor_elements)
            neighbors[element] = 0;

        auto thresholds = settings.thresholds.find(center.element);
        if (thresholds != settings.thresholds.end()) {
            for (int i = 0; i < static_cast<int>(atoms.size()); ++i) {
                if (i == target || !settings.IsNeighbor(atoms[i].element))
                    continue;
                auto threshold = thresholds->second.find(atoms[i].element);
                if (threshold == thresholds->second.end())
                    continue;
                if (GeometryTools::Distance(center.position, atoms[i].position) <= threshold->second)
                    neighbors[atoms[i].element]++;
            }
        }

        for (const auto& [element, count] : neighbors)
            counts[{ center.element, element }].push_back(count);
    }

    CoordinationStats stats;
    for (const auto& [pair, values] : counts) {
        PairStatistics statistics;
        for (int value : values)
            statistics.mean += value;
        statistics.mean /= values.size();
        for (int value : values)
            statistics.std += (value - statistics.mean) * (value - statistics.mean);
        statistics.std = std::sqrt(statistics.std / values.size());
        stats[pair] = statistics;
    }
    return stats;
}

std::string PairName(const std::pair<std::string, std::string>& pair)
{
    return pair.first + "-" + pair.second;
}
}
