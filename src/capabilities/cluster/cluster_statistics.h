/*
 * <Per cluster records and their statistics per cluster size>
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

#include "coordination.h"

#include "src/core/global.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ClusterLens {

/*! \brief Measurement of one cluster, immutable once the worker returned it */
struct ClusterRecord {
    std::string file;
    int size = 0; // number of target atoms
    CoordinationStats coordination;
    double volume = 0; // Angstrom^3
    bool has_principal_radii = false;
    Position principal_radii = Position::Zero(); // Rgx, Rgy, Rgz of the ellipsoid
    int charge = 0;

    json toJson() const;
};

struct SizeStatistics {
    int size = 0;
    int count = 0;
    double mean_volume = 0;
    double std_volume = 0;
    double volume_fraction = 0; // mean * count / sum(mean * count)
    double phi_volume = 0; // mean_volume * volume_fraction
    double mean_charge = 0;
    double std_charge = 0;
    /* mean and std of the per cluster coordination means */
    std::map<std::pair<std::string, std::string>, PairStatistics> coordination;
    double total_coordination = 0;

    double VolumePercentage() const { return 100.0 * volume_fraction; }
};

/* legend values of a coordination histogram over all sizes */
struct CoordinationSummary {
    double weighted_average = 0; // count weighted over sizes
    double mean_std = 0; // plain mean of the per size std
};

struct BatchStatistics {
    std::vector<SizeStatistics> sizes; // ascending size
    int total_clusters = 0;
    int mode_size = 0; // largest volume fraction, smallest size on ties
    int phi_volume_mode_size = 0;
    double weighted_median_size = 0;
    double weighted_mean_size = 0;
    std::map<std::pair<std::string, std::string>, CoordinationSummary> coordination;

    const SizeStatistics* Find(int size) const;

    json toJson() const;
};

/*! \brief Bins the records by cluster size and derives all distributions
 *
 * Single threaded and independent of the record order up to floating point
 * summation, records are expected to be sorted by file for bitwise
 * reproducibility. Standard deviations are population deviations.
 *
 * The weighted median and mean size follow the volume percentage
 * distribution: each size is counted int(100 * percentage) times.
 */
BatchStatistics ComputeStatistics(const std::vector<ClusterRecord>& records);

/* population mean and standard deviation */
std::pair<double, double> MeanStd(const std::vector<double>& values);
}
