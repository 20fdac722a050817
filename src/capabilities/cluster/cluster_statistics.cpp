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

#include "cluster_statistics.h"

#include <cmath>
#include <set>
#include <tuple>

namespace ClusterLens {

std::pair<double, double> MeanStd(const std::vector<double>& values)
{
    if (values.empty())
        return { 0, 0 };
    double mean = 0;
    for (double value : values)
        mean += value;
    mean /= values.size();
    double variance = 0;
    for (double value : values)
        variance += (value - mean) * (value - mean);
    return { mean, std::sqrt(variance / values.size()) };
}

json ClusterRecord::toJson() const
{
    json record;
    record["file"] = file;
    record["cluster_size"] = size;
    record["volume"] = volume;
    record["charge"] = charge;
    json coord = json::object();
    for (const auto& [pair, stats] : coordination)
        coord[PairName(pair)] = { { "mean", stats.mean }, { "std", stats.std } };
    record["coordination"] = coord;
    if (has_principal_radii)
        record["principal_radii"] = { principal_radii(0), principal_radii(1), principal_radii(2) };
    return record;
}

const SizeStatistics* BatchStatistics::Find(int size) const
{
    for (const auto& statistics : sizes)
        if (statistics.size == size)
            return &statistics;
    return nullptr;
}

json BatchStatistics::toJson() const
{
    json result;
    result["total_clusters"] = total_clusters;
    result["mode_size"] = mode_size;
    result["phi_volume_mode_size"] = phi_volume_mode_size;
    result["weighted_median_size"] = weighted_median_size;
    result["weighted_mean_size"] = weighted_mean_size;

    json per_size = json::array();
    for (const auto& statistics : sizes) {
        json entry;
        entry["size"] = statistics.size;
        entry["count"] = statistics.count;
        entry["mean_volume"] = statistics.mean_volume;
        entry["std_volume"] = statistics.std_volume;
        entry["volume_fraction"] = statistics.volume_fraction;
        entry["volume_percentage"] = statistics.VolumePercentage();
        entry["phi_volume"] = statistics.phi_volume;
        entry["mean_charge"] = statistics.mean_charge;
        entry["std_charge"] = statistics.std_charge;
        entry["total_coordination"] = statistics.total_coordination;
        json coord = json::object();
        for (const auto& [pair, stats] : statistics.coordination)
            coord[PairName(pair)] = { { "mean", stats.mean }, { "std", stats.std } };
        entry["coordination"] = coord;
        per_size.push_back(entry);
    }
    result["sizes"] = per_size;

    json coord = json::object();
    for (const auto& [pair, summary] : coordination)
        coord[PairName(pair)] = { { "weighted_average", summary.weighted_average }, { "mean_std", summary.mean_std } };
    result["coordination"] = coord;
    return result;
}

BatchStatistics ComputeStatistics(const std::vector<ClusterRecord>& records)
{
    BatchStatistics batch;
    batch.total_clusters = static_cast<int>(records.size());
    if (records.empty())
        return batch;

    std::map<int, std::vector<const ClusterRecord*>> buckets;
    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& record : records) {
        buckets[record.size].push_back(&record);
        for (const auto& item : record.coordination)
            pairs.insert(item.first);
    }

    double total_volume = 0;
    for (const auto& [size, bucket] : buckets) {
        SizeStatistics statistics;
        statistics.size = size;
        statistics.count = static_cast<int>(bucket.size());

        std::vector<double> volumes, charges;
        std::map<std::pair<std::string, std::string>, std::vector<double>> coordination;
        for (const ClusterRecord* record : bucket) {
            volumes.push_back(record->volume);
            charges.push_back(record->charge);
            for (const auto& [pair, stats] : record->coordination)
                coordination[pair].push_back(stats.mean);
        }
        std::tie(statistics.mean_volume, statistics.std_volume) = MeanStd(volumes);
        std::tie(statistics.mean_charge, statistics.std_charge) = MeanStd(charges);

        for (const auto& pair : pairs) {
            PairStatistics pair_statistics;
            auto it = coordination.find(pair);
            if (it != coordination.end())
                std::tie(pair_statistics.mean, pair_statistics.std) = MeanStd(it->second);
            statistics.coordination[pair] = pair_statistics;
            statistics.total_coordination += pair_statistics.mean;
        }

        total_volume += statistics.mean_volume * statistics.count;
        batch.sizes.push_back(statistics);
    }

    double best_fraction = -1, best_phi = -1;
    for (auto& statistics : batch.sizes) {
        if (total_volume > 0)
            statistics.volume_fraction = statistics.mean_volume * statistics.count / total_volume;
        statistics.phi_volume = statistics.mean_volume * statistics.volume_fraction;

        // ascending sizes, strict comparison keeps the smallest size on ties
        if (statistics.volume_fraction > best_fraction) {
            best_fraction = statistics.volume_fraction;
            batch.mode_size = statistics.size;
        }
        if (statistics.phi_volume > best_phi) {
            best_phi = statistics.phi_volume;
            batch.phi_volume_mode_size = statistics.size;
        }
    }

    std::vector<std::pair<int, long>> weighted;
    long total_weight = 0;
    for (const auto& statistics : batch.sizes) {
        long weight = static_cast<long>(statistics.VolumePercentage() * 100);
        if (weight > 0) {
            weighted.emplace_back(statistics.size, weight);
            total_weight += weight;
        }
    }
    if (total_weight > 0) {
        double sum = 0;
        for (const auto& [size, weight] : weighted)
            sum += static_cast<double>(size) * weight;
        batch.weighted_mean_size = sum / total_weight;

        auto element = [&weighted](long index) {
            for (const auto& [size, weight] : weighted) {
                if (index < weight)
                    return size;
                index -= weight;
            }
            return weighted.back().first;
        };
        if (total_weight % 2)
            batch.weighted_median_size = element(total_weight / 2);
        else
            batch.weighted_median_size = 0.5 * (element(total_weight / 2 - 1) + element(total_weight / 2));
    }

    for (const auto& pair : pairs) {
        CoordinationSummary summary;
        double weighted_sum = 0, std_sum = 0;
        for (const auto& statistics : batch.sizes) {
            const PairStatistics& pair_statistics = statistics.coordination.at(pair);
            weighted_sum += pair_statistics.mean * statistics.count;
            std_sum += pair_statistics.std;
        }
        summary.weighted_average = weighted_sum / batch.total_clusters;
        summary.mean_std = std_sum / batch.sizes.size();
        batch.coordination[pair] = summary;
    }

    return batch;
}
}
