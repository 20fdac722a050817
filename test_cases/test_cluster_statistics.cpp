/*
 * <Tests for the per size cluster statistics>
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

#include "src/capabilities/cluster/cluster_statistics.h"

#include "test_helper.h"

namespace {
ClusterLens::ClusterRecord MakeRecord(const std::string& file, int size, double volume, int charge, double lead_iodide)
{
    ClusterLens::ClusterRecord record;
    record.file = file;
    record.size = size;
    record.volume = volume;
    record.charge = charge;
    record.coordination[{ "Pb", "I" }] = { lead_iodide, 0.0 };
    return record;
}
}

int main()
{
    ClusterLensTest test;

    std::cout << "\n=== Volume distribution ===" << std::endl;
    std::vector<ClusterLens::ClusterRecord> records = {
        MakeRecord("a.pdb", 2, 10.0, 0, 3.0),
        MakeRecord("b.pdb", 2, 12.0, 2, 4.0),
        MakeRecord("c.pdb", 3, 9.0, 1, 5.0)
    };
    ClusterLens::BatchStatistics statistics = ClusterLens::ComputeStatistics(records);
    test.assert_equal(3, statistics.total_clusters, "three clusters");
    test.assert_equal(2, static_cast<int>(statistics.sizes.size()), "two sizes");

    const ClusterLens::SizeStatistics* dimers = statistics.Find(2);
    const ClusterLens::SizeStatistics* trimers = statistics.Find(3);
    test.assert_true(dimers != nullptr && trimers != nullptr, "both sizes present");
    if (dimers && trimers) {
        test.assert_equal(2, dimers->count, "two dimers");
        test.assert_near(11.0, dimers->mean_volume, 1e-12, "mean dimer volume");
        test.assert_near(1.0, dimers->std_volume, 1e-12, "population std of the dimer volume");
        test.assert_near(9.0 / 31.0 * 100.0, trimers->VolumePercentage(), 1e-10, "trimer share of the total volume");
        test.assert_near(22.0 / 31.0, dimers->volume_fraction, 1e-12, "dimer volume fraction");
        test.assert_near(11.0 * 22.0 / 31.0, dimers->phi_volume, 1e-10, "phi weighted volume");
        test.assert_near(1.0, dimers->mean_charge, 1e-12, "mean dimer charge");
        test.assert_near(1.0, dimers->std_charge, 1e-12, "std of the dimer charge");
        test.assert_near(3.5, dimers->coordination.at({ "Pb", "I" }).mean, 1e-12, "mean of the per cluster means");
        test.assert_near(0.5, dimers->coordination.at({ "Pb", "I" }).std, 1e-12, "std of the per cluster means");
        test.assert_near(3.5, dimers->total_coordination, 1e-12, "total coordination");
    }
    test.assert_equal(2, statistics.mode_size, "mode of the volume distribution");
    test.assert_equal(2, statistics.phi_volume_mode_size, "mode of phi * V");

    // weights int(100 * percent): 7096 x size 2, 2903 x size 3
    const double mean_size = (2.0 * 7096 + 3.0 * 2903) / 9999.0;
    test.assert_near(mean_size, statistics.weighted_mean_size, 1e-10, "weighted mean size");
    test.assert_near(2.0, statistics.weighted_median_size, 1e-12, "weighted median size");

    const auto& summary = statistics.coordination.at({ "Pb", "I" });
    test.assert_near(4.0, summary.weighted_average, 1e-12, "count weighted coordination over all sizes");
    test.assert_near(0.25, summary.mean_std, 1e-12, "mean of the per size std");

    std::cout << "\n=== Ties and missing pairs ===" << std::endl;
    {
        std::vector<ClusterLens::ClusterRecord> tie = {
            MakeRecord("a.pdb", 4, 10.0, 0, 1.0),
            MakeRecord("b.pdb", 1, 10.0, 0, 1.0)
        };
        tie[1].coordination.clear();
        tie[1].coordination[{ "Pb", "O" }] = { 2.0, 0.0 };
        ClusterLens::BatchStatistics tied = ClusterLens::ComputeStatistics(tie);
        test.assert_equal(1, tied.mode_size, "ties go to the smallest size");
        test.assert_near(2.5, tied.weighted_median_size, 1e-12, "median between two equal halves");
        test.assert_near(0.0, tied.Find(1)->coordination.at({ "Pb", "I" }).mean, 1e-12, "pair missing in a size counts as zero");
        test.assert_near(2.0, tied.Find(1)->total_coordination, 1e-12, "total over all pairs");
    }

    std::cout << "\n=== Edge cases ===" << std::endl;
    {
        ClusterLens::BatchStatistics empty = ClusterLens::ComputeStatistics({});
        test.assert_equal(0, empty.total_clusters, "no records");
        test.assert_true(empty.sizes.empty(), "no sizes");

        std::vector<ClusterLens::ClusterRecord> single = { MakeRecord("a.pdb", 5, 42.0, -1, 2.0) };
        ClusterLens::BatchStatistics one = ClusterLens::ComputeStatistics(single);
        test.assert_near(0.0, one.sizes[0].std_volume, 0.0, "single cluster has no spread");
        test.assert_near(100.0, one.sizes[0].VolumePercentage(), 1e-12, "single size holds all volume");
        test.assert_near(5.0, one.weighted_median_size, 1e-12, "median of a single size");

        std::vector<ClusterLens::ClusterRecord> reversed(records.rbegin(), records.rend());
        test.assert_near(statistics.weighted_mean_size, ClusterLens::ComputeStatistics(reversed).weighted_mean_size, 1e-12, "order independent");

        json exported = statistics.toJson();
        test.assert_equal(2, static_cast<int>(exported["sizes"].size()), "json export per size");
        test.assert_true(exported["coordination"].contains("Pb-I"), "json export of the coordination summary");
    }

    std::cout << "\n=== MeanStd ===" << std::endl;
    auto [mean, deviation] = ClusterLens::MeanStd({ 2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0 });
    test.assert_near(5.0, mean, 1e-12, "mean");
    test.assert_near(2.0, deviation, 1e-12, "population std");

    test.print_summary();
    return test.exit_code();
}
