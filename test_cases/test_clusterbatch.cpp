/*
 * <Tests for the threaded cluster batch>
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

#include "src/core/clusterlens_logger.h"
#include "src/core/errors.h"

#include "src/capabilities/clusterbatch.h"

#include "test_helper.h"

#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>

namespace {
Atom MakeAtom(const std::string& element, double x, double y, double z, AtomGroup group)
{
    Atom atom;
    atom.element = element;
    atom.position = Position(x, y, z);
    atom.group = group;
    return atom;
}

/* cluster_i holds (i % 3) + 1 PbI2 units, cluster_03 is unreadable, cluster_07 has no lead */
class MemoryLoader : public StructureLoader {
public:
    ClusterStructure Load(const std::string& file) const override
    {
        if (file == "cluster_03.pdb")
            throw StructureLoadError("Could not open " + file);

        ClusterStructure structure;
        if (file == "cluster_07.pdb") {
            structure.shell.push_back(MakeAtom("O", 0, 0, 0, AtomGroup::Shell));
            return structure;
        }

        const int index = std::stoi(file.substr(8, 2));
        const int units = index % 3 + 1;
        for (int i = 0; i < units; ++i) {
            const double x = 8.0 * i;
            structure.core.push_back(MakeAtom("Pb", x, 0, 0, AtomGroup::Core));
            structure.core.push_back(MakeAtom("I", x + 3.0, 0, 0, AtomGroup::Core));
            structure.core.push_back(MakeAtom("I", x - 3.0, 0, 0, AtomGroup::Core));
        }
        structure.shell.push_back(MakeAtom("O", 0, 2.5, 0, AtomGroup::Shell));
        return structure;
    }
};

StringList FileNames(int count)
{
    StringList files;
    for (int i = count - 1; i >= 0; --i)
        files.push_back(fmt::format("cluster_{:02d}.pdb", i));
    return files;
}
}

int main()
{
    ClusterLensLogger::initialize(0, false);
    ClusterLensTest test;

    const double lead = 4.0 / 3.0 * pi * std::pow(1.19, 3);
    const double iodide = 4.0 / 3.0 * pi * std::pow(2.20, 3);
    const double oxygen = 4.0 / 3.0 * pi * std::pow(1.40, 3);

    json controller = {
        { "threads", 4 },
        { "verbosity", 0 },
        { "charges", { { "Pb", { 2, 6 } }, { "I", { -1, 6 } }, { "O", { -2, 6 } } } }
    };

    std::cout << "\n=== Batch with failures ===" << std::endl;
    {
        ClusterBatch batch(controller);
        batch.setLoader(std::make_shared<MemoryLoader>());
        batch.setFiles(FileNames(10));
        batch.start();

        test.assert_equal(8, static_cast<int>(batch.Records().size()), "eight clusters measured");
        test.assert_equal(1, static_cast<int>(batch.Unmatched().size()), "one file without target atoms");
        test.assert_equal(std::string("cluster_07.pdb"), batch.Unmatched().front(), "unmatched file");
        test.assert_equal(1, static_cast<int>(batch.Failures().size()), "one failed file");
        test.assert_equal(std::string("cluster_03.pdb"), batch.Failures().front().first, "failed file");
        test.assert_true(batch.Failures().front().second.find("Could not open") != std::string::npos, "failure message is kept");

        bool sorted = true;
        for (std::size_t i = 1; i < batch.Records().size(); ++i)
            sorted = sorted && batch.Records()[i - 1].file < batch.Records()[i].file;
        test.assert_true(sorted, "records are sorted by file");

        const ClusterLens::ClusterRecord& first = batch.Records().front();
        test.assert_equal(std::string("cluster_00.pdb"), first.file, "first record");
        test.assert_equal(1, first.size, "one lead atom");
        test.assert_equal(-2, first.charge, "PbI2 + O2- charge");
        test.assert_near(lead + 2 * iodide + oxygen, first.volume, 1e-9, "ionic volume including the shell");
        test.assert_near(2.0, first.coordination.at({ "Pb", "I" }).mean, 1e-12, "Pb-I coordination");
        test.assert_near(1.0, first.coordination.at({ "Pb", "O" }).mean, 1e-12, "Pb-O coordination");

        // sizes: 0,6,9 -> 1; 1,4 -> 2; 2,5,8 -> 3
        const ClusterLens::BatchStatistics& statistics = batch.Statistics();
        test.assert_equal(8, statistics.total_clusters, "statistics over all records");
        test.assert_equal(3, static_cast<int>(statistics.sizes.size()), "three cluster sizes");
        test.assert_equal(3, statistics.Find(1)->count, "three single lead clusters");
        test.assert_equal(2, statistics.Find(2)->count, "two double lead clusters");
        test.assert_equal(3, statistics.Find(3)->count, "three triple lead clusters");
        test.assert_equal(3, statistics.mode_size, "largest share of the volume");

        json results = batch.Results();
        test.assert_equal(8, static_cast<int>(results["records"].size()), "records in the json export");
        test.assert_equal(1, static_cast<int>(results["failed"].size()), "failures in the json export");
        test.assert_true(results.contains("radius_lookup"), "lookup in the json export");
    }

    std::cout << "\n=== Thread count independence ===" << std::endl;
    {
        json single = controller;
        single["threads"] = 1;
        ClusterBatch serial(single);
        serial.setLoader(std::make_shared<MemoryLoader>());
        serial.setFiles(FileNames(10));
        serial.start();

        ClusterBatch parallel(controller);
        parallel.setLoader(std::make_shared<MemoryLoader>());
        parallel.setFiles(FileNames(10));
        parallel.start();

        test.assert_true(serial.Statistics().toJson() == parallel.Statistics().toJson(), "same statistics for 1 and 4 threads");
    }

    std::cout << "\n=== Configuration errors ===" << std::endl;
    {
        json bad = controller;
        bad["volume_method"] = "voronoi";
        ClusterBatch batch(bad);
        batch.setLoader(std::make_shared<MemoryLoader>());
        batch.setFiles(FileNames(2));
        test.assert_throws<UnknownConfiguration>([&]() { batch.start(); }, "unknown volume method stops the batch");
        test.assert_true(batch.Records().empty(), "no file processed");
    }
    {
        json missing = controller;
        missing["directory"] = "clusterlens_missing_directory";
        ClusterBatch batch(missing);
        test.assert_throws<UnknownConfiguration>([&]() { batch.start(); }, "missing directory");
    }
    {
        json no_charges = controller;
        no_charges["charges"] = json::object();
        ClusterBatch batch(no_charges);
        batch.setLoader(std::make_shared<MemoryLoader>());
        batch.setFiles(FileNames(2));
        test.assert_throws<UnknownConfiguration>([&]() { batch.start(); }, "ionic radii need charges");
    }

    std::cout << "\n=== Missing radius ===" << std::endl;
    {
        json partial = controller;
        partial["charges"] = { { "Pb", { 2, 6 } }, { "I", { -1, 6 } } };
        ClusterBatch batch(partial);
        batch.setLoader(std::make_shared<MemoryLoader>());
        batch.setFiles(FileNames(3));
        batch.start();
        test.assert_equal(0, static_cast<int>(batch.Records().size()), "oxygen without radius fails every cluster");
        test.assert_equal(3, static_cast<int>(batch.Failures().size()), "failures are collected, the batch completes");
    }

    std::cout << "\n=== Directory scan and copy ===" << std::endl;
    {
        namespace fs = std::filesystem;
        const fs::path directory = "clusterlens_batch_test";
        fs::remove_all(directory);
        fs::create_directories(directory);
        {
            std::ofstream(directory / "a.pdb") << "HETATM    1 PB1  PBI A   1       0.000   0.000   0.000  1.00  0.00          PB" << "\n";
            std::ofstream(directory / "b.pdb") << "HETATM    1  S1  DMS A   1       0.000   0.000   0.000  1.00  0.00           S" << "\n";
            std::ofstream(directory / "notes.txt") << "not a structure" << "\n";
        }

        json scan = controller;
        scan["directory"] = directory.string();
        scan["copy_unmatched"] = true;
        scan["unmatched_directory"] = (directory / "unmatched").string();
        scan["charges"] = { { "Pb", { 2, 6 } }, { "S", { -2, 6 } } };
        ClusterBatch batch(scan);

        StringList files = batch.EnumerateFiles();
        test.assert_equal(2, static_cast<int>(files.size()), "only .pdb files are collected");

        batch.start();
        test.assert_equal(1, static_cast<int>(batch.Records().size()), "one cluster with lead");
        test.assert_near(lead, batch.Records().front().volume, 1e-9, "single lead ion volume");
        test.assert_equal(1, static_cast<int>(batch.Unmatched().size()), "solvent only file");
        test.assert_true(fs::exists(directory / "unmatched" / "b.pdb"), "unmatched file is copied");
        fs::remove_all(directory);
    }

    test.print_summary();
    return test.exit_code();
}
