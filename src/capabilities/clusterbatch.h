/*
 * <Batch analysis of cluster structure files>
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

#include "src/core/config_manager.h"
#include "src/core/global.h"
#include "src/core/structure.h"

#include "src/capabilities/cluster/cluster_config.h"
#include "src/capabilities/cluster/cluster_statistics.h"
#include "src/capabilities/cluster/radius_lookup.h"
#include "src/capabilities/cluster/volume_estimators.h"

#include "clusterlensmethod.h"

#include <CxxThreadPool.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

class ReferenceDataProvider;

static const json ClusterBatchJson{
    { "directory", "." },
    { "extension", ".pdb" },
    { "target_elements", json::array({ "Pb" }) },
    { "neighbor_elements", json::array({ "I", "O" }) },
    { "distance_thresholds", { { "Pb", { { "I", 3.6 }, { "O", 3.0 } } } } }, // Angstrom, target -> neighbor
    { "charges", { { "Pb", { 2, 6 } }, { "I", { -1, 6 } } } }, // element -> [formal charge, coordination]
    { "core_residues", json::array({ "PBI" }) },
    { "shell_residues", json::array({ "DMS" }) },
    { "volume_method", "ionic_radius" }, // ionic_radius, radius_of_gyration, convex_hull, coherent_scattering, outward_facing
    { "shape", "sphere" }, // sphere or ellipsoid, radius_of_gyration only
    { "energy", 17000.0 }, // eV, coherent_scattering only
    { "threads", 0 }, // 0 = cores - 1
    { "copy_unmatched", false },
    { "unmatched_directory", "no_target_atoms" },
    { "output_file", "" },
    { "verbosity", 1 }
};

namespace ClusterLens {

/* indices of core atoms that are target atoms, core atoms come first in ClusterStructure::AllAtoms */
std::vector<int> TargetIndices(const ClusterStructure& structure, const ClusterSettings& settings);

/*! \brief Measures one cluster that has at least one target atom */
ClusterRecord MeasureCluster(const std::string& file, const ClusterStructure& structure, const ClusterSettings& settings, const VolumeEstimator& estimator);
}

/*! \brief Worker for one structure file
 *
 * execute never throws: the outcome is a record, an unmatched file (no target
 * atoms) or a failure with the exception message.
 */
class ClusterFileThread : public CxxThread {
public:
    enum class Outcome {
        Pending,
        Record,
        Unmatched,
        Failed
    };

    ClusterFileThread(const std::string& file, const StructureLoader& loader, const ClusterLens::ClusterSettings& settings, const ClusterLens::VolumeEstimator& estimator);
    ~ClusterFileThread() = default;

    int execute() override;

    Outcome getOutcome() const { return m_outcome; }
    const ClusterLens::ClusterRecord& Record() const { return m_record; }
    std::string Error() const { return m_error; }
    std::string File() const { return m_file; }

private:
    std::string m_file;
    const StructureLoader& m_loader;
    const ClusterLens::ClusterSettings& m_settings;
    const ClusterLens::VolumeEstimator& m_estimator;

    Outcome m_outcome = Outcome::Pending;
    ClusterLens::ClusterRecord m_record;
    std::string m_error;
};

/*! \brief Runs the per file workers on a thread pool and aggregates their records
 *
 * Configuration is validated in Initialise, before any file is touched, and
 * UnknownConfiguration is thrown for unknown methods, shapes or elements. A
 * started batch always completes, unreadable or failing files end up in
 * Failures().
 */
class ClusterBatch : public ClusterLensMethod {
public:
    ClusterBatch(const json& controller = ClusterBatchJson, int verbosity = 1);
    ~ClusterBatch();

    /* replaces the PDB reader, e.g. by an in-memory source */
    void setLoader(std::shared_ptr<const StructureLoader> loader) { m_loader = loader; }

    void setReferenceData(std::shared_ptr<const ReferenceDataProvider> reference) { m_reference = reference; }

    /* explicit file list instead of scanning the directory */
    void setFiles(const StringList& files) { m_files = files; }

    bool Initialise() override;
    void start() override;
    void printHelp() const override;

    StringList EnumerateFiles() const;

    const std::vector<ClusterLens::ClusterRecord>& Records() const { return m_records; }
    const StringList& Unmatched() const { return m_unmatched; }
    const std::vector<std::pair<std::string, std::string>>& Failures() const { return m_failures; }
    const ClusterLens::BatchStatistics& Statistics() const { return m_statistics; }
    const ClusterLens::ClusterSettings& Settings() const { return m_settings; }
    const ClusterLens::RadiusLookup& Lookup() const { return m_lookup; }

    json Results() const;

private:
    void LoadControlJson() override;

    void RunPool(const StringList& files);
    void CopyUnmatched() const;
    void PrintSummary() const;
    void WriteResults() const;

    ConfigManager m_config;
    ClusterLens::ClusterSettings m_settings;
    ClusterLens::RadiusLookup m_lookup;
    std::unique_ptr<ClusterLens::VolumeEstimator> m_estimator;

    std::shared_ptr<const StructureLoader> m_loader;
    std::shared_ptr<const ReferenceDataProvider> m_reference;

    StringList m_files;
    std::string m_directory, m_extension, m_unmatched_directory, m_output_file;
    bool m_copy_unmatched = false;
    bool m_initialised = false;

    std::vector<ClusterLens::ClusterRecord> m_records;
    StringList m_unmatched;
    std::vector<std::pair<std::string, std::string>> m_failures;
    ClusterLens::BatchStatistics m_statistics;
};
