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

#include "src/core/clusterlens_logger.h"
#include "src/core/errors.h"
#include "src/core/pdbloader.h"
#include "src/core/reference_data.h"

#include "src/capabilities/cluster/cluster_charge.h"
#include "src/capabilities/cluster/coordination.h"

#include "clusterbatch.h"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace ClusterLens {

std::vector<int> TargetIndices(const ClusterStructure& structure, const ClusterSettings& settings)
{
    std::vector<int> targets;
    for (int i = 0; i < static_cast<int>(structure.core.size()); ++i)
        if (settings.IsTarget(structure.core[i].element))
            targets.push_back(i);
    return targets;
}

ClusterRecord MeasureCluster(const std::string& file, const ClusterStructure& structure, const ClusterSettings& settings, const VolumeEstimator& estimator)
{
    const std::vector<Atom> atoms = structure.AllAtoms();
    const std::vector<int> targets = TargetIndices(structure, settings);

    std::vector<Atom> target_atoms;
    for (int index : targets)
        target_atoms.push_back(atoms[index]);

    ClusterRecord record;
    record.file = file;
    record.size = static_cast<int>(targets.size());
    record.coordination = ComputeCoordination(atoms, targets, settings);

    VolumeResult volume = estimator.Estimate(structure, target_atoms);
    record.volume = volume.volume;
    record.has_principal_radii = volume.has_principal_radii;
    record.principal_radii = volume.principal_radii;

    record.charge = ClusterCharge(structure, settings.charges);
    return record;
}
}

ClusterFileThread::ClusterFileThread(const std::string& file, const StructureLoader& loader, const ClusterLens::ClusterSettings& settings, const ClusterLens::VolumeEstimator& estimator)
    : m_file(file)
    , m_loader(loader)
    , m_settings(settings)
    , m_estimator(estimator)
{
    setAutoDelete(true);
}

int ClusterFileThread::execute()
{
    try {
        const ClusterStructure structure = m_loader.Load(m_file);
        if (ClusterLens::TargetIndices(structure, m_settings).empty()) {
            m_outcome = Outcome::Unmatched;
            ClusterLensLogger::verbose_fmt("{}: no target atoms", m_file);
            return 0;
        }
        m_record = ClusterLens::MeasureCluster(m_file, structure, m_settings, m_estimator);
        m_outcome = Outcome::Record;
        ClusterLensLogger::verbose_fmt("{}: size {}, volume {:.3f} Å³, charge {:+d}", m_file, m_record.size, m_record.volume, m_record.charge);
    } catch (const std::exception& e) {
        m_outcome = Outcome::Failed;
        m_error = e.what();
        ClusterLensLogger::error_fmt("{}: {}", m_file, m_error);
    }
    return 0;
}

ClusterBatch::ClusterBatch(const json& controller, int verbosity)
    : ClusterLensMethod(ClusterBatchJson, controller, verbosity)
    , m_config("clusterbatch", ClusterBatchJson, controller)
{
    LoadControlJson();
}

ClusterBatch::~ClusterBatch()
{
}

void ClusterBatch::LoadControlJson()
{
    m_directory = m_config.get<std::string>("directory");
    m_extension = m_config.get<std::string>("extension");
    if (!m_extension.empty() && m_extension[0] != '.')
        m_extension = "." + m_extension;
    m_copy_unmatched = m_config.get<bool>("copy_unmatched");
    m_unmatched_directory = m_config.get<std::string>("unmatched_directory");
    m_output_file = m_config.get<std::string>("output_file");
}

bool ClusterBatch::Initialise()
{
    if (m_initialised)
        return true;

    m_settings = ClusterLens::ParseClusterSettings(m_config);

    if (!m_reference)
        m_reference = std::make_shared<TabulatedReferenceData>();
    if (!m_loader)
        m_loader = std::make_shared<PDBStructureLoader>(Json2StringList(m_config.get<json>("core_residues")), Json2StringList(m_config.get<json>("shell_residues")));

    m_lookup = ClusterLens::RadiusLookup::Build(m_settings.charges, *m_reference);
    if (m_settings.volume.method == ClusterLens::VolumeMethod::IonicRadius && m_lookup.Empty())
        throw UnknownConfiguration("The ionic_radius method needs formal charges with coordination numbers");

    m_estimator = std::make_unique<ClusterLens::VolumeEstimator>(m_settings, *m_reference, m_lookup);

    if (m_threads <= 0)
        m_threads = SafeThreadCount("cpu");

    ClusterLensLogger::header("Cluster batch analysis");
    ClusterLensLogger::param("volume method", ClusterLens::VolumeMethodName(m_settings.volume.method));
    if (m_settings.volume.method == ClusterLens::VolumeMethod::RadiusOfGyration)
        ClusterLensLogger::param("shape", ClusterLens::ShapeName(m_settings.volume.shape));
    if (m_settings.volume.method == ClusterLens::VolumeMethod::CoherentScattering)
        ClusterLensLogger::param("energy / eV", m_settings.volume.energy);
    ClusterLensLogger::param("threads", m_threads);
    if (m_verbosity >= 2)
        ClusterLensLogger::param_table(m_config.exportConfig(), "Cluster batch parameters");

    m_initialised = true;
    return true;
}

StringList ClusterBatch::EnumerateFiles() const
{
    if (!m_files.empty())
        return m_files;

    std::error_code error;
    if (!fs::is_directory(m_directory, error))
        throw UnknownConfiguration("Structure directory " + m_directory + " does not exist");

    StringList files;
    for (const auto& entry : fs::directory_iterator(m_directory)) {
        if (!entry.is_regular_file())
            continue;
        if (m_extension.empty() || entry.path().extension().string() == m_extension)
            files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

void ClusterBatch::start()
{
    if (m_help) {
        printHelp();
        return;
    }

    Initialise();
    const StringList files = EnumerateFiles();
    ClusterLensLogger::info_fmt("{} structure files found", files.size());

    m_records.clear();
    m_unmatched.clear();
    m_failures.clear();

    if (!files.empty())
        RunPool(files);

    // completion order is arbitrary
    std::sort(m_records.begin(), m_records.end(), [](const ClusterLens::ClusterRecord& a, const ClusterLens::ClusterRecord& b) {
        return a.file < b.file;
    });
    std::sort(m_unmatched.begin(), m_unmatched.end());
    std::sort(m_failures.begin(), m_failures.end());

    if (m_copy_unmatched)
        CopyUnmatched();

    m_statistics = ClusterLens::ComputeStatistics(m_records);

    PrintSummary();
    if (!m_output_file.empty())
        WriteResults();
}

void ClusterBatch::RunPool(const StringList& files)
{
    CxxThreadPool* pool = new CxxThreadPool;
    pool->setActiveThreadCount(m_threads);
    if (m_verbosity == 0)
        pool->setProgressBar(CxxThreadPool::ProgressBarType::None);
    else
        pool->setProgressBar(CxxThreadPool::ProgressBarType::Continously);

    for (const auto& file : files) {
        ClusterFileThread* thread = new ClusterFileThread(file, *m_loader, m_settings, *m_estimator);
        pool->addThread(thread);
    }

    pool->StartAndWait();

    std::set<std::string> seen;
    for (auto* t : pool->getFinishedThreads()) {
        ClusterFileThread* thread = static_cast<ClusterFileThread*>(t);
        seen.insert(thread->File());
        switch (thread->getOutcome()) {
        case ClusterFileThread::Outcome::Record:
            m_records.push_back(thread->Record());
            break;
        case ClusterFileThread::Outcome::Unmatched:
            m_unmatched.push_back(thread->File());
            break;
        case ClusterFileThread::Outcome::Failed:
            m_failures.emplace_back(thread->File(), thread->Error());
            break;
        case ClusterFileThread::Outcome::Pending:
            m_failures.emplace_back(thread->File(), "worker did not finish");
            break;
        }
    }
    delete pool;

    for (const auto& file : files) {
        if (seen.count(file) == 0)
            m_failures.emplace_back(file, "worker did not finish");
    }
}

void ClusterBatch::CopyUnmatched() const
{
    if (m_unmatched.empty())
        return;

    std::error_code error;
    fs::create_directories(m_unmatched_directory, error);
    if (error) {
        ClusterLensLogger::warn_fmt("Could not create {}: {}", m_unmatched_directory, error.message());
        return;
    }
    for (const auto& file : m_unmatched) {
        const fs::path target = fs::path(m_unmatched_directory) / fs::path(file).filename();
        fs::copy_file(file, target, fs::copy_options::overwrite_existing, error);
        if (error)
            ClusterLensLogger::warn_fmt("Could not copy {} to {}: {}", file, target.string(), error.message());
    }
    ClusterLensLogger::info_fmt("{} files without target atoms copied to {}", m_unmatched.size(), m_unmatched_directory);
}

void ClusterBatch::PrintSummary() const
{
    ClusterLensLogger::success_fmt("{} clusters measured, {} files without target atoms, {} failed", m_records.size(), m_unmatched.size(), m_failures.size());
    for (const auto& [file, error] : m_failures)
        ClusterLensLogger::warn_fmt("failed: {} ({})", file, error);

    if (m_verbosity < 1 || m_statistics.sizes.empty())
        return;

    ClusterLensLogger::result_raw(fmt::format("{:>6} {:>6} {:>12} {:>10} {:>9} {:>12} {:>9} {:>8}",
        "size", "count", "<V>/Å³", "std", "phi/%", "phi*<V>", "<q>/e", "CN"));
    for (const auto& statistics : m_statistics.sizes) {
        ClusterLensLogger::result_raw(fmt::format("{:>6} {:>6} {:>12.3f} {:>10.3f} {:>9.2f} {:>12.3f} {:>9.2f} {:>8.2f}",
            statistics.size, statistics.count, statistics.mean_volume, statistics.std_volume,
            statistics.VolumePercentage(), statistics.phi_volume, statistics.mean_charge, statistics.total_coordination));
    }

    const ClusterLens::SizeStatistics* mode = m_statistics.Find(m_statistics.mode_size);
    if (mode != nullptr)
        ClusterLensLogger::result_raw(fmt::format("Mode: cluster size = {}, total cluster volume % = {:.2f}%", mode->size, mode->VolumePercentage()));
    ClusterLensLogger::result_raw(fmt::format("Mode of phi*<V>: cluster size = {}", m_statistics.phi_volume_mode_size));
    ClusterLensLogger::result_raw(fmt::format("Weighted median cluster size = {:.2f}, weighted mean cluster size = {:.2f}",
        m_statistics.weighted_median_size, m_statistics.weighted_mean_size));

    for (const auto& [pair, summary] : m_statistics.coordination)
        ClusterLensLogger::result_raw(fmt::format("{} - {}, CN: {:.2f} ± {:.2f}", pair.first, pair.second, summary.weighted_average, summary.mean_std));
}

json ClusterBatch::Results() const
{
    json results;
    results["settings"] = m_config.exportConfig();
    results["radius_lookup"] = m_lookup.toJson();

    json records = json::array();
    for (const auto& record : m_records)
        records.push_back(record.toJson());
    results["records"] = records;

    results["statistics"] = m_statistics.toJson();
    results["unmatched"] = m_unmatched;

    json failed = json::array();
    for (const auto& [file, error] : m_failures)
        failed.push_back({ { "file", file }, { "error", error } });
    results["failed"] = failed;
    return results;
}

void ClusterBatch::WriteResults() const
{
    std::ofstream output(m_output_file);
    if (!output.is_open()) {
        ClusterLensLogger::error("Could not write results to " + m_output_file);
        return;
    }
    output << Results().dump(4) << std::endl;
    ClusterLensLogger::info("Results written to " + m_output_file);
}

void ClusterBatch::printHelp() const
{
    std::cout << "Cluster batch analysis - coordination, volume and charge of cluster structure files" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: clusterlens -clusterbatch [options]" << std::endl;
    std::cout << "  -directory <dir>          folder with structure files (default .)" << std::endl;
    std::cout << "  -extension <ext>          file extension (default .pdb)" << std::endl;
    std::cout << "  -target_elements <list>   e.g. Pb" << std::endl;
    std::cout << "  -neighbor_elements <list> e.g. I,O,S" << std::endl;
    std::cout << "  -volume_method <name>     ionic_radius, radius_of_gyration, convex_hull," << std::endl;
    std::cout << "                            coherent_scattering, outward_facing" << std::endl;
    std::cout << "  -shape <name>             sphere or ellipsoid (radius_of_gyration)" << std::endl;
    std::cout << "  -energy <eV>              photon energy (coherent_scattering, default 17000)" << std::endl;
    std::cout << "  -threads <n>              worker threads (default cores - 1)" << std::endl;
    std::cout << "  -copy_unmatched true      copy files without target atoms" << std::endl;
    std::cout << "  -unmatched_directory <d>  destination for those files" << std::endl;
    std::cout << "  -output_file <file.json>  write records and statistics" << std::endl;
    std::cout << "  -config <file.json>       json file with further options," << std::endl;
    std::cout << "                            needed for distance_thresholds and charges" << std::endl;
    std::cout << std::endl;
    std::cout << "Defaults:" << std::endl;
    std::cout << m_defaults.dump(4) << std::endl;
}
