/*
 * <ClusterLens main file.>
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
#include "src/core/global.h"

#include "src/capabilities/clusterbatch.h"

#include "src/tools/general.h"

#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct CapabilityInfo {
    std::string description;
    std::string category;
    std::vector<std::string> supported_formats;
    std::function<int(const json&, int, char**)> handler;
};

/* keys given on the command line win over keys from the json file */
json ImportConfig(const json& controller, const std::string& capability)
{
    json options = controller.contains(capability) ? controller[capability] : json::object();
    if (!options.contains("config"))
        return options;

    const std::string config_file = options["config"].get<std::string>();
    json imported = LoadJsonFile(config_file);
    // {"clusterbatch": {...}} and flat files are both accepted
    if (imported.contains(capability) && imported[capability].is_object())
        imported = imported[capability];

    options.erase("config");
    json merged = MergeJson(imported, options);
    ClusterLensLogger::info("Loaded configuration from: " + config_file);
    return merged;
}

int executeClusterBatch(const json& controller, int argc, char** argv)
{
    json options = ImportConfig(controller, "clusterbatch");

    ClusterBatch batch(options);
    RunTimer timer(!options.contains("help"));
    try {
        batch.start();
    } catch (const UnknownConfiguration& e) {
        ClusterLensLogger::error(std::string("Configuration: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        ClusterLensLogger::error(e.what());
        return 1;
    }
    return 0;
}

const std::map<std::string, CapabilityInfo> CAPABILITY_REGISTRY = {
    { "clusterbatch", { "Coordination, volume and charge statistics of cluster batches", "analysis", { "PDB" }, executeClusterBatch } },
};

void showStructuredHelp()
{
    std::cout << "ClusterLens - measurement of solvated clusters" << std::endl;
    std::cout << "==============================================" << std::endl;
    std::cout << std::endl;
    for (const auto& [name, info] : CAPABILITY_REGISTRY) {
        std::cout << "  -" << name << std::string(std::max(1, 18 - static_cast<int>(name.length())), ' ') << info.description << std::endl;
        std::cout << "      Formats: ";
        for (const auto& format : info.supported_formats)
            std::cout << format << " ";
        std::cout << std::endl;
    }
    std::cout << std::endl;
    std::cout << "  -export-config      print the default parameters as json" << std::endl;
    std::cout << "  -<capability> -help show the options of a capability" << std::endl;
}

int main(int argc, char** argv)
{
    ClusterLensLogger::initialize(1, true);

    if (argc < 2) {
        showStructuredHelp();
        return 1;
    }

    std::string command = argv[1];
    if (command.size() > 1 && command[0] == '-')
        command.erase(0, 1);

    if (command == "help" || command == "h") {
        showStructuredHelp();
        return 0;
    }

    if (command == "export-config") {
        std::cout << json{ { "clusterbatch", ClusterBatchJson } }.dump(4) << std::endl;
        return 0;
    }

    json controller;
    try {
        controller = CLI2Json(argc, argv);
    } catch (const std::exception& e) {
        ClusterLensLogger::error(std::string("Invalid command line: ") + e.what());
        return 1;
    }

    auto it = CAPABILITY_REGISTRY.find(command);
    if (it == CAPABILITY_REGISTRY.end()) {
        ClusterLensLogger::error("Unknown capability -" + command);
        showStructuredHelp();
        return 1;
    }

    try {
        return it->second.handler(controller, argc, argv);
    } catch (const std::exception& e) {
        ClusterLensLogger::error(e.what());
        return 1;
    }
}
