/*
 * <Abstract ClusterLens Method, please try to subclass from that!>
 * Copyright (C) 2020 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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
#include "src/core/global.h"

#include "clusterlensmethod.h"

ClusterLensMethod::ClusterLensMethod(const json& defaults, const json& controller, int verbosity)
    : m_defaults(defaults)
    , m_verbosity(verbosity)
{
    if (controller.count("verbose") > 0 && controller["verbose"].is_boolean() && controller["verbose"].get<bool>())
        m_verbosity = 3;

    if (controller.count("verbosity") > 0) {
        try {
            m_verbosity = controller["verbosity"].get<int>();
        } catch (const json::exception& e) {
            ClusterLensLogger::warn(std::string("Invalid verbosity, keeping ") + std::to_string(m_verbosity) + ": " + e.what());
        }
    }
    // Clamp to valid range 0-3
    setVerbosity(std::max(0, std::min(3, m_verbosity)));

    if (controller.count("threads") > 0) {
        try {
            m_threads = std::max(0, controller["threads"].get<int>());
        } catch (const json::exception& e) {
            ClusterLensLogger::warn(std::string("Invalid thread count, selecting automatically: ") + e.what());
        }
    }

    m_help = controller.count("help") > 0;
}

ClusterLensMethod::~ClusterLensMethod()
{
}

void ClusterLensMethod::setVerbosity(int level)
{
    m_verbosity = level;
    ClusterLensLogger::set_verbosity(level);
}
