/*
 * <Run timer for command line programs.>
 * Copyright (C) 2020 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include <chrono>
#include <ctime>
#include <string>

#include <fmt/core.h>

#include "src/core/clusterlens_logger.h"

/* reports start, end and wall time of a run, only if print is set */
class RunTimer {
public:
    RunTimer(bool print = false)
        : m_print(print)
    {
        m_start = std::chrono::system_clock::now();
        if (m_print)
            ClusterLensLogger::info("Started computation at " + TimeString(m_start));
    }

    ~RunTimer()
    {
        if (m_print) {
            int elapsed = Elapsed();
            ClusterLensLogger::info(fmt::format("Finished after {:.3f} seconds at {}", elapsed / 1000.0, TimeString(m_end)));
        }
    }

    /* milliseconds since construction or the last Reset */
    inline int Elapsed()
    {
        m_end = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(m_end - m_start).count();
    }

    inline void Reset()
    {
        m_start = std::chrono::system_clock::now();
    }

private:
    static std::string TimeString(const std::chrono::time_point<std::chrono::system_clock>& point)
    {
        std::time_t time = std::chrono::system_clock::to_time_t(point);
        std::string string = std::ctime(&time);
        if (!string.empty() && string.back() == '\n')
            string.pop_back();
        return string;
    }

    std::chrono::time_point<std::chrono::system_clock> m_start, m_end;
    bool m_print;
};
