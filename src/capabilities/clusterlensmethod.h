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

#pragma once

#include "src/core/global.h"

#include <iostream>
#include <string>

class ClusterLensMethod {
public:
    ClusterLensMethod(const json& defaults, const json& controller, int verbosity);
    virtual ~ClusterLensMethod();

    virtual bool Initialise() { return true; }

    virtual void start() = 0;
    virtual void printHelp() const { std::cout << "No help available for this method." << std::endl; };

protected:
    json m_defaults;

    /* local verbosity and the logger are always kept in sync */
    void setVerbosity(int level);

    bool m_help = false;
    int m_verbosity = 1; // 0=Silent, 1=Normal, 2=Informative, 3=Verbose
    int m_threads = 0; // 0 selects the thread count automatically

private:
    /* Read Controller has to be implemented for all */
    virtual void LoadControlJson() = 0;
};
