/*
 * <Convex hull of three-dimensional point sets>
 * Copyright (C) 2019 - 2020 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include <vector>

namespace ConvexHull {

enum class HullStatus {
    Ok,
    TooFewPoints, // less than four points
    Degenerate // coincident, collinear or coplanar points
};

struct HullResult {
    HullStatus status = HullStatus::TooFewPoints;
    double volume = 0;
};

/*! \brief Incremental convex hull, volume in units of the input cubed
 *
 * Points closer than a relative tolerance to a facet plane count as inside.
 * Sets without volume give a zero result with the status set accordingly,
 * the caller decides how to report them.
 */
HullResult Compute(const Geometry& points);

}
