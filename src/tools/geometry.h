/*
 * <Geometry tools for chemical structures.>
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

#include <Eigen/Dense>

#include "src/core/global.h"

#include <array>
#include <cmath>
#include <vector>

namespace GeometryTools {

inline double Distance(const Position& a, const Position& b)
{
    double distance = 0;
    distance = sqrt((a(0) - b(0)) * (a(0) - b(0)) + (a(1) - b(1)) * (a(1) - b(1)) + (a(2) - b(2)) * (a(2) - b(2)));
    return distance;
}

inline Geometry Positions2Geometry(const std::vector<Position>& positions)
{
    Geometry geom = Geometry::Zero(positions.size(), 3);
    for (std::size_t i = 0; i < positions.size(); ++i)
        geom.row(i) = positions[i].transpose();
    return geom;
}

inline Position Centroid(const Geometry& geom)
{
    Position position{ 0, 0, 0 };

    for (int i = 0; i < geom.rows(); ++i) {
        position += geom.row(i);
    }

    position /= double(geom.rows());

    return position;
}

/* sum_i w_i r_i / sum_i w_i, weights.size() == geom.rows() */
inline Position WeightedCentroid(const Geometry& geom, const Vector& weights)
{
    Position position{ 0, 0, 0 };
    for (int i = 0; i < geom.rows(); ++i)
        position += weights(i) * geom.row(i).transpose();
    return position / weights.sum();
}

/*! \brief The 20 vertices of a regular dodecahedron on the unit sphere
 *
 * (+-1, +-1, +-1), (0, +-1/phi, +-phi), (+-1/phi, +-phi, 0), (+-phi, 0, +-1/phi)
 * with phi the golden ratio, all divided by sqrt(3).
 */
inline std::vector<Position> DodecahedronVertices()
{
    const double phi = (1.0 + std::sqrt(5.0)) / 2.0;
    const double inv = 1.0 / phi;
    std::vector<Position> vertices;
    for (double x : { -1.0, 1.0 })
        for (double y : { -1.0, 1.0 })
            for (double z : { -1.0, 1.0 })
                vertices.emplace_back(x, y, z);
    for (double a : { -1.0, 1.0 }) {
        for (double b : { -1.0, 1.0 }) {
            vertices.emplace_back(0, a * inv, b * phi);
            vertices.emplace_back(a * inv, b * phi, 0);
            vertices.emplace_back(a * phi, 0, b * inv);
        }
    }
    const double norm = vertices[0].norm();
    for (auto& vertex : vertices)
        vertex /= norm;
    return vertices;
}
}
