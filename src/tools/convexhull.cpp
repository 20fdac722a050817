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

#include "convexhull.h"

#include <cmath>
#include <set>
#include <utility>

namespace ConvexHull {

namespace {
inline Position Point(const Geometry& points, int i)
{
    return points.row(i).transpose();
}

struct Facet {
    int a, b, c;
    Position normal;
    double offset;
};

Facet MakeFacet(const Geometry& points, int a, int b, int c, const Position& interior)
{
    const Position pa = Point(points, a);
    const Position pb = Point(points, b);
    const Position pc = Point(points, c);
    Facet facet{ a, b, c, (pb - pa).cross(pc - pa), 0 };
    facet.normal.normalize();
    facet.offset = facet.normal.dot(pa);
    // normals point away from the interior
    if (facet.normal.dot(interior) - facet.offset > 0) {
        std::swap(facet.b, facet.c);
        facet.normal = -facet.normal;
        facet.offset = -facet.offset;
    }
    return facet;
}

double Height(const Facet& facet, const Position& point)
{
    return facet.normal.dot(point) - facet.offset;
}
}

HullResult Compute(const Geometry& points)
{
    HullResult result;
    const int size = points.rows();
    if (size < 4) {
        result.status = HullStatus::TooFewPoints;
        return result;
    }

    result.status = HullStatus::Degenerate;

    const Position lower = points.colwise().minCoeff().transpose();
    const Position upper = points.colwise().maxCoeff().transpose();
    const double extent = (upper - lower).norm();
    if (extent <= 0)
        return result;
    const double tolerance = 1e-10 * extent;

    // initial tetrahedron from extreme points
    int i0 = 0;
    for (int i = 1; i < size; ++i)
        if (points(i, 0) < points(i0, 0))
            i0 = i;
    const Position p0 = Point(points, i0);

    int i1 = -1;
    double best = tolerance;
    for (int i = 0; i < size; ++i) {
        double distance = (Point(points, i) - p0).norm();
        if (distance > best) {
            best = distance;
            i1 = i;
        }
    }
    if (i1 < 0)
        return result;
    const Position axis = (Point(points, i1) - p0).normalized();

    int i2 = -1;
    best = tolerance;
    for (int i = 0; i < size; ++i) {
        double distance = (Point(points, i) - p0).cross(axis).norm();
        if (distance > best) {
            best = distance;
            i2 = i;
        }
    }
    if (i2 < 0)
        return result;
    const Position plane = (Point(points, i1) - p0).cross(Point(points, i2) - p0).normalized();

    int i3 = -1;
    best = tolerance;
    for (int i = 0; i < size; ++i) {
        double distance = std::abs((Point(points, i) - p0).dot(plane));
        if (distance > best) {
            best = distance;
            i3 = i;
        }
    }
    if (i3 < 0)
        return result;

    const Position interior = (p0 + Point(points, i1) + Point(points, i2) + Point(points, i3)) / 4.0;

    std::vector<Facet> facets = {
        MakeFacet(points, i0, i1, i2, interior),
        MakeFacet(points, i0, i1, i3, interior),
        MakeFacet(points, i0, i2, i3, interior),
        MakeFacet(points, i1, i2, i3, interior)
    };

    for (int p = 0; p < size; ++p) {
        if (p == i0 || p == i1 || p == i2 || p == i3)
            continue;
        const Position point = Point(points, p);

        std::vector<Facet> kept;
        std::set<std::pair<int, int>> visible_edges;
        for (const auto& facet : facets) {
            if (Height(facet, point) > tolerance) {
                visible_edges.insert({ facet.a, facet.b });
                visible_edges.insert({ facet.b, facet.c });
                visible_edges.insert({ facet.c, facet.a });
            } else
                kept.push_back(facet);
        }
        if (visible_edges.empty())
            continue;

        // horizon: edges of the visible region whose twin belongs to a kept facet
        for (const auto& edge : visible_edges) {
            if (visible_edges.count({ edge.second, edge.first }) == 0)
                kept.push_back(MakeFacet(points, edge.first, edge.second, p, interior));
        }
        facets.swap(kept);
    }

    double volume = 0;
    for (const auto& facet : facets) {
        const Position a = Point(points, facet.a) - interior;
        const Position b = Point(points, facet.b) - interior;
        const Position c = Point(points, facet.c) - interior;
        volume += std::abs(a.dot(b.cross(c))) / 6.0;
    }

    result.status = HullStatus::Ok;
    result.volume = volume;
    return result;
}
}
