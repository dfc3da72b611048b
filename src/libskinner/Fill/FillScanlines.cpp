///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "FillScanlines.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <boost/log/trivial.hpp>

namespace Skinner {

namespace FillScanlines {

// Rounding towards minus infinity.
static inline coord_t floor_div(coord_t a, coord_t b)
{
    coord_t q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

static inline coord_t ceil_div(coord_t a, coord_t b)
{
    return - floor_div(- a, b);
}

void add_x_intersections(const Polygons &loops, coord_t spacing, XIntersectionsTable &table)
{
    assert(spacing > 0);
    for (const Polygon &loop : loops) {
        const Points &pts = loop.points;
        if (pts.size() < 2)
            continue;
        for (size_t i = 0, j = pts.size() - 1; i < pts.size(); j = i ++) {
            const Point &p1 = pts[j];
            const Point &p2 = pts[i];
            if (p1.y() == p2.y())
                continue;
            const Point &lo = p1.y() < p2.y() ? p1 : p2;
            const Point &hi = p1.y() < p2.y() ? p2 : p1;
            // rows with lo.y <= row * spacing < hi.y
            coord_t row_first = ceil_div(lo.y(), spacing);
            coord_t row_end   = ceil_div(hi.y(), spacing);
            double  dxdy      = double(hi.x() - lo.x()) / double(hi.y() - lo.y());
            for (coord_t row = row_first; row < row_end; ++ row) {
                double y = double(row * spacing);
                table[row].emplace_back(coord_t(std::round(double(lo.x()) + (y - double(lo.y())) * dxdy)));
            }
        }
    }
}

XIntersectionsTable x_intersections(const Polygons &loops, coord_t spacing)
{
    XIntersectionsTable table;
    add_x_intersections(loops, spacing, table);
    return table;
}

Lines segments_from_x_intersections(XIntersectionsTable &table, coord_t spacing)
{
    Lines segments;
    for (auto &row : table) {
        std::vector<coord_t> &xs = row.second;
        std::sort(xs.begin(), xs.end());
        if (xs.size() % 2 == 1)
            BOOST_LOG_TRIVIAL(trace) << "FillScanlines: odd number of intersections on row " << row.first;
        coord_t y = row.first * spacing;
        for (size_t i = 0; i + 1 < xs.size(); i += 2)
            if (xs[i] != xs[i + 1])
                segments.emplace_back(Point(xs[i], y), Point(xs[i + 1], y));
    }
    return segments;
}

coord_t CellIndex::cell_coord(coord_t v) const
{
    return floor_div(v, m_cell_size);
}

BoundaryGrid::BoundaryGrid(const Polygons &boundary, coord_t cell_size) : m_index(cell_size)
{
    for (const Polygon &loop : boundary) {
        const Points &pts = loop.points;
        if (pts.size() < 2)
            continue;
        for (size_t i = 0, j = pts.size() - 1; i < pts.size(); j = i ++)
            m_edges.emplace_back(pts[j], pts[i]);
        m_bbox.merge(pts);
    }
    for (size_t idx = 0; idx < m_edges.size(); ++ idx) {
        const Line &edge = m_edges[idx];
        coord_t cx0 = m_index.cell_coord(std::min(edge.a.x(), edge.b.x()));
        coord_t cx1 = m_index.cell_coord(std::max(edge.a.x(), edge.b.x()));
        coord_t cy0 = m_index.cell_coord(std::min(edge.a.y(), edge.b.y()));
        coord_t cy1 = m_index.cell_coord(std::max(edge.a.y(), edge.b.y()));
        for (coord_t cy = cy0; cy <= cy1; ++ cy)
            for (coord_t cx = cx0; cx <= cx1; ++ cx)
                m_index.insert(cx, cy, idx);
    }
}

std::vector<size_t> BoundaryGrid::edges_in_cells(coord_t cx0, coord_t cy0, coord_t cx1, coord_t cy1) const
{
    std::vector<size_t> out;
    for (coord_t cy = cy0; cy <= cy1; ++ cy)
        for (coord_t cx = cx0; cx <= cx1; ++ cx)
            if (const std::vector<size_t> *cell = m_index.cell(cx, cy); cell != nullptr)
                out.insert(out.end(), cell->begin(), cell->end());
    sort_remove_duplicates(out);
    return out;
}

bool BoundaryGrid::crosses(const Point &a, const Point &b) const
{
    if (m_edges.empty() || a == b)
        return false;
    Line connection(a, b);
    for (size_t idx : this->edges_in_cells(
            m_index.cell_coord(std::min(a.x(), b.x())), m_index.cell_coord(std::min(a.y(), b.y())),
            m_index.cell_coord(std::max(a.x(), b.x())), m_index.cell_coord(std::max(a.y(), b.y()))))
        if (connection.crosses(m_edges[idx], SCALED_EPSILON))
            return true;
    return false;
}

bool BoundaryGrid::inside(const Point &pt) const
{
    if (m_edges.empty() || ! m_bbox.contains(pt))
        return false;
    coord_t cx = m_index.cell_coord(pt.x());
    coord_t cy = m_index.cell_coord(pt.y());
    // On the boundary.
    for (size_t idx : this->edges_in_cells(cx, cy, cx, cy))
        if (pt.distance_to(m_edges[idx].a, m_edges[idx].b) < SCALED_EPSILON)
            return true;
    // Cast a ray towards +x through the cells of the row.
    bool result = false;
    for (size_t idx : this->edges_in_cells(cx, cy, m_index.cell_coord(m_bbox.max.x()), cy)) {
        const Point &p1 = m_edges[idx].a;
        const Point &p2 = m_edges[idx].b;
        if ((p1.y() > pt.y()) != (p2.y() > pt.y()) &&
            double(pt.x()) < double(p2.x() - p1.x()) * double(pt.y() - p1.y()) / double(p2.y() - p1.y()) + double(p1.x()))
            result = ! result;
    }
    return result;
}

Polylines chain_segments(const Lines &segments, coordf_t max_connection, const BoundaryGrid &boundary)
{
    Polylines paths;
    if (segments.empty())
        return paths;

    // Endpoint 2 * i is segments[i].a, endpoint 2 * i + 1 is segments[i].b, the other end of endpoint idx is idx ^ 1.
    Points endpoints;
    endpoints.reserve(segments.size() * 2);
    for (const Line &segment : segments) {
        endpoints.emplace_back(segment.a);
        endpoints.emplace_back(segment.b);
    }
    CellIndex index(coord_t(std::ceil(std::max(max_connection, 1.))));
    for (size_t idx = 0; idx < endpoints.size(); ++ idx)
        index.insert(index.cell_coord(endpoints[idx].x()), index.cell_coord(endpoints[idx].y()), idx);

    std::vector<bool> used(endpoints.size(), false);
    size_t            remaining = endpoints.size();
    const double      max_connection_sqr = max_connection * max_connection;

    auto closest_connectable = [&](const Point &from) -> size_t {
        std::vector<std::pair<double, size_t>> candidates;
        coord_t cx = index.cell_coord(from.x());
        coord_t cy = index.cell_coord(from.y());
        for (coord_t j = cy - 1; j <= cy + 1; ++ j)
            for (coord_t i = cx - 1; i <= cx + 1; ++ i)
                if (const std::vector<size_t> *cell = index.cell(i, j); cell != nullptr)
                    for (size_t idx : *cell)
                        if (! used[idx]) {
                            double d2 = from.distance_to_square(endpoints[idx]);
                            if (d2 <= max_connection_sqr)
                                candidates.emplace_back(d2, idx);
                        }
        std::sort(candidates.begin(), candidates.end());
        for (const std::pair<double, size_t> &candidate : candidates)
            if (boundary.connectable(from, endpoints[candidate.second]))
                return candidate.second;
        return std::numeric_limits<size_t>::max();
    };

    auto closest_unused = [&](const Point &from) -> size_t {
        size_t best      = std::numeric_limits<size_t>::max();
        double best_dist = std::numeric_limits<double>::max();
        for (size_t idx = 0; idx < endpoints.size(); ++ idx)
            if (! used[idx]) {
                double d2 = from.distance_to_square(endpoints[idx]);
                if (d2 < best_dist) {
                    best_dist = d2;
                    best      = idx;
                }
            }
        return best;
    };

    size_t start = 0;
    while (remaining > 0) {
        Polyline path;
        size_t   next = start;
        do {
            path.append(endpoints[next]);
            path.append(endpoints[next ^ 1]);
            used[next] = used[next ^ 1] = true;
            remaining -= 2;
            next = remaining > 0 ? closest_connectable(path.last_point()) : std::numeric_limits<size_t>::max();
        } while (next != std::numeric_limits<size_t>::max());
        if (remaining > 0)
            start = closest_unused(path.last_point());
        paths.emplace_back(std::move(path));
    }
    BOOST_LOG_TRIVIAL(trace) << "FillScanlines::chain_segments: " << segments.size() << " segments chained into " << paths.size() << " paths";
    return paths;
}

} // namespace FillScanlines

} // namespace Skinner
