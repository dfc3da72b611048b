///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_FillScanlines_hpp_
#define skinner_FillScanlines_hpp_

#include "../libskinner.h"
#include "../Line.hpp"
#include "../Polygon.hpp"
#include "../Polyline.hpp"

#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace Skinner {

namespace FillScanlines {

/// Row index -> x coordinates where the horizontal line y = row * spacing crosses the loops.
typedef std::map<coord_t, std::vector<coord_t>> XIntersectionsTable;

/// Intersect all the loops with the horizontal lines y = row * spacing.
/// Each edge counts its lower end and not its upper end, so a line passing through a vertex is counted once per side.
/// Horizontal edges are skipped.
void add_x_intersections(const Polygons &loops, coord_t spacing, XIntersectionsTable &table);
XIntersectionsTable x_intersections(const Polygons &loops, coord_t spacing);

/// Sort each row and pair the consecutive intersections into segments, left to right, rows bottom up.
/// An unpaired last intersection of a row is dropped, zero length segments are dropped.
Lines segments_from_x_intersections(XIntersectionsTable &table, coord_t spacing);

/// Sparse hash grid of cells of a fixed size.
class CellIndex {
public:
    explicit CellIndex(coord_t cell_size) : m_cell_size(std::max<coord_t>(cell_size, 1)) {}
    coord_t  cell_size() const { return m_cell_size; }
    coord_t  cell_coord(coord_t v) const;
    uint64_t cell_key(coord_t cx, coord_t cy) const { return (uint64_t(uint32_t(int32_t(cx))) << 32) | uint64_t(uint32_t(int32_t(cy))); }
    void     insert(coord_t cx, coord_t cy, size_t idx) { m_cells[this->cell_key(cx, cy)].emplace_back(idx); }
    const std::vector<size_t>* cell(coord_t cx, coord_t cy) const {
        auto it = m_cells.find(this->cell_key(cx, cy));
        return it == m_cells.end() ? nullptr : &it->second;
    }
private:
    coord_t                                            m_cell_size;
    std::unordered_map<uint64_t, std::vector<size_t>>  m_cells;
};

/// Edges of closed loops hashed into a grid, to test connections against the boundary.
class BoundaryGrid {
public:
    BoundaryGrid(const Polygons &boundary, coord_t cell_size);
    /// Does the segment a-b cross any edge of the boundary? Crossings at the very ends of a-b,
    /// where the endpoints lie on the boundary, do not count.
    bool crosses(const Point &a, const Point &b) const;
    /// Is the point inside the boundary (even / odd rule) or on it?
    bool inside(const Point &pt) const;
    /// May the segment a-b connect two points of the boundary? It must neither cross the boundary nor leave it.
    bool connectable(const Point &a, const Point &b) const { return ! this->crosses(a, b) && this->inside(Point((a + b) / coord_t(2))); }
    size_t num_edges() const { return m_edges.size(); }
private:
    std::vector<size_t> edges_in_cells(coord_t cx0, coord_t cy0, coord_t cx1, coord_t cy1) const;

    Lines       m_edges;
    CellIndex   m_index;
    BoundingBox m_bbox;
};

/// Chain the segments into paths. Starting at the first segment, the path continues from its free end
/// to the closest unused segment endpoint not further than max_connection and whose connection
/// stays inside the boundary. The segment is then traversed to its other end.
/// If there is none, a new path starts at the unused endpoint closest to the end of the last path.
Polylines chain_segments(const Lines &segments, coordf_t max_connection, const BoundaryGrid &boundary);

} // namespace FillScanlines

} // namespace Skinner

#endif // skinner_FillScanlines_hpp_
