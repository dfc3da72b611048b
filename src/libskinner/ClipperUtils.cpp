///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "ClipperUtils.hpp"

#include <boost/log/trivial.hpp>

namespace Skinner {

ClipperLib::Path to_path(const Polygon &polygon)
{
    ClipperLib::Path out;
    out.reserve(polygon.points.size());
    for (const Point &pt : polygon.points)
        out.emplace_back(ClipperLib::cInt(pt.x()), ClipperLib::cInt(pt.y()));
    return out;
}

ClipperLib::Paths to_paths(const Polygons &polygons)
{
    ClipperLib::Paths out;
    out.reserve(polygons.size());
    for (const Polygon &polygon : polygons)
        out.emplace_back(to_path(polygon));
    return out;
}

Polygon to_polygon(const ClipperLib::Path &path)
{
    Polygon out;
    out.points.reserve(path.size());
    for (const ClipperLib::IntPoint &pt : path)
        out.points.emplace_back(coord_t(pt.X), coord_t(pt.Y));
    return out;
}

Polygons to_polygons(const ClipperLib::Paths &paths)
{
    Polygons out;
    out.reserve(paths.size());
    for (const ClipperLib::Path &path : paths)
        out.emplace_back(to_polygon(path));
    return out;
}

Polygons offset(const Polygons &polygons, const float delta, ClipperLib::JoinType joinType, double miterLimit)
{
    ClipperLib::ClipperOffset co;
    if (joinType == ClipperLib::jtRound)
        co.ArcTolerance = miterLimit;
    else
        co.MiterLimit = miterLimit;
    co.AddPaths(to_paths(polygons), joinType, ClipperLib::etClosedPolygon);
    ClipperLib::Paths out;
    co.Execute(out, double(delta));
    return to_polygons(out);
}

Polygons offset(const Polygon &polygon, const float delta, ClipperLib::JoinType joinType, double miterLimit)
{
    return offset(Polygons { polygon }, delta, joinType, miterLimit);
}

Polygon largest_inset_loop(const Polygon &loop, const float inset, ClipperLib::JoinType joinType, double miterLimit)
{
    if (loop.points.size() < 3)
        return Polygon();
    // ClipperOffset reorients a lone clockwise loop, therefore the delta is flipped for clockwise loops
    // to keep the inset on the inner side of the loop as oriented.
    bool     ccw    = loop.is_counter_clockwise();
    Polygons insets = offset(loop, ccw ? - inset : inset, joinType, miterLimit);
    int      idx    = largest_area_index(insets);
    if (idx < 0) {
        BOOST_LOG_TRIVIAL(trace) << "largest_inset_loop: the loop vanished when inset by " << unscale<double>(inset);
        return Polygon();
    }
    Polygon out = std::move(insets[idx]);
    if (out.is_counter_clockwise() != ccw)
        out.reverse();
    return out;
}

Polygons inset_loops(const Polygons &loops, const float inset, ClipperLib::JoinType joinType, double miterLimit)
{
    Polygons valid;
    valid.reserve(loops.size());
    for (const Polygon &loop : loops)
        if (loop.points.size() >= 3)
            valid.emplace_back(loop);
    if (valid.empty())
        return valid;
    return offset(valid, - inset, joinType, miterLimit);
}

} // namespace Skinner
