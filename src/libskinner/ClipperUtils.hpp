///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_ClipperUtils_hpp_
#define skinner_ClipperUtils_hpp_

#include "libskinner.h"
#include "Polygon.hpp"
#include "Polyline.hpp"

#include <polyclipping/clipper.hpp>

namespace Skinner {

static constexpr const double  DefaultMiterLimit   = 3.;
static constexpr const ClipperLib::JoinType DefaultJoinType = ClipperLib::jtMiter;

ClipperLib::Path  to_path(const Polygon &polygon);
ClipperLib::Paths to_paths(const Polygons &polygons);
Polygon           to_polygon(const ClipperLib::Path &path);
Polygons          to_polygons(const ClipperLib::Paths &paths);

// Offset closed loops by delta (scaled). A positive delta grows a counter-clockwise loop,
// a negative delta shrinks it. Orientation of the input loops is respected, so a clockwise
// loop shrinks with a positive delta. Output loops keep the orientation of Clipper's result,
// counter-clockwise outer contours and clockwise holes.
Polygons offset(const Polygons &polygons, const float delta,
    ClipperLib::JoinType joinType = DefaultJoinType, double miterLimit = DefaultMiterLimit);
Polygons offset(const Polygon &polygon, const float delta,
    ClipperLib::JoinType joinType = DefaultJoinType, double miterLimit = DefaultMiterLimit);

// Inset a loop by the given distance towards its inner side as oriented: a counter-clockwise loop shrinks,
// a clockwise (hole) loop grows. A negative inset is an outset. Returns the loop of the result
// with the largest area, oriented as the input loop.
// Returns an empty polygon if the inset vanishes.
Polygon largest_inset_loop(const Polygon &loop, const float inset,
    ClipperLib::JoinType joinType = DefaultJoinType, double miterLimit = DefaultMiterLimit);

// Inset a region given by its outer contours and holes by the given distance. Loops with less than
// three points are ignored.
Polygons inset_loops(const Polygons &loops, const float inset,
    ClipperLib::JoinType joinType = DefaultJoinType, double miterLimit = DefaultMiterLimit);

} // namespace Skinner

#endif // skinner_ClipperUtils_hpp_
