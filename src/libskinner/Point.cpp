///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "Point.hpp"

namespace Skinner {

double Point::distance_to(const Point &a, const Point &b) const
{
    const Vec2d v  = (b - a).cast<double>();
    const Vec2d va = (*this - a).cast<double>();
    const double l2 = v.squaredNorm();
    if (l2 == 0.)
        return va.norm();
    const double t = va.dot(v) / l2;
    if (t <= 0.)
        return va.norm();
    if (t >= 1.)
        return (*this - b).cast<double>().norm();
    return (va - t * v).norm();
}

Points to_points(const Pointfs &pts)
{
    Points out;
    out.reserve(pts.size());
    for (const Vec2d &pt : pts)
        out.emplace_back(Point::new_scale(pt));
    return out;
}

Pointfs to_pointfs(const Points &pts)
{
    Pointfs out;
    out.reserve(pts.size());
    for (const Point &pt : pts)
        out.emplace_back(unscaled(pt));
    return out;
}

} // namespace Skinner
