///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "MultiPoint.hpp"

namespace Skinner {

void MultiPoint::rotate(double cos_angle, double sin_angle)
{
    for (Point &pt : this->points)
        pt.rotate(cos_angle, sin_angle);
}

void MultiPoint::translate(const Vector &v)
{
    for (Point &pt : points)
        pt += v;
}

Points MultiPoint::douglas_peucker(const Points &pts, const double tolerance)
{
    Points result_pts;
    if (pts.size() < 3) {
        result_pts = pts;
        return result_pts;
    }
    result_pts.reserve(pts.size());
    result_pts.push_back(pts.front());
    // Stack of <anchor, floater> index pairs, the floater range is processed depth first.
    std::vector<std::pair<size_t, size_t>> dpStack;
    dpStack.reserve(pts.size());
    dpStack.emplace_back(0, pts.size() - 1);
    std::vector<bool> keep(pts.size(), false);
    keep.front() = true;
    keep.back()  = true;
    while (! dpStack.empty()) {
        auto [anchor, floater] = dpStack.back();
        dpStack.pop_back();
        double max_dist = 0.;
        size_t furthest = anchor;
        for (size_t i = anchor + 1; i < floater; ++ i) {
            double dist = pts[i].distance_to(pts[anchor], pts[floater]);
            if (dist > max_dist) {
                max_dist = dist;
                furthest = i;
            }
        }
        if (max_dist > tolerance) {
            keep[furthest] = true;
            dpStack.emplace_back(furthest, floater);
            dpStack.emplace_back(anchor, furthest);
        }
    }
    for (size_t i = 1; i < pts.size(); ++ i)
        if (keep[i])
            result_pts.push_back(pts[i]);
    return result_pts;
}

} // namespace Skinner
