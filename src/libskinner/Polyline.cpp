///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "Polyline.hpp"

namespace Skinner {

double Polyline::length() const
{
    double l = 0;
    for (size_t i = 1; i < this->points.size(); ++ i)
        l += this->points[i].distance_to(this->points[i - 1]);
    return l;
}

void Polyline::clip_end(coordf_t distance)
{
    while (distance > 0) {
        Vec2d last_point = this->last_point().cast<coordf_t>();
        this->points.pop_back();
        if (this->points.empty())
            break;
        Vec2d    v    = this->last_point().cast<coordf_t>() - last_point;
        coordf_t lsqr = v.squaredNorm();
        if (lsqr > distance * distance) {
            this->points.emplace_back(Vec2d(last_point + v * (distance / std::sqrt(lsqr))));
            return;
        }
        distance -= std::sqrt(lsqr);
    }
}

void Polyline::clip_start(coordf_t distance)
{
    this->reverse();
    this->clip_end(distance);
    if (this->points.size() >= 2)
        this->reverse();
}

Polyline clip_and_simplify(const Polyline &loop_path, coordf_t clip_length, double tolerance, double max_clip_ratio)
{
    Polyline out(loop_path);
    if (out.empty())
        return out;
    coordf_t clip = std::min(clip_length, max_clip_ratio * out.length());
    if (clip > 0.) {
        out.clip_end(clip);
        out.clip_start(clip);
    }
    if (out.points.size() > 2)
        out.simplify(tolerance);
    return out;
}

} // namespace Skinner
