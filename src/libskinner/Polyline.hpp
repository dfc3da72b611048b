///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_Polyline_hpp_
#define skinner_Polyline_hpp_

#include "libskinner.h"
#include "MultiPoint.hpp"

#include <vector>

namespace Skinner {

class Polyline;
using Polylines = std::vector<Polyline>;

// Open path.
class Polyline : public MultiPoint
{
public:
    Polyline() = default;
    Polyline(const Polyline &other) : MultiPoint(other.points) {}
    Polyline(Polyline &&other) : MultiPoint(std::move(other.points)) {}
    Polyline(std::initializer_list<Point> list) : MultiPoint(list) {}
    explicit Polyline(const Points &points) : MultiPoint(points) {}
    explicit Polyline(Points &&points) : MultiPoint(std::move(points)) {}

    Polyline& operator=(const Polyline &other) { points = other.points; return *this; }
    Polyline& operator=(Polyline &&other) { points = std::move(other.points); return *this; }
    bool operator==(const Polyline &other) const { return points == other.points; }

    const Point& last_point() const override { return this->points.back(); }
    double length() const override;

    // Removes the given distance from the end of the polyline.
    void clip_end(coordf_t distance);
    // Removes the given distance from the start of the polyline.
    void clip_start(coordf_t distance);
    void simplify(double tolerance) { this->points = MultiPoint::douglas_peucker(this->points, tolerance); }
};

// Clip a closed path (first point repeated at the end) at both of its ends by clip_length,
// but never by more than max_clip_ratio of its length on either end, then simplify it.
// Returns an empty path for an empty input.
Polyline clip_and_simplify(const Polyline &loop_path, coordf_t clip_length, double tolerance, double max_clip_ratio = 0.3);

} // namespace Skinner

#endif // skinner_Polyline_hpp_
