///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_Polygon_hpp_
#define skinner_Polygon_hpp_

#include "libskinner.h"
#include "MultiPoint.hpp"
#include "Polyline.hpp"

#include <vector>

namespace Skinner {

class Polygon;
using Polygons = std::vector<Polygon>;

// Closed loop. The closing segment from the last point back to the first one is implicit.
class Polygon : public MultiPoint
{
public:
    Polygon() = default;
    Polygon(const Polygon &other) : MultiPoint(other.points) {}
    Polygon(Polygon &&other) : MultiPoint(std::move(other.points)) {}
    Polygon(std::initializer_list<Point> list) : MultiPoint(list) {}
    explicit Polygon(const Points &points) : MultiPoint(points) {}
    explicit Polygon(Points &&points) : MultiPoint(std::move(points)) {}
    static Polygon new_scale(const Pointfs &points) { return Polygon(to_points(points)); }

    Polygon& operator=(const Polygon &other) { points = other.points; return *this; }
    Polygon& operator=(Polygon &&other) { points = std::move(other.points); return *this; }
    bool operator==(const Polygon &other) const { return points == other.points; }
    bool operator!=(const Polygon &other) const { return points != other.points; }

    // last point == first point for polygons
    const Point& last_point() const override { return this->points.front(); }
    double length() const override;

    // Split a closed polygon into an open polyline, with the split point duplicated at both ends.
    Polyline split_at_first_point() const;

    // Signed area, positive for counter-clockwise polygons. In scaled coordinates.
    double area() const;
    bool   is_counter_clockwise() const { return this->area() > 0.; }
};

// Index of the polygon with the largest absolute area, -1 for an empty input.
int  largest_area_index(const Polygons &polygons);

} // namespace Skinner

#endif // skinner_Polygon_hpp_
