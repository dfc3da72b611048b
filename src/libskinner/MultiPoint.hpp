///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_MultiPoint_hpp_
#define skinner_MultiPoint_hpp_

#include "libskinner.h"
#include "BoundingBox.hpp"
#include "Point.hpp"

#include <initializer_list>
#include <vector>

namespace Skinner {

// Common base of Polygon and Polyline, owning a sequence of points.
class MultiPoint
{
public:
    Points points;

    MultiPoint() = default;
    MultiPoint(const MultiPoint &other) : points(other.points) {}
    MultiPoint(MultiPoint &&other) : points(std::move(other.points)) {}
    MultiPoint(std::initializer_list<Point> list) : points(list) {}
    explicit MultiPoint(const Points &_points) : points(_points) {}
    explicit MultiPoint(Points &&_points) : points(std::move(_points)) {}
    virtual ~MultiPoint() = default;

    MultiPoint& operator=(const MultiPoint &other) { points = other.points; return *this; }
    MultiPoint& operator=(MultiPoint &&other) { points = std::move(other.points); return *this; }

    void   rotate(double cos_angle, double sin_angle);
    void   translate(const Vector &vector);
    void   reverse() { std::reverse(this->points.begin(), this->points.end()); }

    const Point& front() const { return this->points.front(); }
    const Point& back() const { return this->points.back(); }
    const Point& first_point() const { return this->front(); }
    virtual const Point& last_point() const = 0;
    virtual double length() const = 0;
    size_t size() const { return points.size(); }
    bool   empty() const { return points.empty(); }

    BoundingBox bounding_box() const { return BoundingBox(this->points); }
    void   clear() { this->points.clear(); }
    void   append(const Point &point) { this->points.push_back(point); }

    static Points douglas_peucker(const Points &points, const double tolerance);
};

} // namespace Skinner

#endif // skinner_MultiPoint_hpp_
