///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "Polygon.hpp"

namespace Skinner {

double Polygon::length() const
{
    double len = 0.;
    if (this->points.size() > 1) {
        for (size_t i = 1; i < this->points.size(); ++ i)
            len += this->points[i - 1].distance_to(this->points[i]);
        len += this->points.back().distance_to(this->points.front());
    }
    return len;
}

Polyline Polygon::split_at_first_point() const
{
    Polyline polyline;
    if (! this->points.empty()) {
        polyline.points.reserve(this->points.size() + 1);
        polyline.points = this->points;
        polyline.points.emplace_back(this->points.front());
    }
    return polyline;
}

double Polygon::area() const
{
    if (this->points.size() < 3)
        return 0.;
    double a = 0.;
    for (size_t i = 0, j = this->points.size() - 1; i < this->points.size(); j = i ++)
        a += (double(this->points[j].x()) + double(this->points[i].x())) * (double(this->points[j].y()) - double(this->points[i].y()));
    return - a * 0.5;
}

int largest_area_index(const Polygons &polygons)
{
    int    idx  = -1;
    double best = -1.;
    for (size_t i = 0; i < polygons.size(); ++ i) {
        double a = std::abs(polygons[i].area());
        if (a > best) {
            best = a;
            idx  = int(i);
        }
    }
    return idx;
}

} // namespace Skinner
