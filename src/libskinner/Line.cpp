///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "Line.hpp"

namespace Skinner {

bool Line::crosses(const Line &other, double endpoint_tolerance) const
{
    const Vec2d a  = this->a.cast<double>();
    const Vec2d b  = this->b.cast<double>();
    const Vec2d c  = other.a.cast<double>();
    const Vec2d d  = other.b.cast<double>();
    const Vec2d ab = b - a;
    const Vec2d cd = d - c;
    double d1 = cross2(ab, Vec2d(c - a));
    double d2 = cross2(ab, Vec2d(d - a));
    if (! ((d1 < 0. && d2 > 0.) || (d1 > 0. && d2 < 0.)))
        return false;
    double d3 = cross2(cd, Vec2d(a - c));
    double d4 = cross2(cd, Vec2d(b - c));
    if (! ((d3 < 0. && d4 > 0.) || (d3 > 0. && d4 < 0.)))
        return false;
    if (endpoint_tolerance > 0.) {
        // Parameter of the crossing along this line.
        double t   = d3 / (d3 - d4);
        double len = ab.norm();
        if (t * len < endpoint_tolerance || (1. - t) * len < endpoint_tolerance)
            return false;
    }
    return true;
}

} // namespace Skinner
