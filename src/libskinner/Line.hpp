///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_Line_hpp_
#define skinner_Line_hpp_

#include "libskinner.h"
#include "Point.hpp"

#include <vector>

namespace Skinner {

class Line;
typedef std::vector<Line> Lines;

class Line
{
public:
    Line() {}
    Line(const Point& _a, const Point& _b) : a(_a), b(_b) {}

    void   reverse() { std::swap(this->a, this->b); }
    bool   operator==(const Line &rhs) const { return this->a == rhs.a && this->b == rhs.b; }

    // Does this line cross the other line in their interiors? Touching, collinear overlaps and crossings
    // closer than endpoint_tolerance to an end of this line do not count.
    bool   crosses(const Line &other, double endpoint_tolerance = 0.) const;

    Point a;
    Point b;
};

} // namespace Skinner

#endif // skinner_Line_hpp_
