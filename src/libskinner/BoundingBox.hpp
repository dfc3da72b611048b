///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_BoundingBox_hpp_
#define skinner_BoundingBox_hpp_

#include "libskinner.h"
#include "Point.hpp"

namespace Skinner {

class BoundingBox
{
public:
    Point min;
    Point max;
    bool  defined { false };

    BoundingBox() : min(Point::Zero()), max(Point::Zero()) {}
    BoundingBox(const Point &pmin, const Point &pmax) : min(pmin), max(pmax), defined(pmin.x() <= pmax.x() && pmin.y() <= pmax.y()) {}
    explicit BoundingBox(const Points &points) { this->merge(points); }

    void    merge(const Point &point);
    void    merge(const Points &points);
    void    merge(const BoundingBox &bb);
    bool    contains(const Point &point) const {
        return point.x() >= this->min.x() && point.x() <= this->max.x()
            && point.y() >= this->min.y() && point.y() <= this->max.y();
    }
};

} // namespace Skinner

#endif // skinner_BoundingBox_hpp_
