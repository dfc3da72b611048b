///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "BoundingBox.hpp"

namespace Skinner {

void BoundingBox::merge(const Point &point)
{
    if (this->defined) {
        this->min = this->min.cwiseMin(point);
        this->max = this->max.cwiseMax(point);
    } else {
        this->min = point;
        this->max = point;
        this->defined = true;
    }
}

void BoundingBox::merge(const Points &points)
{
    for (const Point &pt : points)
        this->merge(pt);
}

void BoundingBox::merge(const BoundingBox &bb)
{
    if (bb.defined) {
        this->merge(bb.min);
        this->merge(bb.max);
    }
}

} // namespace Skinner
