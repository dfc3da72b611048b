///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_Point_hpp_
#define skinner_Point_hpp_

#include "libskinner.h"

#include <cmath>
#include <string>
#include <vector>

#include <Eigen/Geometry>

namespace Skinner {

class Point;
using Vector = Point;

// Eigen vector types.
// Vector types with a fixed point coordinate base type.
using Vec2crd = Eigen::Matrix<coord_t,  2, 1, Eigen::DontAlign>;
// Vector types with a double coordinate base type.
using Vec2d   = Eigen::Matrix<double,   2, 1, Eigen::DontAlign>;
using Vec3d   = Eigen::Matrix<double,   3, 1, Eigen::DontAlign>;

using Points  = std::vector<Point>;
using Pointfs = std::vector<Vec2d>;

inline Vec2d to_2d(const Vec3d &pt3) { return Vec2d(pt3.x(), pt3.y()); }

// Cross product of two 2D vectors.
inline double cross2(const Vec2d &v1, const Vec2d &v2) { return v1.x() * v2.y() - v1.y() * v2.x(); }

class Point : public Vec2crd
{
public:
    using coord_type = coord_t;

    Point() : Vec2crd(0, 0) {}
    Point(int32_t x, int32_t y) : Vec2crd(coord_t(x), coord_t(y)) {}
    Point(int64_t x, int64_t y) : Vec2crd(coord_t(x), coord_t(y)) {}
    Point(double x, double y) : Vec2crd(coord_t(std::round(x)), coord_t(std::round(y))) {}
    Point(const Point &rhs) { *this = rhs; }
    explicit Point(const Vec2d& rhs) : Vec2crd(coord_t(std::round(rhs.x())), coord_t(std::round(rhs.y()))) {}
    // This constructor allows you to construct Point from Eigen expressions
    template<typename OtherDerived>
    Point(const Eigen::MatrixBase<OtherDerived> &other) : Vec2crd(other) {}
    static Point new_scale(coordf_t x, coordf_t y) { return Point(coord_t(std::round(scale_(x))), coord_t(std::round(scale_(y)))); }
    static Point new_scale(const Vec2d &v) { return Point::new_scale(v.x(), v.y()); }

    // This method allows you to assign Eigen expressions to MyVectorType
    template<typename OtherDerived>
    Point& operator=(const Eigen::MatrixBase<OtherDerived> &other)
    {
        this->Vec2crd::operator=(other);
        return *this;
    }
    Point& operator=(const Point &rhs) { this->Vec2crd::operator=(rhs); return *this; }

    bool operator< (const Point& rhs) const { return this->x() < rhs.x() || (this->x() == rhs.x() && this->y() < rhs.y()); }

    Point& operator+=(const Point& rhs) { this->x() += rhs.x(); this->y() += rhs.y(); return *this; }
    Point& operator-=(const Point& rhs) { this->x() -= rhs.x(); this->y() -= rhs.y(); return *this; }

    // Multiply by the complex number (cos_a + i sin_a). For a unit complex number this is a rotation.
    void   rotate(double cos_a, double sin_a) {
        double cur_x = double(this->x());
        double cur_y = double(this->y());
        this->x() = coord_t(std::round(cos_a * cur_x - sin_a * cur_y));
        this->y() = coord_t(std::round(cos_a * cur_y + sin_a * cur_x));
    }

    double distance_to(const Point &point) const { return (point - *this).cast<double>().norm(); }
    double distance_to_square(const Point &point) const { return (point - *this).cast<double>().squaredNorm(); }
    // Distance of this point to the segment <a, b>.
    double distance_to(const Point &a, const Point &b) const;
};

inline Vec2d  unscaled(const Point &pt) { return pt.cast<double>() * SCALING_FACTOR; }

Points to_points(const Pointfs &pts);
Pointfs to_pointfs(const Points &pts);

} // namespace Skinner

#endif // skinner_Point_hpp_
