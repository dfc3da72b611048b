#include <catch2/catch.hpp>

#include "libskinner/BoundingBox.hpp"
#include "libskinner/Line.hpp"
#include "libskinner/Point.hpp"
#include "libskinner/Polygon.hpp"
#include "libskinner/Polyline.hpp"

using namespace Skinner;

static Polygon square(double x0, double y0, double size)
{
    return Polygon::new_scale({ { x0, y0 }, { x0 + size, y0 }, { x0 + size, y0 + size }, { x0, y0 + size } });
}

TEST_CASE("Point rotation by a unit complex number", "[Geometry]") {
    Point p(coord_t(1000000), coord_t(0));
    SECTION("Quarter turn") {
        p.rotate(0., 1.);
        REQUIRE(p == Point(coord_t(0), coord_t(1000000)));
    }
    SECTION("Rotation by the conjugate undoes the rotation") {
        Point q = p;
        q.rotate(0.6, 0.8);
        REQUIRE(q == Point(coord_t(600000), coord_t(800000)));
        q.rotate(0.6, -0.8);
        REQUIRE(q.distance_to(p) < 2.);
    }
}

TEST_CASE("Distance of a point to a segment", "[Geometry]") {
    Point a = Point::new_scale(0, 0);
    Point b = Point::new_scale(10, 0);
    REQUIRE(Point::new_scale(5, 3).distance_to(a, b) == Approx(scale_(3.)));
    // Beyond the end of the segment the distance is measured to the end point.
    REQUIRE(Point::new_scale(13, 4).distance_to(a, b) == Approx(scale_(5.)));
}

SCENARIO("Polygon orientation and area", "[Geometry]") {
    GIVEN("A counter-clockwise square 10mm wide") {
        Polygon poly = square(0, 0, 10);
        THEN("The area is positive") {
            REQUIRE(poly.area() == Approx(scale_(10.) * scale_(10.)));
            REQUIRE(poly.is_counter_clockwise());
        }
        THEN("The length includes the closing edge") {
            REQUIRE(poly.length() == Approx(scale_(40.)));
        }
        WHEN("It is reversed") {
            poly.reverse();
            THEN("It is clockwise with a negative area") {
                REQUIRE(! poly.is_counter_clockwise());
                REQUIRE(poly.area() == Approx(- scale_(10.) * scale_(10.)));
            }
        }
        THEN("The extents are the square") {
            BoundingBox bbox = poly.bounding_box();
            REQUIRE(bbox.defined);
            REQUIRE(bbox.min == Point::new_scale(0, 0));
            REQUIRE(bbox.max == Point::new_scale(10, 10));
        }
        WHEN("It is split at its first point") {
            Polyline path = poly.split_at_first_point();
            THEN("The first point is repeated at the end") {
                REQUIRE(path.size() == 5);
                REQUIRE(path.front() == path.back());
                REQUIRE(path.length() == Approx(poly.length()));
            }
        }
    }
}

TEST_CASE("Largest area index", "[Geometry]") {
    Polygons polygons { square(0, 0, 1), square(5, 5, 3), square(20, 0, 2) };
    polygons[1].reverse();
    REQUIRE(largest_area_index(polygons) == 1);
    REQUIRE(largest_area_index(Polygons()) == -1);
}

SCENARIO("Polyline clipping", "[Geometry]") {
    GIVEN("An L shaped polyline 20mm long") {
        Polyline pl { Point::new_scale(0, 0), Point::new_scale(10, 0), Point::new_scale(10, 10) };
        REQUIRE(pl.length() == Approx(scale_(20.)));
        WHEN("5mm are clipped from the end") {
            pl.clip_end(scale_(5.));
            THEN("The last point moves back along the last segment") {
                REQUIRE(pl.size() == 3);
                REQUIRE(pl.last_point() == Point::new_scale(10, 5));
                REQUIRE(pl.length() == Approx(scale_(15.)));
            }
        }
        WHEN("12mm are clipped from the end") {
            pl.clip_end(scale_(12.));
            THEN("The last segment is removed") {
                REQUIRE(pl.size() == 2);
                REQUIRE(pl.last_point() == Point::new_scale(8, 0));
            }
        }
        WHEN("5mm are clipped from the start") {
            pl.clip_start(scale_(5.));
            THEN("The first point moves forward along the first segment") {
                REQUIRE(pl.first_point() == Point::new_scale(5, 0));
                REQUIRE(pl.last_point() == Point::new_scale(10, 10));
            }
        }
    }
}

SCENARIO("Clipping and simplification of a loop path", "[Geometry]") {
    GIVEN("A 10mm square split at its first point") {
        Polyline path = square(0, 0, 10).split_at_first_point();
        WHEN("It is clipped by 1mm") {
            Polyline out = clip_and_simplify(path, scale_(1.), scale_(0.01));
            THEN("Both ends are shortened by 1mm and the corners are kept") {
                REQUIRE(out.size() == 5);
                REQUIRE(out.first_point() == Point::new_scale(1, 0));
                REQUIRE(out.last_point() == Point::new_scale(0, 1));
                REQUIRE(out.length() == Approx(scale_(38.)));
            }
        }
        WHEN("It is clipped by more than its length") {
            Polyline out = clip_and_simplify(path, scale_(100.), scale_(0.01));
            THEN("At most 30 percent of the length is clipped on each end") {
                REQUIRE(out.size() == 3);
                REQUIRE(out.first_point() == Point::new_scale(10, 2));
                REQUIRE(out.last_point() == Point::new_scale(2, 10));
                REQUIRE(out.length() == Approx(scale_(16.)));
            }
        }
        WHEN("It is not clipped") {
            Polyline out = clip_and_simplify(path, 0., scale_(0.01));
            THEN("It is unchanged") {
                REQUIRE(out == path);
            }
        }
    }
    GIVEN("An empty path") {
        THEN("The result is empty") {
            REQUIRE(clip_and_simplify(Polyline(), scale_(1.), scale_(0.01)).empty());
        }
    }
}

TEST_CASE("Douglas-Peucker removes collinear points", "[Geometry]") {
    Points pts { Point::new_scale(0, 0), Point::new_scale(5, 0), Point::new_scale(10, 0.001), Point::new_scale(10, 10) };
    Points simplified = MultiPoint::douglas_peucker(pts, scale_(0.01));
    REQUIRE(simplified == Points{ Point::new_scale(0, 0), Point::new_scale(10, 0.001), Point::new_scale(10, 10) });
    // Nothing to simplify.
    Points two { Point::new_scale(0, 0), Point::new_scale(1, 1) };
    REQUIRE(MultiPoint::douglas_peucker(two, scale_(0.01)) == two);
}

SCENARIO("Crossing of line segments", "[Geometry]") {
    GIVEN("Two diagonals of a square") {
        Line l1(Point::new_scale(0, 0), Point::new_scale(10, 10));
        Line l2(Point::new_scale(0, 10), Point::new_scale(10, 0));
        THEN("They cross") {
            REQUIRE(l1.crosses(l2));
            REQUIRE(l2.crosses(l1));
        }
    }
    GIVEN("Two edges sharing an end point") {
        Line l1(Point::new_scale(0, 0), Point::new_scale(10, 0));
        Line l2(Point::new_scale(10, 0), Point::new_scale(10, 10));
        THEN("They do not cross") {
            REQUIRE(! l1.crosses(l2));
        }
    }
    GIVEN("Collinear overlapping segments") {
        Line l1(Point::new_scale(0, 0), Point::new_scale(10, 0));
        Line l2(Point::new_scale(5, 0), Point::new_scale(15, 0));
        THEN("They do not cross") {
            REQUIRE(! l1.crosses(l2));
        }
    }
    GIVEN("A segment crossing the middle of another") {
        Line l1(Point::new_scale(0, 0), Point::new_scale(10, 0));
        Line l2(Point::new_scale(5, -1), Point::new_scale(5, 1));
        THEN("The crossing counts unless it is within the end point tolerance") {
            REQUIRE(l1.crosses(l2, scale_(1.)));
            REQUIRE(! l1.crosses(l2, scale_(6.)));
        }
    }
}
