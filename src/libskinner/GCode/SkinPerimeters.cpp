///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "SkinPerimeters.hpp"
#include "GCodeWriter.hpp"
#include "../ClipperUtils.hpp"
#include "../Polygon.hpp"
#include "../Polyline.hpp"

#include <boost/log/trivial.hpp>

namespace Skinner {

std::vector<Pointfs> SkinPerimeterGenerator::inset_paths(const Pointfs &perimeter) const
{
    Polygon loop = Polygon::new_scale(perimeter);
    // The captured thread returns to its start.
    if (loop.points.size() > 1 && loop.points.front() == loop.points.back())
        loop.points.pop_back();

    const int    divisions       = m_params.horizontal_perimeter_divisions;
    const double perimeter_width = *m_params.perimeter_width;
    const double radius_addition = perimeter_width / double(divisions);
    const double tolerance       = scale_(0.01 * m_params.half_perimeter_width);
    double       radius          = 0.5 * radius_addition - m_params.half_perimeter_width;

    std::vector<Pointfs> paths;
    paths.reserve(divisions);
    for (int division = 0; division < divisions; ++ division) {
        Polygon inset = largest_inset_loop(loop, float(scale_(radius)));
        if (inset.empty()) {
            BOOST_LOG_TRIVIAL(debug) << "SkinPerimeterGenerator: inset " << division << " by " << radius << " vanished";
            paths.emplace_back();
        } else {
            Polyline path = clip_and_simplify(inset.split_at_first_point(), scale_(m_params.clip_length), tolerance);
            paths.emplace_back(to_pointfs(path.points));
        }
        radius += radius_addition;
    }
    return paths;
}

void SkinPerimeterGenerator::process(const Pointfs &perimeter, double top_z, double feed_rate_minute, double flow_rate)
{
    if (perimeter.size() < 2) {
        BOOST_LOG_TRIVIAL(warning) << "SkinPerimeterGenerator: perimeter with " << perimeter.size() << " points skipped";
        return;
    }
    const std::vector<double> heights           = m_params.sub_layer_heights(top_z);
    const std::vector<Pointfs> paths            = this->inset_paths(perimeter);
    const double              travel_feed_rate  = m_params.travel_feed_rate_minute;
    const double              skinned_flow_rate = flow_rate / double(m_params.vertical_divisions);

    if (is_minimum_sides(paths)) {
        m_writer.add_flow_rate(skinned_flow_rate / double(m_params.horizontal_perimeter_divisions));
        for (double z : heights)
            for (const Pointfs &path : paths)
                m_writer.add_thread(feed_rate_minute, path, travel_feed_rate, z);
    } else {
        BOOST_LOG_TRIVIAL(debug) << "SkinPerimeterGenerator: degenerate inset, the perimeter is only divided vertically";
        m_writer.add_flow_rate(skinned_flow_rate);
        for (double z : heights)
            m_writer.add_thread(feed_rate_minute, perimeter, travel_feed_rate, z);
    }
    m_writer.add_flow_rate(flow_rate);
}

bool is_minimum_sides(const std::vector<Pointfs> &paths, size_t sides)
{
    for (const Pointfs &path : paths)
        if (path.size() < sides)
            return false;
    return true;
}

} // namespace Skinner
