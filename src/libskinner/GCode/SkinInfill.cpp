///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "SkinInfill.hpp"
#include "GCodeWriter.hpp"
#include "../ClipperUtils.hpp"
#include "../Polygon.hpp"
#include "../Fill/FillScanlines.hpp"

#include <boost/log/trivial.hpp>

namespace Skinner {

Polylines SkinInfillGenerator::infill_paths(const std::vector<Pointfs> &boundaries, double offset_y, const std::complex<double> &rotation) const
{
    const coord_t spacing = coord_t(std::round(scale_(m_params.skin_infill_width)));
    const Vector  offset(coord_t(0), coord_t(std::round(scale_(offset_y))));

    // Rotate into the frame of horizontal scanlines, shifted by the lateral offset of this sub-layer.
    Polygons rotated;
    rotated.reserve(boundaries.size());
    for (const Pointfs &boundary : boundaries) {
        Polygon loop = Polygon::new_scale(boundary);
        loop.rotate(rotation.real(), - rotation.imag());
        loop.translate(Vector(- offset));
        rotated.emplace_back(std::move(loop));
    }
    Polygons inset = inset_loops(rotated, float(scale_(m_params.skin_infill_inset)));

    FillScanlines::XIntersectionsTable table    = FillScanlines::x_intersections(inset, spacing);
    Lines                              segments = FillScanlines::segments_from_x_intersections(table, spacing);
    for (Line &segment : segments) {
        segment.a += offset;
        segment.b += offset;
    }
    for (Polygon &loop : inset)
        loop.translate(offset);

    const coordf_t               max_connection = 5. * double(spacing);
    FillScanlines::BoundaryGrid  grid(inset, coord_t(std::ceil(max_connection)));
    Polylines                    paths = FillScanlines::chain_segments(segments, max_connection, grid);
    for (Polyline &path : paths)
        path.rotate(rotation.real(), rotation.imag());
    return paths;
}

std::optional<Vec2d> SkinInfillGenerator::process(const std::vector<Pointfs> &boundaries, double top_z, double feed_rate_minute,
    double flow_rate, const std::complex<double> &rotation)
{
    std::optional<Vec2d>      last_position;
    const std::vector<double> heights  = m_params.sub_layer_heights(top_z);
    const double              offset_y = 0.5 * m_params.skin_infill_width;
    const bool                hop      = m_params.hop_when_extruding_infill;

    m_writer.add_flow_rate(flow_rate / double(m_params.vertical_divisions) / double(m_params.horizontal_infill_divisions));
    for (size_t i = 0; i < heights.size(); ++ i) {
        const double z     = heights[i];
        Polylines    paths = this->infill_paths(boundaries, i % 2 == 0 ? offset_y : 0., rotation);
        BOOST_LOG_TRIVIAL(trace) << "SkinInfillGenerator: " << paths.size() << " paths at z " << z;
        for (const Polyline &path : paths) {
            Pointfs thread = to_pointfs(path.points);
            if (top_z > z && hop)
                m_writer.add_movement_z_with_feed_rate(m_params.maximum_z_feed_rate_minute, thread.front(), top_z);
            m_writer.add_thread(feed_rate_minute, thread, m_params.travel_feed_rate_minute, z);
            last_position = thread.back();
            if (top_z > z && hop)
                m_writer.add_movement_z_with_feed_rate(m_params.maximum_z_feed_rate_minute, thread.back(), top_z);
        }
    }
    m_writer.add_flow_rate(flow_rate);
    return last_position;
}

} // namespace Skinner
