///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_SkinPerimeters_hpp_
#define skinner_SkinPerimeters_hpp_

#include "../libskinner.h"
#include "../Point.hpp"
#include "SkinParameters.hpp"

#include <vector>

namespace Skinner {

class GCodeWriter;

// Replaces one perimeter loop by horizontal_perimeter_divisions thinner loops,
// each laid vertical_divisions times at the heights of the sub-layers.
class SkinPerimeterGenerator
{
public:
    SkinPerimeterGenerator(const MachineParameters &params, GCodeWriter &writer) : m_params(params), m_writer(writer) {}

    // Emit the sub-passes of the captured perimeter. top_z is the height of the layer top.
    void process(const Pointfs &perimeter, double top_z, double feed_rate_minute, double flow_rate);

    // Inset paths of the perimeter, one per horizontal division, clipped at the seam and simplified.
    // An inset which vanished gives an empty path.
    std::vector<Pointfs> inset_paths(const Pointfs &perimeter) const;

private:
    const MachineParameters &m_params;
    GCodeWriter             &m_writer;
};

// Do all the paths have at least the given number of points? A two point path is a degenerate loop.
bool is_minimum_sides(const std::vector<Pointfs> &paths, size_t sides = 3);

} // namespace Skinner

#endif // skinner_SkinPerimeters_hpp_
