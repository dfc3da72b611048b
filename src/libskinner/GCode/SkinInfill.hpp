///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_SkinInfill_hpp_
#define skinner_SkinInfill_hpp_

#include "../libskinner.h"
#include "../Point.hpp"
#include "../Polyline.hpp"
#include "SkinParameters.hpp"

#include <complex>
#include <optional>
#include <vector>

namespace Skinner {

class GCodeWriter;

// Replaces the infill of a region by scanline infill horizontal_infill_divisions times denser,
// laid vertical_divisions times at the heights of the sub-layers, every other sub-layer shifted by half a line.
class SkinInfillGenerator
{
public:
    SkinInfillGenerator(const MachineParameters &params, GCodeWriter &writer) : m_params(params), m_writer(writer) {}

    // Emit the sub-passes of the infill of the captured boundaries. rotation is the infill direction
    // of the layer as a unit complex number, top_z the height of the layer top.
    // Returns the xy position after the last emitted path, if any.
    std::optional<Vec2d> process(const std::vector<Pointfs> &boundaries, double top_z, double feed_rate_minute,
        double flow_rate, const std::complex<double> &rotation);

    // Infill paths of one sub-layer, in the frame of the boundaries.
    Polylines infill_paths(const std::vector<Pointfs> &boundaries, double offset_y, const std::complex<double> &rotation) const;

private:
    const MachineParameters &m_params;
    GCodeWriter             &m_writer;
};

} // namespace Skinner

#endif // skinner_SkinInfill_hpp_
