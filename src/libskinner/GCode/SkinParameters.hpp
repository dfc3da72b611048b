///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_SkinParameters_hpp_
#define skinner_SkinParameters_hpp_

#include "../libskinner.h"
#include "../Point.hpp"

#include <optional>
#include <vector>

namespace Skinner {

class SkinConfig;

// Machine constants read from the header of the annotated G-code, and the skin settings.
// Set once by the parameter parser, read-only afterwards.
struct MachineParameters
{
    // Required, read from the header.
    std::optional<double>   layer_thickness;
    std::optional<double>   perimeter_width;
    std::optional<double>   infill_width;
    std::optional<double>   infill_perimeter_overlap;
    // Optional, read from the header.
    double                  clip_over_perimeter_width       { 0. };
    std::optional<double>   operating_flow_rate;
    double                  travel_feed_rate_minute         { 957. };
    double                  maximum_z_feed_rate_minute      { 60. };
    int                     decimal_places_carried          { 3 };

    // From the skin settings.
    int                     horizontal_infill_divisions     { 2 };
    int                     horizontal_perimeter_divisions  { 1 };
    int                     vertical_divisions              { 2 };
    bool                    hop_when_extruding_infill       { false };

    // Derived values, valid after finalize().
    double                  half_perimeter_width            { 0. };
    double                  skin_infill_width               { 0. };
    double                  clip_length                     { 0. };
    double                  skin_infill_inset               { 0. };

    static constexpr const double DEFAULT_FEED_RATE_MINUTE = 959.;

    void apply_config(const SkinConfig &config);
    // Check that the required values were read and compute the derived values. Throws SkinError.
    void finalize();

    // Heights of the vertical divisions of a layer whose top is at top_z, bottom up.
    // The first division sits one division above the bottom of the layer, the last one at the layer top.
    std::vector<double> sub_layer_heights(double top_z) const;
};

// Loops of one layer of the prescan.
struct BoundaryLayer
{
    explicit BoundaryLayer(double z) : z(z) {}
    double                  z;
    std::vector<Pointfs>    loops;
};

typedef std::vector<BoundaryLayer> BoundaryLayers;

} // namespace Skinner

#endif // skinner_SkinParameters_hpp_
