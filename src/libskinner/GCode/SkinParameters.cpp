///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "SkinParameters.hpp"
#include "../Exception.hpp"
#include "../SkinConfig.hpp"
#include "../Utils.hpp"

namespace Skinner {

void MachineParameters::apply_config(const SkinConfig &config)
{
    this->horizontal_infill_divisions    = std::max(1, config.horizontal_infill_divisions.value);
    this->horizontal_perimeter_divisions = std::max(1, config.horizontal_perimeter_divisions.value);
    this->vertical_divisions             = std::max(1, config.vertical_divisions.value);
    this->hop_when_extruding_infill      = config.hop_when_extruding_infill.value;
}

static double required_positive(const std::optional<double> &value, const char *name)
{
    if (! value)
        throw SkinError(format("The G-code header does not define the %1%", name));
    if (*value <= 0.)
        throw SkinError(format("The %1% defined by the G-code header must be positive, got %2%", name, *value));
    return *value;
}

void MachineParameters::finalize()
{
    required_positive(this->layer_thickness, "layer thickness");
    double perimeter = required_positive(this->perimeter_width, "perimeter width");
    double infill    = required_positive(this->infill_width, "infill width");
    if (! this->infill_perimeter_overlap)
        throw SkinError("The G-code header does not define the infill perimeter overlap");
    this->half_perimeter_width = 0.5 * perimeter;
    this->skin_infill_width    = infill / double(this->horizontal_infill_divisions);
    this->clip_length          = 0.5 * this->clip_over_perimeter_width * perimeter;
    this->skin_infill_inset    = 0.5 * (infill + this->skin_infill_width) * (1. - *this->infill_perimeter_overlap);
}

std::vector<double> MachineParameters::sub_layer_heights(double top_z) const
{
    double              thickness = *this->layer_thickness;
    double              step      = thickness / double(this->vertical_divisions);
    double              bottom_z  = top_z + step - thickness;
    std::vector<double> heights;
    heights.reserve(this->vertical_divisions);
    for (int i = 0; i < this->vertical_divisions; ++ i)
        heights.emplace_back(bottom_z + step * double(i));
    return heights;
}

} // namespace Skinner
