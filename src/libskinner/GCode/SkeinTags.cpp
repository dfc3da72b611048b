///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "SkeinTags.hpp"

#include <array>
#include <utility>

namespace Skinner {

static constexpr const std::array<std::pair<SkeinTag, std::string_view>, 26> skein_tag_words { {
    { SkeinTag::Move,                       "G1" },
    { SkeinTag::ExtruderOn,                 "M101" },
    { SkeinTag::ExtruderOff,                "M103" },
    { SkeinTag::FlowRate,                   "M108" },
    { SkeinTag::Layer,                      "(<layer>" },
    { SkeinTag::BoundaryPoint,              "(<boundaryPoint>" },
    { SkeinTag::BoundaryPerimeterEnd,       "(</boundaryPerimeter>)" },
    { SkeinTag::Perimeter,                  "(<perimeter>" },
    { SkeinTag::PerimeterEnd,               "(</perimeter>)" },
    { SkeinTag::Infill,                     "(<infill>)" },
    { SkeinTag::InfillEnd,                  "(</infill>)" },
    { SkeinTag::InfillBoundary,             "(<infillBoundary>)" },
    { SkeinTag::InfillPoint,                "(<infillPoint>" },
    { SkeinTag::Rotation,                   "(<rotation>" },
    { SkeinTag::ClipOverPerimeterWidth,     "(<clipOverPerimeterWidth>" },
    { SkeinTag::DecimalPlacesCarried,       "(<decimalPlacesCarried>" },
    { SkeinTag::InfillPerimeterOverlap,     "(<infillPerimeterOverlap>" },
    { SkeinTag::InfillWidth,                "(<infillWidth>" },
    { SkeinTag::LayerThickness,             "(<layerThickness>" },
    { SkeinTag::MaximumZFeedRatePerSecond,  "(<maximumZFeedRatePerSecond>" },
    { SkeinTag::OperatingFlowRate,          "(<operatingFlowRate>" },
    { SkeinTag::PerimeterWidth,             "(<perimeterWidth>" },
    { SkeinTag::TravelFeedRatePerSecond,    "(<travelFeedRatePerSecond>" },
    { SkeinTag::ProcedureName,              "(<procedureName>" },
    { SkeinTag::ExtruderInitializationEnd,  "(</extruderInitialization>)" },
    { SkeinTag::Other,                      "" },
} };

SkeinTag classify_skein_tag(std::string_view first_word)
{
    if (first_word.empty())
        return SkeinTag::Other;
    for (const auto &tw : skein_tag_words)
        if (tw.second == first_word)
            return tw.first;
    return SkeinTag::Other;
}

std::string procedure_name_line(const std::string &procedure)
{
    return "(<procedureName> " + procedure + " </procedureName>)";
}

} // namespace Skinner
