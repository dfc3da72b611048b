///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_SkeinTags_hpp_
#define skinner_SkeinTags_hpp_

#include <string>
#include <string_view>

namespace Skinner {

// Structural events of the annotated G-code, keyed by the first word of a line.
enum class SkeinTag : unsigned char {
    // Any line not listed below.
    Other,
    // G1
    Move,
    // M101, M103
    ExtruderOn,
    ExtruderOff,
    // M108 S..
    FlowRate,
    // (<layer> z )
    Layer,
    // (<boundaryPoint> X.. Y.. Z.. </boundaryPoint>), (</boundaryPerimeter>)
    BoundaryPoint,
    BoundaryPerimeterEnd,
    // (<perimeter> ..., (</perimeter>)
    Perimeter,
    PerimeterEnd,
    // (<infill>), (</infill>), (<infillBoundary>), (<infillPoint> X.. Y.. Z.. </infillPoint>)
    Infill,
    InfillEnd,
    InfillBoundary,
    InfillPoint,
    // (<rotation> (a+bj) </rotation>)
    Rotation,
    // Header parameters.
    ClipOverPerimeterWidth,
    DecimalPlacesCarried,
    InfillPerimeterOverlap,
    InfillWidth,
    LayerThickness,
    MaximumZFeedRatePerSecond,
    OperatingFlowRate,
    PerimeterWidth,
    TravelFeedRatePerSecond,
    // (<procedureName> name </procedureName>)
    ProcedureName,
    // (</extruderInitialization>)
    ExtruderInitializationEnd,
};

SkeinTag    classify_skein_tag(std::string_view first_word);

// Line marking the end of the header.
static constexpr const char *EXTRUDER_INITIALIZATION_END = "(</extruderInitialization>)";

// Line recording that a procedure has been applied to the G-code: (<procedureName> name </procedureName>)
std::string procedure_name_line(const std::string &procedure);

} // namespace Skinner

#endif // skinner_SkeinTags_hpp_
