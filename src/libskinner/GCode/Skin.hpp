///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_Skin_hpp_
#define skinner_Skin_hpp_

#include "../libskinner.h"
#include "../Point.hpp"
#include "../SkinConfig.hpp"
#include "GCodeReader.hpp"
#include "GCodeWriter.hpp"
#include "SkinParameters.hpp"

#include <complex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Skinner {

// Name of the procedure recorded in the G-code header once the skin stage ran.
static constexpr const char *SKIN_PROCEDURE_NAME = "skin";

// Skin stage of the annotated G-code: the perimeters and the infill of the layers from the configured one on
// are replaced by thinner passes laid at fractional heights of the layer.
// One instance transforms one G-code text.
class GCodeSkin
{
public:
    explicit GCodeSkin(const SkinConfig &config);

    // Transform the whole G-code. Throws SkinError if the header misses a required machine parameter,
    // GCodeParseError on a malformed number.
    std::string process(const std::string &gcode);

    const MachineParameters&    params()            const { return m_params; }
    const BoundaryLayers&       boundary_layers()   const { return m_boundary_layers; }
    int                         layers_from()       const { return m_layers_from; }
    int                         layer_index_top()   const { return m_layer_index_top; }

private:
    typedef std::vector<std::string_view> TextLines;

    // Copy the header to the output while reading the machine parameters, up to and including
    // the end of the extruder initialization. Returns the index of the first line past it.
    size_t  parse_initialization(const TextLines &lines);
    // Read the boundary loops of all the layers, to find the first layer to skin and the top layer.
    void    parse_boundaries(const TextLines &lines, size_t line_idx);
    void    process_line(const GCodeReader::GCodeLine &line);

    void    add_skinned_perimeter();
    void    add_skinned_infill();
    double  flow_rate() const;

    SkinConfig                          m_config;
    MachineParameters                   m_params;
    GCodeWriter                         m_writer;
    BoundaryLayers                      m_boundary_layers;
    int                                 m_layers_from       { 0 };
    int                                 m_layer_index_top   { -1 };

    // State of the body transformation.
    int                                 m_layer_index       { -1 };
    Vec3d                               m_position          { Vec3d::Zero() };
    double                              m_feed_rate_minute  { MachineParameters::DEFAULT_FEED_RATE_MINUTE };
    std::optional<double>               m_flow_rate;
    std::complex<double>                m_rotation          { 1., 0. };
    std::optional<Pointfs>              m_perimeter;
    std::optional<std::vector<Pointfs>> m_infill_boundaries;
};

// Does the header already record the procedure, or is there nothing to process?
// A G-code without the end of the extruder initialization counts as done.
bool is_procedure_done_or_file_is_empty(const std::string &gcode, const std::string &procedure);

// Skin the G-code text with the given settings. The text is returned unchanged if it is empty,
// if it has already been skinned, if it has no extruder initialization or if the stage is not activated.
std::string get_crafted_text(const std::string &gcode, const SkinConfig &config);

} // namespace Skinner

#endif // skinner_Skin_hpp_
