///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "Skin.hpp"
#include "SkeinTags.hpp"
#include "SkinInfill.hpp"
#include "SkinPerimeters.hpp"
#include "../Exception.hpp"

#include <boost/log/trivial.hpp>

namespace Skinner {

GCodeSkin::GCodeSkin(const SkinConfig &config) : m_config(config)
{
    m_params.apply_config(m_config);
}

std::string GCodeSkin::process(const std::string &gcode)
{
    const TextLines lines = GCodeReader::split_lines(gcode);
    size_t line_idx = this->parse_initialization(lines);
    m_params.finalize();
    m_flow_rate = m_params.operating_flow_rate;
    this->parse_boundaries(lines, line_idx);
    BOOST_LOG_TRIVIAL(debug) << "GCodeSkin: " << m_boundary_layers.size() << " layers, skinning from layer " << m_layers_from
        << ", top layer " << m_layer_index_top;
    for (; line_idx < lines.size(); ++ line_idx)
        this->process_line(GCodeReader::GCodeLine(lines[line_idx]));
    return remove_duplicated_commands(m_writer.str(), "M108");
}

size_t GCodeSkin::parse_initialization(const TextLines &lines)
{
    for (size_t line_idx = 0; line_idx < lines.size(); ++ line_idx) {
        GCodeReader::GCodeLine line(lines[line_idx]);
        switch (classify_skein_tag(line.first_word())) {
        case SkeinTag::ClipOverPerimeterWidth:
            m_params.clip_over_perimeter_width = line.double_at(1);
            break;
        case SkeinTag::DecimalPlacesCarried:
            m_params.decimal_places_carried = int(line.double_at(1));
            m_writer.set_decimal_places(m_params.decimal_places_carried);
            break;
        case SkeinTag::InfillPerimeterOverlap:
            m_params.infill_perimeter_overlap = line.double_at(1);
            break;
        case SkeinTag::InfillWidth:
            m_params.infill_width = line.double_at(1);
            break;
        case SkeinTag::LayerThickness:
            m_params.layer_thickness = line.double_at(1);
            break;
        case SkeinTag::MaximumZFeedRatePerSecond:
            m_params.maximum_z_feed_rate_minute = 60. * line.double_at(1);
            break;
        case SkeinTag::OperatingFlowRate:
            m_params.operating_flow_rate = line.double_at(1);
            break;
        case SkeinTag::PerimeterWidth:
            m_params.perimeter_width = line.double_at(1);
            break;
        case SkeinTag::TravelFeedRatePerSecond:
            m_params.travel_feed_rate_minute = 60. * line.double_at(1);
            break;
        case SkeinTag::ExtruderInitializationEnd:
            m_writer.add_tag_bracketed_procedure(SKIN_PROCEDURE_NAME);
            m_writer.add_line(line.raw());
            return line_idx + 1;
        default:
            break;
        }
        m_writer.add_line(line.raw());
    }
    return lines.size();
}

void GCodeSkin::parse_boundaries(const TextLines &lines, size_t line_idx)
{
    m_boundary_layers.clear();
    bool loop_open = false;
    for (; line_idx < lines.size(); ++ line_idx) {
        GCodeReader::GCodeLine line(lines[line_idx]);
        switch (classify_skein_tag(line.first_word())) {
        case SkeinTag::BoundaryPerimeterEnd:
            loop_open = false;
            break;
        case SkeinTag::BoundaryPoint:
        {
            if (m_boundary_layers.empty()) {
                BOOST_LOG_TRIVIAL(trace) << "GCodeSkin: boundary point before the first layer ignored";
                break;
            }
            std::vector<Pointfs> &loops = m_boundary_layers.back().loops;
            if (! loop_open) {
                loops.emplace_back();
                loop_open = true;
            }
            loops.back().emplace_back(to_2d(line.location(Vec3d::Zero())));
            break;
        }
        case SkeinTag::Layer:
            m_boundary_layers.emplace_back(line.double_at(1));
            loop_open = false;
            break;
        default:
            break;
        }
    }
    m_layer_index_top = int(m_boundary_layers.size()) - 1;
    m_layers_from     = m_config.layers_from.value;
    for (size_t layer_idx = 0; layer_idx < m_boundary_layers.size(); ++ layer_idx)
        if (! m_boundary_layers[layer_idx].loops.empty()) {
            m_layers_from += int(layer_idx);
            break;
        }
}

void GCodeSkin::process_line(const GCodeReader::GCodeLine &line)
{
    switch (classify_skein_tag(line.first_word())) {
    case SkeinTag::Move:
        m_feed_rate_minute = line.feed_rate(m_feed_rate_minute);
        m_position         = line.location(m_position);
        if (m_infill_boundaries)
            return;
        if (m_perimeter) {
            m_perimeter->emplace_back(to_2d(m_position));
            return;
        }
        break;
    case SkeinTag::Infill:
        if (m_layer_index >= m_layers_from && m_layer_index == m_layer_index_top)
            m_infill_boundaries.emplace();
        break;
    case SkeinTag::InfillEnd:
        this->add_skinned_infill();
        break;
    case SkeinTag::InfillBoundary:
        if (m_infill_boundaries)
            m_infill_boundaries->emplace_back();
        break;
    case SkeinTag::InfillPoint:
        if (m_infill_boundaries) {
            if (m_infill_boundaries->empty())
                m_infill_boundaries->emplace_back();
            m_infill_boundaries->back().emplace_back(to_2d(line.location(Vec3d::Zero())));
        }
        break;
    case SkeinTag::Layer:
        ++ m_layer_index;
        BOOST_LOG_TRIVIAL(info) << "Skin: processing layer " << m_layer_index << " of " << m_boundary_layers.size();
        break;
    case SkeinTag::ExtruderOn:
    case SkeinTag::ExtruderOff:
        if (m_infill_boundaries || m_perimeter)
            return;
        break;
    case SkeinTag::FlowRate:
        m_flow_rate = line.double_after_first_letter(1);
        break;
    case SkeinTag::Perimeter:
        if (m_layer_index >= m_layers_from)
            m_perimeter.emplace();
        break;
    case SkeinTag::PerimeterEnd:
        this->add_skinned_perimeter();
        break;
    case SkeinTag::Rotation:
        m_rotation = line.rotation();
        break;
    case SkeinTag::Other:
    case SkeinTag::BoundaryPoint:
    case SkeinTag::BoundaryPerimeterEnd:
    case SkeinTag::ClipOverPerimeterWidth:
    case SkeinTag::DecimalPlacesCarried:
    case SkeinTag::InfillPerimeterOverlap:
    case SkeinTag::InfillWidth:
    case SkeinTag::LayerThickness:
    case SkeinTag::MaximumZFeedRatePerSecond:
    case SkeinTag::OperatingFlowRate:
    case SkeinTag::PerimeterWidth:
    case SkeinTag::TravelFeedRatePerSecond:
    case SkeinTag::ProcedureName:
    case SkeinTag::ExtruderInitializationEnd:
        break;
    }
    m_writer.add_line(line.raw());
}

double GCodeSkin::flow_rate() const
{
    if (! m_flow_rate)
        throw SkinError("The flow rate is unknown, neither the G-code header nor a M108 command defined it");
    return *m_flow_rate;
}

void GCodeSkin::add_skinned_perimeter()
{
    if (! m_perimeter)
        return;
    SkinPerimeterGenerator(m_params, m_writer).process(*m_perimeter, m_position.z(), m_feed_rate_minute, this->flow_rate());
    m_perimeter.reset();
}

void GCodeSkin::add_skinned_infill()
{
    if (! m_infill_boundaries)
        return;
    std::optional<Vec2d> last = SkinInfillGenerator(m_params, m_writer).process(
        *m_infill_boundaries, m_position.z(), m_feed_rate_minute, this->flow_rate(), m_rotation);
    if (last)
        m_position = Vec3d(last->x(), last->y(), m_position.z());
    m_infill_boundaries.reset();
}

bool is_procedure_done_or_file_is_empty(const std::string &gcode, const std::string &procedure)
{
    if (gcode.empty())
        return true;
    size_t init_end = gcode.find(EXTRUDER_INITIALIZATION_END);
    if (init_end == std::string::npos) {
        BOOST_LOG_TRIVIAL(warning) << "The G-code has no extruder initialization, it is not processed";
        return true;
    }
    return std::string_view(gcode).substr(0, init_end).find(procedure_name_line(procedure)) != std::string_view::npos;
}

std::string get_crafted_text(const std::string &gcode, const SkinConfig &config)
{
    if (is_procedure_done_or_file_is_empty(gcode, SKIN_PROCEDURE_NAME)) {
        BOOST_LOG_TRIVIAL(info) << "Skin: nothing to do, the G-code is empty or already skinned";
        return gcode;
    }
    if (! config.activate_skin.value) {
        BOOST_LOG_TRIVIAL(info) << "Skin: the skin stage is not activated";
        return gcode;
    }
    SkinConfig normalized(config);
    normalized.normalize();
    GCodeSkin skin(normalized);
    return skin.process(gcode);
}

} // namespace Skinner
