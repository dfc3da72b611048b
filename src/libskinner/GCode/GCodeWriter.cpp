///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "GCodeWriter.hpp"
#include "GCodeFormatter.hpp"
#include "GCodeReader.hpp"
#include "SkeinTags.hpp"
#include "../LocalesUtils.hpp"

#include <boost/log/trivial.hpp>

namespace Skinner {

void GCodeWriter::add_line(std::string_view line)
{
    if (line.empty())
        return;
    m_gcode.append(line.data(), line.size());
    m_gcode += '\n';
}

void GCodeWriter::add_tag_bracketed_procedure(const std::string &procedure)
{
    this->add_line(procedure_name_line(procedure));
}

void GCodeWriter::add_flow_rate(double flow_rate)
{
    this->add_line("M108 S" + to_string_four_significant_figures(flow_rate));
}

void GCodeWriter::add_movement_z_with_feed_rate(double feed_rate_minute, const Vec2d &point, double z)
{
    GCodeG1Formatter w(m_decimal_places);
    w.emit_xyz(Vec3d(point.x(), point.y(), z));
    w.emit_f(feed_rate_minute);
    this->add_line(w.string());
}

void GCodeWriter::add_thread(double feed_rate_minute, const Pointfs &thread, double travel_feed_rate_minute, double z)
{
    if (thread.empty()) {
        BOOST_LOG_TRIVIAL(warning) << "GCodeWriter::add_thread: thread is empty, nothing emitted";
        return;
    }
    this->add_movement_z_with_feed_rate(travel_feed_rate_minute, thread.front(), z);
    if (thread.size() < 2) {
        BOOST_LOG_TRIVIAL(warning) << "GCodeWriter::add_thread: thread has a single point, only the travel move is emitted";
        return;
    }
    this->add_line("M101");
    for (size_t i = 1; i < thread.size(); ++ i)
        this->add_movement_z_with_feed_rate(feed_rate_minute, thread[i], z);
    this->add_line("M103");
}

std::string remove_duplicated_commands(const std::string &gcode, std::string_view command)
{
    std::string out;
    out.reserve(gcode.size());
    std::string_view last_written;
    bool             has_last_written = false;
    for (std::string_view line : GCodeReader::split_lines(gcode)) {
        if (line.empty())
            continue;
        GCodeReader::GCodeLine gline(line);
        if (gline.first_word() == command) {
            if (has_last_written && line == last_written)
                continue;
            last_written     = line;
            has_last_written = true;
        }
        out.append(line.data(), line.size());
        out += '\n';
    }
    return out;
}

} // namespace Skinner
