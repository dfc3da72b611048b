///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_GCodeWriter_hpp_
#define skinner_GCodeWriter_hpp_

#include "../libskinner.h"
#include "../Point.hpp"

#include <string>
#include <string_view>

namespace Skinner {

// Accumulates the output G-code of a transformation.
class GCodeWriter {
public:
    static constexpr const int DEFAULT_DECIMAL_PLACES = 3;

    GCodeWriter() = default;

    void        set_decimal_places(int decimal_places) { m_decimal_places = decimal_places; }

    // Append a line, empty lines are dropped.
    void        add_line(std::string_view line);
    // (<procedureName> name </procedureName>)
    void        add_tag_bracketed_procedure(const std::string &procedure);
    // M108 S<flow rate with four significant figures>
    void        add_flow_rate(double flow_rate);
    // G1 X Y Z F, without extrusion state change.
    void        add_movement_z_with_feed_rate(double feed_rate_minute, const Vec2d &point, double z);
    // Extruded thread at height z: travel to the first point at the travel feed rate, M101,
    // the following points at the feed rate, M103.
    void        add_thread(double feed_rate_minute, const Pointfs &thread, double travel_feed_rate_minute, double z);

    const std::string& str() const { return m_gcode; }

private:
    std::string m_gcode;
    int         m_decimal_places = DEFAULT_DECIMAL_PLACES;
};

// Drop the lines of the command (first word) identical to the last written line of the same command,
// and drop the empty lines.
std::string remove_duplicated_commands(const std::string &gcode, std::string_view command);

} // namespace Skinner

#endif // skinner_GCodeWriter_hpp_
