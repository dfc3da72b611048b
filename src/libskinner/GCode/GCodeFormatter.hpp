///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_GCodeFormatter_hpp_
#define skinner_GCodeFormatter_hpp_

#include "../libskinner.h"
#include "../Point.hpp"

#include <string>

namespace Skinner {

// Builds a single G-code line, word by word. Numbers are rounded to the carried decimal places
// and printed without trailing zeros, keeping one decimal digit.
class GCodeFormatter
{
public:
    explicit GCodeFormatter(int decimal_places) : m_decimal_places(decimal_places) {}
    GCodeFormatter(const GCodeFormatter &) = delete;
    GCodeFormatter& operator=(const GCodeFormatter &) = delete;

    void emit_axis(const char axis, const double v);

    void emit_xyz(const Vec3d &point)
    {
        this->emit_axis('X', point.x());
        this->emit_axis('Y', point.y());
        this->emit_z(point.z());
    }

    void emit_z(const double z) { this->emit_axis('Z', z); }
    void emit_f(double speed) { this->emit_axis('F', speed); }

    // The line without the line break, the writer adds it.
    const std::string& string() const { return m_buf; }

protected:
    int         m_decimal_places;
    std::string m_buf;
};

class GCodeG1Formatter : public GCodeFormatter {
public:
    explicit GCodeG1Formatter(int decimal_places) : GCodeFormatter(decimal_places) { m_buf = "G1"; }
};

} // namespace Skinner

#endif // skinner_GCodeFormatter_hpp_
