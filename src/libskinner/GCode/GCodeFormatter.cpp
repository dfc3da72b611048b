///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "GCodeFormatter.hpp"
#include "../LocalesUtils.hpp"

namespace Skinner {

void GCodeFormatter::emit_axis(const char axis, const double v)
{
    m_buf += ' ';
    m_buf += axis;
    m_buf += to_string_nozero(v, m_decimal_places);
}

} // namespace Skinner
