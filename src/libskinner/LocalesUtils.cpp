///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "LocalesUtils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <fast_float/fast_float.h>

namespace Skinner {

double string_to_double_decimal_point(const std::string_view str, size_t* pos /* = nullptr*/)
{
    double out = 0.;
    size_t p = fast_float::from_chars(str.data(), str.data() + str.size(), out).ptr - str.data();
    if (pos)
        *pos = p;
    return out;
}

bool parse_double_decimal_point(const std::string_view str, double &out)
{
    std::string_view s = str;
    if (! s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return false;
    double value = 0.;
    fast_float::from_chars_result res = fast_float::from_chars(s.data(), s.data() + s.size(), value);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return false;
    out = value;
    return true;
}

std::string to_string_nozero(double value, int decimal_places)
{
    decimal_places = std::max(0, std::min(decimal_places, 15));
    double scale   = std::pow(10., decimal_places);
    double rounded = std::round(value * scale) / scale;
    // no "-0.0"
    if (rounded == 0.)
        rounded = 0.;
    std::stringstream ss;
    ss << std::fixed << std::setprecision(std::max(1, decimal_places)) << rounded;
    std::string ret = ss.str();
    size_t dot = ret.find('.');
    if (dot != std::string::npos) {
        size_t last = ret.find_last_not_of('0');
        // keep one digit after the decimal point
        ret.erase(std::max(last, dot + 1) + 1);
    }
    return ret;
}

std::string to_string_four_significant_figures(double value)
{
    double absolute = std::abs(value);
    if (absolute >= 100.)
        return to_string_nozero(value, 2);
    if (absolute < 0.000000001)
        return to_string_nozero(value, 13);
    return to_string_nozero(value, 3 - int(std::floor(std::log10(absolute))));
}

} // namespace Skinner
