///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_LocalesUtils_hpp_
#define skinner_LocalesUtils_hpp_

#include <string>
#include <string_view>

namespace Skinner {

// Parse a double from the start of str with '.' as the decimal separator independently of the locale.
// The index of the first character not consumed is stored into pos.
double string_to_double_decimal_point(const std::string_view str, size_t* pos = nullptr);
// Parse the whole of str as a double. A leading '+' is accepted. Returns false if str is not a number.
bool   parse_double_decimal_point(const std::string_view str, double &out);

// Round to the given number of decimal places and print without the trailing zeros,
// keeping at least one decimal digit: 2 -> "2.0", 1.2500 -> "1.25".
std::string to_string_nozero(double value, int decimal_places);

// Print a number with four significant figures, at most two decimals for numbers above 100.
std::string to_string_four_significant_figures(double value);

} // namespace Skinner

#endif // skinner_LocalesUtils_hpp_
