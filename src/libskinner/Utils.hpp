///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_Utils_hpp_
#define skinner_Utils_hpp_

#include "libskinner.h"

#include <string>
#include <utility>

#include <boost/format.hpp>

namespace Skinner {

// Set the log level of the Boost.Log trivial logger.
// 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
extern void set_logging_level(unsigned int level);
// Parse a log level from a string ("0" to "5"), returns false on an invalid input.
extern bool parse_logging_level(const std::string &str, unsigned int &level);

namespace internal {
    inline void format_recursive(boost::format &) {}
    template<typename T, typename... Args>
    inline void format_recursive(boost::format &fmt, T &&arg, Args&&... args)
    {
        fmt % std::forward<T>(arg);
        format_recursive(fmt, std::forward<Args>(args)...);
    }
}

// Type safe printf-like formatting through boost::format.
template<typename... Args>
inline std::string format(const std::string &fmt, Args&&... args)
{
    boost::format message(fmt);
    internal::format_recursive(message, std::forward<Args>(args)...);
    return message.str();
}

// Read a whole text file, throws FileIOError if the file could not be read.
std::string load_file_content(const std::string &path);
// Write a whole text file, throws FileIOError if the file could not be written.
void        save_file_content(const std::string &path, const std::string &content);

// name.gcode -> name_skin.gcode, in the same directory.
std::string output_file_name(const std::string &input_path, const std::string &suffix);

} // namespace Skinner

#endif // skinner_Utils_hpp_
