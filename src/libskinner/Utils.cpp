///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "Utils.hpp"
#include "Exception.hpp"

#include <iterator>

#include <boost/filesystem/path.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>

namespace Skinner {

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everyting including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= level_to_boost(level)
    );
}

bool parse_logging_level(const std::string &str, unsigned int &level)
{
    if (str.size() != 1 || str[0] < '0' || str[0] > '5')
        return false;
    level = unsigned(str[0] - '0');
    return true;
}

std::string load_file_content(const std::string &path)
{
    boost::nowide::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (! ifs.good())
        throw FileIOError(format("Cannot open file %1% for reading", path));
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw FileIOError(format("Error reading file %1%", path));
    return content;
}

void save_file_content(const std::string &path, const std::string &content)
{
    boost::nowide::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (! ofs.good())
        throw FileIOError(format("Cannot open file %1% for writing", path));
    ofs << content;
    ofs.close();
    if (ofs.fail())
        throw FileIOError(format("Error writing file %1%", path));
}

std::string output_file_name(const std::string &input_path, const std::string &suffix)
{
    boost::filesystem::path path(input_path);
    boost::filesystem::path out = path.parent_path() / (path.stem().string() + "_" + suffix + ".gcode");
    return out.string();
}

} // namespace Skinner
