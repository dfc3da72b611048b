///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "skinner.hpp"

#include "libskinner/libskinner.h"
#include "libskinner/Exception.hpp"
#include "libskinner/Utils.hpp"
#include "libskinner/GCode/Skin.hpp"

#include <cstdlib>
#include <map>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/args.hpp>
#include <boost/nowide/cstdlib.hpp>
#include <boost/nowide/iostream.hpp>

namespace Skinner {

int CLI::run(int argc, char **argv)
{
    // Switch boost::filesystem to utf8.
    boost::nowide::args nowide_args(argc, argv);

    set_logging_level(1);
    {
        const char *loglevel = boost::nowide::getenv("SKINNER_LOGLEVEL");
        if (loglevel != nullptr) {
            unsigned int level;
            if (parse_logging_level(loglevel, level))
                set_logging_level(level);
            else
                boost::nowide::cerr << "Invalid SKINNER_LOGLEVEL environment variable: " << loglevel << std::endl;
        }
    }

    if (! this->setup(argc, argv))
        return 1;

    if (m_help || (m_input_files.empty() && m_save.empty())) {
        this->print_help();
        return m_help ? 0 : 1;
    }
    if (! m_output.empty() && m_input_files.size() > 1) {
        boost::nowide::cerr << "Cannot use --output when skinning multiple files." << std::endl;
        return 1;
    }

    try {
        m_config.normalize();
        if (! m_save.empty()) {
            m_config.save(m_save);
            BOOST_LOG_TRIVIAL(info) << "Settings saved to " << m_save;
        }
        for (const std::string &input_file : m_input_files)
            this->process_file(input_file, m_output.empty() ? output_file_name(input_file, SKIN_PROCEDURE_NAME) : m_output);
    } catch (const std::exception &ex) {
        BOOST_LOG_TRIVIAL(error) << ex.what();
        boost::nowide::cerr << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

bool CLI::setup(int argc, const char* const argv[])
{
    // Command line values, applied over the loaded configuration files.
    std::map<std::string, std::string> values;

    bool parse_options = true;
    for (int i = 1; i < argc; ++ i) {
        std::string token = argv[i];
        // Store non-option arguments in the provided vector.
        if (! parse_options || ! boost::starts_with(token, "-")) {
            m_input_files.push_back(token);
            continue;
        }
        // Stop parsing tokens as options when -- is supplied.
        if (token == "--") {
            parse_options = false;
            continue;
        }
        // Remove leading dashes (one or two).
        token.erase(token.begin(), token.begin() + (boost::starts_with(token, "--") ? 2 : 1));
        // Read value when supplied in the --key=value form.
        std::string value;
        bool        has_value = false;
        {
            size_t equals_pos = token.find("=");
            if (equals_pos != std::string::npos) {
                value = token.substr(equals_pos + 1);
                token.erase(equals_pos);
                has_value = true;
            }
        }
        auto next_value = [&](const std::string &name) -> bool {
            if (has_value)
                return true;
            if (i == argc - 1) {
                boost::nowide::cerr << "No value supplied for --" << name << std::endl;
                return false;
            }
            value = argv[++ i];
            return true;
        };

        if (token == "help" || token == "h") {
            m_help = true;
            continue;
        }
        if (token == "load") {
            if (! next_value(token))
                return false;
            m_load_configs.push_back(value);
            continue;
        }
        if (token == "save") {
            if (! next_value(token))
                return false;
            m_save = value;
            continue;
        }
        if (token == "output" || token == "o") {
            if (! next_value(token))
                return false;
            m_output = value;
            continue;
        }
        if (token == "loglevel") {
            if (! next_value(token))
                return false;
            unsigned int level;
            if (! parse_logging_level(value, level)) {
                boost::nowide::cerr << "Invalid value supplied for --loglevel" << std::endl;
                return false;
            }
            set_logging_level(level);
            continue;
        }

        // Look for the cli -> option mapping.
        const ConfigOptionDef *optdef = SkinConfig::def()->get_by_cli(token);
        bool no = false;
        if (optdef == nullptr && boost::starts_with(token, "no-")) {
            // Remove the "no-" prefix used to negate boolean options.
            optdef = SkinConfig::def()->get_by_cli(token.substr(3));
            no     = true;
        }
        if (optdef == nullptr) {
            boost::nowide::cerr << "Unknown option --" << token << std::endl;
            return false;
        }
        if (no) {
            if (optdef->type != coBool) {
                boost::nowide::cerr << "Unknown option --" << token << std::endl;
                return false;
            }
            if (has_value) {
                boost::nowide::cerr << "Boolean options negated by the --no- prefix cannot have a value." << std::endl;
                return false;
            }
            values[optdef->opt_key] = "0";
        } else if (optdef->type == coBool) {
            values[optdef->opt_key] = has_value ? value : "1";
        } else {
            if (! next_value(token))
                return false;
            values[optdef->opt_key] = value;
        }
    }

    // Options given on the command line override the loaded files.
    try {
        for (const std::string &file : m_load_configs)
            m_config.load_from_ini(file);
        for (const auto &kvp : values)
            m_config.set_deserialize(kvp.first, kvp.second);
    } catch (const ConfigurationError &ex) {
        boost::nowide::cerr << ex.what() << std::endl;
        return false;
    }
    return true;
}

void CLI::print_help() const
{
    boost::nowide::cout
        << SKINNER_APP_NAME << "-" << SKINNER_VERSION << std::endl
        << std::endl
        << "Usage: skinner [ OPTIONS ] file.gcode [ file2.gcode ... ]" << std::endl
        << std::endl
        << "Replaces the perimeters and the infill of the upper layers of an annotated G-code" << std::endl
        << "by thinner passes laid at fractional heights of the layers." << std::endl
        << "Each input file name.gcode is written to name_skin.gcode." << std::endl
        << std::endl
        << "Options:" << std::endl
        << " --help, -h                                  Print this help." << std::endl
        << " --load FILE                                 Load the settings from an ini file," << std::endl
        << "                                             the command line options override them." << std::endl
        << " --save FILE                                 Save the resolved settings to an ini file." << std::endl
        << " --output FILE, -o FILE                      Output file, for a single input file only." << std::endl
        << " --loglevel N                                Messages with severity N and above are logged:" << std::endl
        << "                                             0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace." << std::endl
        << std::endl
        << "Skin settings:" << std::endl;
    SkinConfig::def()->print_cli_help(boost::nowide::cout, true);
}

void CLI::process_file(const std::string &input_file, const std::string &output_file) const
{
    BOOST_LOG_TRIVIAL(info) << "Skinning " << input_file;
    std::string gcode   = load_file_content(input_file);
    std::string crafted = get_crafted_text(gcode, m_config);
    save_file_content(output_file, crafted);
    BOOST_LOG_TRIVIAL(info) << "Skinned G-code exported to " << output_file;
    boost::nowide::cout << "Skinned G-code exported to " << output_file << std::endl;
}

} // namespace Skinner

int main(int argc, char **argv)
{
    return Skinner::CLI().run(argc, argv);
}
