///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef SKINNER_HPP
#define SKINNER_HPP

#include "libskinner/SkinConfig.hpp"

#include <string>
#include <vector>

namespace Skinner {

class CLI {
public:
    int run(int argc, char **argv);

private:
    // Read the command line into the config and the input files. Returns false on a usage error.
    bool setup(int argc, const char* const argv[]);
    void print_help() const;
    // Skin a single file, throws on failure.
    void process_file(const std::string &input_file, const std::string &output_file) const;

    SkinConfig                  m_config;
    std::vector<std::string>    m_input_files;
    std::string                 m_output;
    std::string                 m_save;
    std::vector<std::string>    m_load_configs;
    bool                        m_help { false };
};

} // namespace Skinner

#endif // SKINNER_HPP
