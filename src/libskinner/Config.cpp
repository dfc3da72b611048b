///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "Config.hpp"

#include <algorithm>
#include <iomanip>

#include <boost/algorithm/string/replace.hpp>

namespace Skinner {

std::string ConfigOptionDef::cli_name() const
{
    if (! this->cli.empty())
        return this->cli;
    return boost::replace_all_copy(this->opt_key, "_", "-");
}

ConfigOptionDef* ConfigDef::add(const t_config_option_key &opt_key, ConfigOptionType type)
{
    ConfigOptionDef *opt = &this->options[opt_key];
    opt->opt_key = opt_key;
    opt->type    = type;
    return opt;
}

const ConfigOptionDef* ConfigDef::get_by_cli(const std::string &cli_name) const
{
    std::string key = boost::replace_all_copy(cli_name, "-", "_");
    if (const ConfigOptionDef *def = this->get(key); def != nullptr)
        return def;
    for (const auto &kvp : this->options)
        if (kvp.second.cli_name() == cli_name)
            return &kvp.second;
    return nullptr;
}

std::ostream& ConfigDef::print_cli_help(std::ostream& out, bool show_defaults, std::function<bool(const ConfigOptionDef &)> filter) const
{
    // cache the CLI option => opt_key mapping
    std::map<std::string, std::string> opts;
    for (const auto &opt : this->options)
        if (filter(opt.second))
            opts[opt.second.cli_name()] = opt.first;

    for (const auto &kvp : opts) {
        const ConfigOptionDef &def = this->options.at(kvp.second);
        std::string cli = "--" + kvp.first;
        if (def.type == coBool)
            cli += " (--no-" + kvp.first + ")";
        else
            cli += " N";
        out << " " << std::left << std::setw(44) << cli;

        std::string descr = def.tooltip.empty() ? def.label : def.tooltip;
        if (show_defaults && def.default_value)
            descr += " (default: " + def.default_value->serialize() + ")";
        if (def.has_min())
            descr += " (min: " + std::to_string(def.min) + ")";
        out << descr << std::endl;
    }
    return out;
}

} // namespace Skinner
