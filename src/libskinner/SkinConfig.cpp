///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "SkinConfig.hpp"
#include "Utils.hpp"

#include <sstream>

#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Skinner {

SkinConfigDef::SkinConfigDef()
{
    ConfigOptionDef* def;

    def = this->add("activate_skin", coBool);
    def->label = "Activate Skin";
    def->tooltip = "Replace the perimeters and the infill of the upper layers by thinner sub-layers.";
    def->set_default_value(new ConfigOptionBool(false));

    def = this->add("horizontal_infill_divisions", coInt);
    def->label = "Horizontal Infill Divisions";
    def->tooltip = "Number of the thin infill lines laid over the width of one infill line.";
    def->min = 1;
    def->set_default_value(new ConfigOptionInt(2));

    def = this->add("horizontal_perimeter_divisions", coInt);
    def->label = "Horizontal Perimeter Divisions";
    def->tooltip = "Number of the thin perimeter loops laid over the width of one perimeter loop.";
    def->min = 1;
    def->set_default_value(new ConfigOptionInt(1));

    def = this->add("vertical_divisions", coInt);
    def->label = "Vertical Divisions";
    def->tooltip = "Number of the sub-layers laid over the thickness of one layer.";
    def->min = 1;
    def->set_default_value(new ConfigOptionInt(2));

    def = this->add("hop_when_extruding_infill", coBool);
    def->label = "Hop When Extruding Infill";
    def->tooltip = "Lift the nozzle to the layer top before and after each infill path of the lower sub-layers.";
    def->set_default_value(new ConfigOptionBool(false));

    def = this->add("layers_from", coInt);
    def->label = "Layers From";
    def->tooltip = "Index of the first layer to skin, counted from the first layer with a boundary.";
    def->min = 0;
    def->set_default_value(new ConfigOptionInt(1));
}

const SkinConfigDef skin_config_def;

#define OPT_PTR(KEY) if (opt_key == #KEY) return &this->KEY

SkinConfig::SkinConfig()
{
    for (const t_config_option_key &opt_key : this->keys())
        this->option(opt_key)->set(skin_config_def.get(opt_key)->default_value.get());
}

ConfigOption* SkinConfig::option(const t_config_option_key &opt_key)
{
    OPT_PTR(activate_skin);
    OPT_PTR(horizontal_infill_divisions);
    OPT_PTR(horizontal_perimeter_divisions);
    OPT_PTR(vertical_divisions);
    OPT_PTR(hop_when_extruding_infill);
    OPT_PTR(layers_from);
    return nullptr;
}

#undef OPT_PTR

ConfigOption* SkinConfig::option_throw(const t_config_option_key &opt_key)
{
    ConfigOption *opt = this->option(opt_key);
    if (opt == nullptr)
        throw UnknownOptionException(opt_key);
    return opt;
}

void SkinConfig::set_deserialize(const t_config_option_key &opt_key, const std::string &str)
{
    ConfigOption *opt = this->option_throw(opt_key);
    if (! opt->deserialize(boost::trim_copy(str)))
        throw BadOptionValueException(format("Invalid value provided for parameter %1%: %2%", opt_key, str));
}

void SkinConfig::load(const boost::property_tree::ptree &tree)
{
    for (const boost::property_tree::ptree::value_type &v : tree) {
        try {
            this->set_deserialize(v.first, v.second.get_value<std::string>());
        } catch (const UnknownOptionException &) {
            // ignore
            BOOST_LOG_TRIVIAL(warning) << "Skipping unknown configuration option " << v.first;
        }
    }
}

void SkinConfig::load_from_ini(const std::string &file)
{
    try {
        this->load_from_ini_string(load_file_content(file));
    } catch (const ConfigurationError &e) {
        throw ConfigurationError(format("Failed loading configuration file \"%1%\": %2%", file, e.what()));
    } catch (const FileIOError &e) {
        throw ConfigurationError(format("Failed loading configuration file \"%1%\": %2%", file, e.what()));
    }
}

void SkinConfig::load_from_ini_string(const std::string &data)
{
    boost::property_tree::ptree tree;
    std::istringstream iss(data);
    try {
        boost::property_tree::read_ini(iss, tree);
    } catch (const boost::property_tree::ini_parser_error &e) {
        throw ConfigurationError(format("Failed parsing configuration: %1%", e.what()));
    }
    this->load(tree);
}

std::string SkinConfig::serialize_ini() const
{
    std::ostringstream ss;
    for (const t_config_option_key &opt_key : this->keys())
        ss << opt_key << " = " << this->opt_serialize(opt_key) << "\n";
    return ss.str();
}

void SkinConfig::save(const std::string &file) const
{
    save_file_content(file, this->serialize_ini());
}

t_config_option_keys SkinConfig::normalize()
{
    t_config_option_keys clamped;
    for (const t_config_option_key &opt_key : this->keys()) {
        const ConfigOptionDef *def = skin_config_def.get(opt_key);
        if (def->type != coInt)
            continue;
        auto   *opt = static_cast<ConfigOptionInt*>(this->option(opt_key));
        int32_t v   = clamp(def->min, def->max, opt->value);
        if (v != opt->value) {
            BOOST_LOG_TRIVIAL(warning) << "Configuration option " << opt_key << " = " << opt->value << " is out of range, clamped to " << v;
            opt->value = v;
            clamped.emplace_back(opt_key);
        }
    }
    return clamped;
}

} // namespace Skinner
