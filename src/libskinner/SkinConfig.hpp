///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_SkinConfig_hpp_
#define skinner_SkinConfig_hpp_

#include "libskinner.h"
#include "Config.hpp"

#include <string>

#include <boost/property_tree/ptree_fwd.hpp>

namespace Skinner {

// Definitions of the options of the skin stage.
class SkinConfigDef : public ConfigDef
{
public:
    SkinConfigDef();
};

extern const SkinConfigDef skin_config_def;

// Settings of the skin stage.
class SkinConfig
{
public:
    // Run the skin stage at all.
    ConfigOptionBool    activate_skin;
    // Number of the thin infill lines replacing one infill line.
    ConfigOptionInt     horizontal_infill_divisions;
    // Number of the thin perimeter loops replacing one perimeter loop.
    ConfigOptionInt     horizontal_perimeter_divisions;
    // Number of the sub-layers replacing one layer.
    ConfigOptionInt     vertical_divisions;
    // Lift the nozzle to the layer top before and after each infill path of the lower sub-layers.
    ConfigOptionBool    hop_when_extruding_infill;
    // Index of the first layer to skin, counted from the first layer having a boundary.
    ConfigOptionInt     layers_from;

    SkinConfig();

    static const ConfigDef*     def() { return &skin_config_def; }
    t_config_option_keys        keys() const { return skin_config_def.keys(); }
    bool                        has(const t_config_option_key &opt_key) const { return skin_config_def.has(opt_key); }

    ConfigOption*               option(const t_config_option_key &opt_key);
    const ConfigOption*         option(const t_config_option_key &opt_key) const { return const_cast<SkinConfig*>(this)->option(opt_key); }
    // Throws UnknownOptionException if the option is not defined.
    ConfigOption*               option_throw(const t_config_option_key &opt_key);
    const ConfigOption*         option_throw(const t_config_option_key &opt_key) const { return const_cast<SkinConfig*>(this)->option_throw(opt_key); }

    std::string                 opt_serialize(const t_config_option_key &opt_key) const { return this->option_throw(opt_key)->serialize(); }
    // Throws UnknownOptionException for an undefined key and BadOptionValueException for an unparsable value.
    void                        set_deserialize(const t_config_option_key &opt_key, const std::string &str);

    // Load the "key = value" pairs of an ini file. Unknown keys are skipped with a warning.
    // Throws ConfigurationError naming the file if it cannot be read or parsed.
    void                        load_from_ini(const std::string &file);
    void                        load_from_ini_string(const std::string &data);
    void                        load(const boost::property_tree::ptree &tree);
    std::string                 serialize_ini() const;
    // Write the settings as an ini file, throws FileIOError.
    void                        save(const std::string &file) const;

    // Clamp the values into the ranges of their definitions. Returns the keys of the clamped values.
    t_config_option_keys        normalize();
};

} // namespace Skinner

#endif // skinner_SkinConfig_hpp_
