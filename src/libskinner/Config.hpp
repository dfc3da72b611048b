///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_Config_hpp_
#define skinner_Config_hpp_

#include "libskinner.h"
#include "Exception.hpp"

#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace Skinner {

// Name of the configuration option.
typedef std::string                 t_config_option_key;
typedef std::vector<std::string>    t_config_option_keys;

/// Specialization of std::exception to indicate that an unknown config option has been encountered.
class UnknownOptionException : public ConfigurationError {
public:
    UnknownOptionException() :
        ConfigurationError("Unknown option exception") {}
    UnknownOptionException(const std::string &opt_key) :
        ConfigurationError(std::string("Unknown option exception: ") + opt_key) {}
};

/// Indicate that an option has been deserialized from an invalid value.
class BadOptionValueException : public ConfigurationError
{
public:
    BadOptionValueException() : ConfigurationError("Bad option value exception") {}
    BadOptionValueException(const std::string &message) : ConfigurationError(message) {}
    BadOptionValueException(const char* message) : ConfigurationError(message) {}
};

// Type of a configuration value.
enum ConfigOptionType : uint16_t {
    coNone          = 0,
    // single int
    coInt           = 2,
    // single boolean value
    coBool          = 8,
};

// A generic value of a configuration option.
class ConfigOption {
public:
    virtual ~ConfigOption() {}

    virtual ConfigOptionType    type() const = 0;
    virtual std::string         serialize() const = 0;
    virtual bool                deserialize(const std::string &str) = 0;
    // Set a value from a ConfigOption. The two options should be compatible.
    virtual void                set(const ConfigOption *option) = 0;
};

// Value of a single valued option (bool, int)
template <class T>
class ConfigOptionSingle : public ConfigOption {
public:
    T value;
    explicit ConfigOptionSingle(T value) : value(std::move(value)) {}

    void set(const ConfigOption *rhs) override
    {
        if (rhs->type() != this->type())
            throw ConfigurationError("ConfigOptionSingle: Assigning an incompatible type");
        this->value = static_cast<const ConfigOptionSingle*>(rhs)->value;
    }
};

class ConfigOptionInt : public ConfigOptionSingle<int32_t>
{
public:
    ConfigOptionInt() : ConfigOptionSingle<int32_t>(0) {}
    explicit ConfigOptionInt(int32_t value) : ConfigOptionSingle<int32_t>(value) {}

    static ConfigOptionType static_type() { return coInt; }
    ConfigOptionType        type()  const override { return static_type(); }

    std::string serialize() const override
    {
        std::ostringstream ss;
        ss << this->value;
        return ss.str();
    }

    bool deserialize(const std::string &str) override
    {
        std::istringstream iss(str);
        int32_t v;
        iss >> v;
        if (iss.fail())
            return false;
        // Trailing garbage such as "2x" or "1.5" is not an int.
        iss >> std::ws;
        if (! iss.eof())
            return false;
        this->value = v;
        return true;
    }
};

class ConfigOptionBool : public ConfigOptionSingle<bool>
{
public:
    ConfigOptionBool() : ConfigOptionSingle<bool>(false) {}
    explicit ConfigOptionBool(bool _value) : ConfigOptionSingle<bool>(_value) {}

    static ConfigOptionType static_type() { return coBool; }
    ConfigOptionType        type()      const override { return static_type(); }

    std::string serialize() const override { return std::string(this->value ? "1" : "0"); }

    bool deserialize(const std::string &str) override
    {
        if (str == "1" || str == "true") {
            this->value = true;
            return true;
        }
        if (str == "0" || str == "false") {
            this->value = false;
            return true;
        }
        return false;
    }
};

// Definition of a configuration value for the purpose of the command line and the ini files.
class ConfigOptionDef
{
public:
    // Identifier of this option.
    t_config_option_key                 opt_key;
    // What type? bool, int.
    ConfigOptionType                    type            = coNone;
    // Default value of this option. The default value object is owned by ConfigDef.
    std::shared_ptr<const ConfigOption> default_value;
    void                                set_default_value(const ConfigOption *ptr) { this->default_value.reset(ptr); }

    // Label of the option, shown by the help screen.
    std::string                         label;
    // Long description of the option, shown by the help screen.
    std::string                         tooltip;
    // Command line name of the option, the option key with dashes instead of underscores if empty.
    std::string                         cli;
    // Min / max allowed values of an int option, applied by the normalization.
    int32_t                             min = INT32_MIN;
    int32_t                             max = INT32_MAX;

    // Name of the option at the command line, --cli_name.
    std::string                         cli_name() const;
    bool                                has_min() const { return this->min != INT32_MIN; }
    bool                                has_max() const { return this->max != INT32_MAX; }
};

typedef std::map<t_config_option_key, ConfigOptionDef> t_optiondef_map;

// Definition of configuration values for the purpose of the command line and the ini files.
class ConfigDef
{
public:
    t_optiondef_map         options;

    bool                    has(const t_config_option_key &opt_key) const { return this->options.count(opt_key) > 0; }
    const ConfigOptionDef*  get(const t_config_option_key &opt_key) const {
        auto it = this->options.find(opt_key);
        return (it == this->options.end()) ? nullptr : &it->second;
    }
    // Find an option definition by its command line name, with dashes or underscores.
    const ConfigOptionDef*  get_by_cli(const std::string &cli_name) const;
    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(options.size());
        for (auto const &kvp : options)
            out.push_back(kvp.first);
        return out;
    }
    bool                    empty() const { return options.empty(); }

    // Iterate through all of the CLI options and write them to a stream.
    std::ostream&           print_cli_help(
        std::ostream& out, bool show_defaults,
        std::function<bool(const ConfigOptionDef &)> filter = [](const ConfigOptionDef &){ return true; }) const;

protected:
    ConfigOptionDef*        add(const t_config_option_key &opt_key, ConfigOptionType type);
};

} // namespace Skinner

#endif // skinner_Config_hpp_
