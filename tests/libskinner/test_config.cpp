#include <catch2/catch.hpp>

#include "libskinner/Exception.hpp"
#include "libskinner/SkinConfig.hpp"

#include <sstream>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

using namespace Skinner;

SCENARIO("Skin configuration defaults", "[Config]") {
    GIVEN("A default configuration") {
        SkinConfig config;
        THEN("The defaults of the definitions are set") {
            REQUIRE(config.activate_skin.value == false);
            REQUIRE(config.horizontal_infill_divisions.value == 2);
            REQUIRE(config.horizontal_perimeter_divisions.value == 1);
            REQUIRE(config.vertical_divisions.value == 2);
            REQUIRE(config.hop_when_extruding_infill.value == false);
            REQUIRE(config.layers_from.value == 1);
        }
        THEN("Every definition has an option") {
            for (const t_config_option_key &key : config.keys()) {
                REQUIRE(config.option(key) != nullptr);
                REQUIRE(config.option(key)->type() == skin_config_def.get(key)->type);
            }
            REQUIRE(config.keys().size() == 6);
        }
        THEN("It serializes") {
            REQUIRE(config.opt_serialize("activate_skin") == "0");
            REQUIRE(config.opt_serialize("vertical_divisions") == "2");
            REQUIRE(config.serialize_ini().find("layers_from = 1\n") != std::string::npos);
        }
    }
}

SCENARIO("Setting of configuration values", "[Config]") {
    GIVEN("A default configuration") {
        SkinConfig config;
        WHEN("Values are deserialized") {
            config.set_deserialize("activate_skin", "1");
            config.set_deserialize("hop_when_extruding_infill", "true");
            config.set_deserialize("vertical_divisions", " 3 ");
            THEN("They are set") {
                REQUIRE(config.activate_skin.value);
                REQUIRE(config.hop_when_extruding_infill.value);
                REQUIRE(config.vertical_divisions.value == 3);
            }
        }
        THEN("An unknown key throws") {
            REQUIRE_THROWS_AS(config.set_deserialize("perimeter_speed", "30"), UnknownOptionException);
            REQUIRE(config.option("perimeter_speed") == nullptr);
            REQUIRE_THROWS_AS(config.option_throw("perimeter_speed"), UnknownOptionException);
        }
        THEN("An invalid value throws and leaves the value unchanged") {
            REQUIRE_THROWS_AS(config.set_deserialize("vertical_divisions", "2.5"), BadOptionValueException);
            REQUIRE_THROWS_AS(config.set_deserialize("vertical_divisions", "two"), BadOptionValueException);
            REQUIRE_THROWS_AS(config.set_deserialize("activate_skin", "yes"), BadOptionValueException);
            REQUIRE(config.vertical_divisions.value == 2);
            REQUIRE(config.activate_skin.value == false);
        }
        THEN("The configuration errors are Skinner exceptions") {
            REQUIRE_THROWS_AS(config.set_deserialize("layers_from", ""), ConfigurationError);
            REQUIRE_THROWS_AS(config.set_deserialize("unknown", "1"), Exception);
        }
    }
}

SCENARIO("Normalization of the configuration", "[Config]") {
    GIVEN("Out of range values") {
        SkinConfig config;
        config.set_deserialize("horizontal_infill_divisions", "0");
        config.set_deserialize("vertical_divisions", "-3");
        config.set_deserialize("layers_from", "-1");
        WHEN("The configuration is normalized") {
            t_config_option_keys clamped = config.normalize();
            THEN("The values are clamped to their minimums") {
                REQUIRE(config.horizontal_infill_divisions.value == 1);
                REQUIRE(config.vertical_divisions.value == 1);
                REQUIRE(config.layers_from.value == 0);
                REQUIRE(config.horizontal_perimeter_divisions.value == 1);
                REQUIRE(clamped.size() == 3);
            }
            THEN("A second normalization changes nothing") {
                REQUIRE(config.normalize().empty());
            }
        }
    }
}

SCENARIO("Loading of ini files", "[Config]") {
    GIVEN("An ini string with an unknown key") {
        SkinConfig config;
        config.load_from_ini_string("activate_skin = 1\nlayers_from = 4\nperimeter_speed = 30\n");
        THEN("The known keys are loaded, the unknown one is skipped") {
            REQUIRE(config.activate_skin.value);
            REQUIRE(config.layers_from.value == 4);
        }
    }
    GIVEN("An ini string with an invalid value") {
        SkinConfig config;
        THEN("Loading throws") {
            REQUIRE_THROWS_AS(config.load_from_ini_string("vertical_divisions = many\n"), BadOptionValueException);
        }
    }
    GIVEN("The ini file of the test data") {
        SkinConfig config;
        config.load_from_ini(std::string(TEST_DATA_DIR) + "/skin.ini");
        THEN("The settings are loaded") {
            REQUIRE(config.activate_skin.value);
            REQUIRE(config.horizontal_infill_divisions.value == 3);
            REQUIRE(config.horizontal_perimeter_divisions.value == 1);
            REQUIRE(config.vertical_divisions.value == 4);
            REQUIRE(config.hop_when_extruding_infill.value);
            REQUIRE(config.layers_from.value == 2);
        }
    }
    GIVEN("A missing ini file") {
        SkinConfig config;
        THEN("Loading throws a ConfigurationError naming the file") {
            try {
                config.load_from_ini(std::string(TEST_DATA_DIR) + "/missing.ini");
                FAIL("No exception thrown");
            } catch (const ConfigurationError &e) {
                REQUIRE(std::string(e.what()).find("missing.ini") != std::string::npos);
            }
        }
    }
    GIVEN("A serialized configuration") {
        SkinConfig config;
        config.set_deserialize("activate_skin", "1");
        config.set_deserialize("vertical_divisions", "5");
        std::string ini = config.serialize_ini();
        THEN("It loads back") {
            SkinConfig loaded;
            loaded.load_from_ini_string(ini);
            REQUIRE(loaded.activate_skin.value);
            REQUIRE(loaded.vertical_divisions.value == 5);
        }
        WHEN("It is saved to a file") {
            boost::filesystem::path path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("skinner-%%%%-%%%%.ini");
            config.save(path.string());
            SkinConfig loaded;
            loaded.load_from_ini(path.string());
            boost::filesystem::remove(path);
            THEN("The file loads back") {
                REQUIRE(loaded.activate_skin.value);
                REQUIRE(loaded.vertical_divisions.value == 5);
                REQUIRE(loaded.layers_from.value == 1);
            }
        }
    }
}

TEST_CASE("Command line help", "[Config]") {
    REQUIRE(skin_config_def.get("vertical_divisions")->cli_name() == "vertical-divisions");
    REQUIRE(skin_config_def.get_by_cli("vertical-divisions") == skin_config_def.get("vertical_divisions"));
    REQUIRE(skin_config_def.get_by_cli("layers_from") == skin_config_def.get("layers_from"));
    REQUIRE(skin_config_def.get_by_cli("no-such-option") == nullptr);
    std::ostringstream ss;
    skin_config_def.print_cli_help(ss, true);
    const std::string help = ss.str();
    REQUIRE(help.find("--activate-skin (--no-activate-skin)") != std::string::npos);
    REQUIRE(help.find("--vertical-divisions N") != std::string::npos);
    REQUIRE(help.find("(default: 2)") != std::string::npos);
}
