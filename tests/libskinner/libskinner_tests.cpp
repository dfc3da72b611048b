#include <catch_main.hpp>

#include "libskinner/libskinner.h"
#include "libskinner/Exception.hpp"
#include "libskinner/Utils.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

using namespace Skinner;

TEST_CASE("sort_remove_duplicates", "[utils]") {
    std::vector<int> data { 3, 1, 2, 3, 1, 5 };
    sort_remove_duplicates(data);
    REQUIRE(data == std::vector<int>{ 1, 2, 3, 5 });
}

TEST_CASE("append", "[utils]") {
    std::vector<int> dest { 1, 2 };
    append(dest, std::vector<int>{ 3, 4 });
    REQUIRE(dest == std::vector<int>{ 1, 2, 3, 4 });
    std::vector<int> empty;
    append(empty, dest);
    REQUIRE(empty == dest);
}

TEST_CASE("Scaling of coordinates", "[utils]") {
    REQUIRE(scale_(1.) == Approx(1000000.));
    REQUIRE(unscale<double>(coord_t(2500000)) == Approx(2.5));
}

TEST_CASE("Logging level", "[utils]") {
    unsigned int level = 100;
    SECTION("Valid levels are parsed") {
        REQUIRE(parse_logging_level("0", level));
        REQUIRE(level == 0);
        REQUIRE(parse_logging_level("5", level));
        REQUIRE(level == 5);
    }
    SECTION("Invalid levels are rejected") {
        REQUIRE(! parse_logging_level("6", level));
        REQUIRE(! parse_logging_level("", level));
        REQUIRE(! parse_logging_level("12", level));
        REQUIRE(! parse_logging_level("x", level));
        REQUIRE(level == 100);
    }
}

TEST_CASE("Formatting of messages", "[utils]") {
    REQUIRE(format("%1% layers at %2% mm", 3, 0.4) == "3 layers at 0.4 mm");
    REQUIRE(format("no arguments") == "no arguments");
}

TEST_CASE("Output file name", "[utils]") {
    boost::filesystem::path expected = boost::filesystem::path("models") / "part_skin.gcode";
    REQUIRE(output_file_name((boost::filesystem::path("models") / "part.gcode").string(), "skin") == expected.string());
    REQUIRE(output_file_name("part.gcode", "skin") == "part_skin.gcode");
    REQUIRE(output_file_name("part.nc", "skin") == "part_skin.gcode");
}

SCENARIO("Text file round trip", "[utils]") {
    GIVEN("A file in the temporary directory") {
        boost::filesystem::path path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("skinner-%%%%-%%%%.gcode");
        WHEN("G-code is saved and loaded back") {
            const std::string gcode = "G1 X1.0 Y2.0\nM101\r\nM103\n";
            save_file_content(path.string(), gcode);
            THEN("The content is unchanged, line endings included") {
                REQUIRE(load_file_content(path.string()) == gcode);
            }
            boost::filesystem::remove(path);
        }
        WHEN("The file does not exist") {
            THEN("Loading throws FileIOError") {
                REQUIRE_THROWS_AS(load_file_content(path.string()), FileIOError);
            }
        }
    }
}
