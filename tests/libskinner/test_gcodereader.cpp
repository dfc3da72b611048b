#include <catch2/catch.hpp>

#include "libskinner/Exception.hpp"
#include "libskinner/GCode/GCodeReader.hpp"
#include "libskinner/GCode/SkeinTags.hpp"

using namespace Skinner;

TEST_CASE("Splitting of lines into words", "[GCodeReader]") {
    SECTION("Moves are cut at the comments") {
        REQUIRE(GCodeReader::split_line_before_bracket_semicolon("G1 X1.0 Y2.0 ; travel") == std::vector<std::string>{ "G1", "X1.0", "Y2.0" });
        REQUIRE(GCodeReader::split_line_before_bracket_semicolon("G1 X1.0 (comment) Y2.0") == std::vector<std::string>{ "G1", "X1.0" });
    }
    SECTION("Tags are split whole") {
        REQUIRE(GCodeReader::split_line_before_bracket_semicolon("(<layer> 0.4 )") == std::vector<std::string>{ "(<layer>", "0.4", ")" });
        REQUIRE(GCodeReader::split_line_before_bracket_semicolon("(<boundaryPoint> X1.0 Y2.0 Z0.4 </boundaryPoint>)") ==
            std::vector<std::string>{ "(<boundaryPoint>", "X1.0", "Y2.0", "Z0.4", "</boundaryPoint>)" });
    }
    SECTION("Whitespaces are compressed") {
        REQUIRE(GCodeReader::split_line_before_bracket_semicolon("  M108 \t S210.0  ") == std::vector<std::string>{ "M108", "S210.0" });
    }
    SECTION("Empty lines and comment lines have no words") {
        REQUIRE(GCodeReader::split_line_before_bracket_semicolon("").empty());
        REQUIRE(GCodeReader::split_line_before_bracket_semicolon("; just a comment").empty());
        REQUIRE(GCodeReader::GCodeLine("   ").first_word().empty());
    }
}

TEST_CASE("Splitting of text into lines", "[GCodeReader]") {
    REQUIRE(GCodeReader::split_lines("a\nb\n") == std::vector<std::string_view>{ "a", "b" });
    REQUIRE(GCodeReader::split_lines("a\r\nb\rc") == std::vector<std::string_view>{ "a", "b", "c" });
    REQUIRE(GCodeReader::split_lines("a\n\nb") == std::vector<std::string_view>{ "a", "", "b" });
    REQUIRE(GCodeReader::split_lines("").empty());
}

SCENARIO("Reading of move lines", "[GCodeReader]") {
    GIVEN("A move with all the axes and a feed rate") {
        GCodeReader::GCodeLine line("G1 X10.5 Y-2.25 Z0.4 F1200.0");
        THEN("The words are found") {
            REQUIRE(line.first_word() == "G1");
            REQUIRE(line.has('X'));
            REQUIRE(! line.has('E'));
            REQUIRE(line.index_of_word_starting_with('Z') == 3);
        }
        THEN("The location replaces the previous one") {
            Vec3d loc = line.location(Vec3d(1., 2., 3.));
            REQUIRE(loc.x() == Approx(10.5));
            REQUIRE(loc.y() == Approx(-2.25));
            REQUIRE(loc.z() == Approx(0.4));
        }
        THEN("The feed rate is read") {
            REQUIRE(line.feed_rate(959.) == Approx(1200.));
        }
    }
    GIVEN("A move with the X axis only") {
        GCodeReader::GCodeLine line("G1 X3");
        THEN("The other axes keep their previous values") {
            Vec3d loc = line.location(Vec3d(1., 2., 3.));
            REQUIRE(loc == Vec3d(3., 2., 3.));
        }
        THEN("The feed rate keeps its previous value") {
            REQUIRE(line.feed_rate(959.) == Approx(959.));
        }
    }
    GIVEN("A move with a malformed number") {
        GCodeReader::GCodeLine line("G1 X1.2.3 Y1");
        THEN("Reading the location throws") {
            REQUIRE_THROWS_AS(line.location(Vec3d::Zero()), GCodeParseError);
        }
    }
    GIVEN("A move with an explicit plus sign and an exponent") {
        GCodeReader::GCodeLine line("G1 X+1.5 Y2e-1");
        THEN("Both are parsed") {
            Vec3d loc = line.location(Vec3d::Zero());
            REQUIRE(loc.x() == Approx(1.5));
            REQUIRE(loc.y() == Approx(0.2));
        }
    }
}

SCENARIO("Reading of tag lines", "[GCodeReader]") {
    GIVEN("A layer tag") {
        GCodeReader::GCodeLine line("(<layer> 0.6 )");
        THEN("The height is the second word") {
            REQUIRE(classify_skein_tag(line.first_word()) == SkeinTag::Layer);
            REQUIRE(line.double_at(1) == Approx(0.6));
        }
    }
    GIVEN("A header tag without its value") {
        GCodeReader::GCodeLine line("(<layerThickness>");
        THEN("Reading the value throws") {
            REQUIRE_THROWS_AS(line.double_at(1), GCodeParseError);
        }
    }
    GIVEN("A header tag with a malformed value") {
        GCodeReader::GCodeLine line("(<perimeterWidth> abc </perimeterWidth>)");
        THEN("Reading the value throws") {
            REQUIRE_THROWS_AS(line.double_at(1), GCodeParseError);
        }
    }
    GIVEN("A flow rate") {
        GCodeReader::GCodeLine line("M108 S210.0");
        THEN("The value follows the letter") {
            REQUIRE(classify_skein_tag(line.first_word()) == SkeinTag::FlowRate);
            REQUIRE(line.double_after_first_letter(1) == Approx(210.));
        }
    }
    GIVEN("A rotation") {
        GCodeReader::GCodeLine line("(<rotation> (0.5+0.866j) </rotation>)");
        THEN("The complex number is read") {
            std::complex<double> rotation = line.rotation();
            REQUIRE(rotation.real() == Approx(0.5));
            REQUIRE(rotation.imag() == Approx(0.866));
        }
    }
    GIVEN("A malformed rotation") {
        GCodeReader::GCodeLine line("(<rotation> (0.5+xj) </rotation>)");
        THEN("Reading it throws") {
            REQUIRE_THROWS_AS(line.rotation(), GCodeParseError);
        }
    }
}

TEST_CASE("Complex numbers", "[GCodeReader]") {
    auto check = [](const std::string &str, double re, double im) {
        std::complex<double> c = GCodeReader::parse_complex(str);
        REQUIRE(c.real() == Approx(re).margin(1e-12));
        REQUIRE(c.imag() == Approx(im).margin(1e-12));
    };
    check("(0.5+0.866j)", 0.5, 0.866);
    check("(0.5-0.866j)", 0.5, -0.866);
    check("(-0.5-0.866j)", -0.5, -0.866);
    check("1j", 0., 1.);
    check("-1j", 0., -1.);
    check("j", 0., 1.);
    check("1.0", 1., 0.);
    check("-1", -1., 0.);
    check("(6.123233995736766e-17+1j)", 6.123233995736766e-17, 1.);
    check("(1e-05-1j)", 1e-05, -1.);
    REQUIRE_THROWS_AS(GCodeReader::parse_complex(""), GCodeParseError);
    REQUIRE_THROWS_AS(GCodeReader::parse_complex("abc"), GCodeParseError);
}

TEST_CASE("Classification of tags", "[SkeinTags]") {
    REQUIRE(classify_skein_tag("G1") == SkeinTag::Move);
    REQUIRE(classify_skein_tag("M101") == SkeinTag::ExtruderOn);
    REQUIRE(classify_skein_tag("M103") == SkeinTag::ExtruderOff);
    REQUIRE(classify_skein_tag("(<perimeter>") == SkeinTag::Perimeter);
    REQUIRE(classify_skein_tag("(</perimeter>)") == SkeinTag::PerimeterEnd);
    REQUIRE(classify_skein_tag("(<infill>)") == SkeinTag::Infill);
    REQUIRE(classify_skein_tag("(</extruderInitialization>)") == SkeinTag::ExtruderInitializationEnd);
    REQUIRE(classify_skein_tag("G0") == SkeinTag::Other);
    REQUIRE(classify_skein_tag("") == SkeinTag::Other);
    REQUIRE(procedure_name_line("skin") == "(<procedureName> skin </procedureName>)");
}

TEST_CASE("Parsing of a buffer", "[GCodeReader]") {
    GCodeReader reader;
    std::vector<std::string> first_words;
    reader.parse_buffer("G1 X1\r\nM101\n\nM103", [&first_words](GCodeReader &, const GCodeReader::GCodeLine &line) {
        first_words.emplace_back(line.first_word());
    });
    REQUIRE(first_words == std::vector<std::string>{ "G1", "M101", "", "M103" });
}
