///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef skinner_GCodeReader_hpp_
#define skinner_GCodeReader_hpp_

#include "../libskinner.h"
#include "../Point.hpp"

#include <complex>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace Skinner {

// Reader of the annotated G-code, one line at a time.
// Words are separated by whitespaces. A G-code line is cut at the first ';' or '(' comment,
// while a line starting with '(' is a structural tag and is split whole.
class GCodeReader {
public:
    class GCodeLine {
    public:
        GCodeLine() = default;
        explicit GCodeLine(std::string_view raw) : m_raw(raw), m_words(split_line_before_bracket_semicolon(raw)) {}

        const std::string_view          raw()        const { return m_raw; }
        const std::vector<std::string>& words()      const { return m_words; }
        size_t                          size()       const { return m_words.size(); }
        bool                            empty()      const { return m_words.empty(); }
        // First word of the line, empty if the line has no word.
        const std::string&              first_word() const;
        // Word at index idx, throws GCodeParseError if the line is too short.
        const std::string&              word(size_t idx) const;

        // Index of the first word starting with the given letter, searching from the second word on. -1 if not found.
        int     index_of_word_starting_with(char letter) const;
        bool    has(char letter) const { return this->index_of_word_starting_with(letter) >= 0; }
        // Value of the word starting with the given letter, searching from the second word on.
        // Returns false if not found, throws GCodeParseError if the number is malformed.
        bool    value(char letter, double &out) const;
        // Whole word at index idx parsed as a number, throws GCodeParseError if malformed.
        double  double_at(size_t idx) const;
        // Word at index idx without its first letter parsed as a number ("S210" -> 210),
        // throws GCodeParseError if malformed.
        double  double_after_first_letter(size_t idx) const;

        // X, Y, Z words applied over the previous location. Missing axes keep their previous value.
        Vec3d   location(const Vec3d &previous) const;
        // F word in mm/min, or the previous feed rate if there is none.
        double  feed_rate(double previous) const;
        // Rotation as a complex number from the "(a+bj)" / "bj" / "a" notation of the second word.
        std::complex<double> rotation() const;

    private:
        std::string_view         m_raw;
        std::vector<std::string> m_words;
    };

    typedef std::function<void(GCodeReader&, const GCodeLine&)> callback_t;

    // Call the callback for each line of the buffer, the lines ending with "\n", "\r\n" or "\r".
    void parse_buffer(const std::string &buffer, callback_t callback);

    static std::vector<std::string> split_line_before_bracket_semicolon(std::string_view line);
    // Split text into lines. A "\r\n" pair counts as a single line break. A final line break does not start a new line.
    static std::vector<std::string_view> split_lines(std::string_view text);
    // Parse a number in the Python complex notation: "(0.5+0.866j)", "1j", "-1.0", "(6.1e-17-1j)".
    // Throws GCodeParseError if malformed.
    static std::complex<double> parse_complex(const std::string &str);
};

} // namespace Skinner

#endif // skinner_GCodeReader_hpp_
