///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#include "GCodeReader.hpp"
#include "../Exception.hpp"
#include "../LocalesUtils.hpp"
#include "../Utils.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/erase.hpp>
#include <boost/algorithm/string/split.hpp>

namespace Skinner {

static const std::string empty_word;

const std::string& GCodeReader::GCodeLine::first_word() const
{
    return m_words.empty() ? empty_word : m_words.front();
}

const std::string& GCodeReader::GCodeLine::word(size_t idx) const
{
    if (idx >= m_words.size())
        throw GCodeParseError(format("Missing argument %1% in line \"%2%\"", idx, std::string(m_raw)));
    return m_words[idx];
}

int GCodeReader::GCodeLine::index_of_word_starting_with(char letter) const
{
    for (size_t i = 1; i < m_words.size(); ++ i)
        if (m_words[i].front() == letter)
            return int(i);
    return -1;
}

bool GCodeReader::GCodeLine::value(char letter, double &out) const
{
    int idx = this->index_of_word_starting_with(letter);
    if (idx < 0)
        return false;
    out = this->double_after_first_letter(size_t(idx));
    return true;
}

double GCodeReader::GCodeLine::double_at(size_t idx) const
{
    const std::string &w = this->word(idx);
    double out;
    if (! parse_double_decimal_point(w, out))
        throw GCodeParseError(format("Malformed number \"%1%\" in line \"%2%\"", w, std::string(m_raw)));
    return out;
}

double GCodeReader::GCodeLine::double_after_first_letter(size_t idx) const
{
    const std::string &w = this->word(idx);
    double out;
    if (! parse_double_decimal_point(std::string_view(w).substr(1), out))
        throw GCodeParseError(format("Malformed number \"%1%\" in line \"%2%\"", w, std::string(m_raw)));
    return out;
}

Vec3d GCodeReader::GCodeLine::location(const Vec3d &previous) const
{
    Vec3d out = previous;
    double v;
    if (this->value('X', v))
        out.x() = v;
    if (this->value('Y', v))
        out.y() = v;
    if (this->value('Z', v))
        out.z() = v;
    return out;
}

double GCodeReader::GCodeLine::feed_rate(double previous) const
{
    double f = previous;
    this->value('F', f);
    return f;
}

std::complex<double> GCodeReader::GCodeLine::rotation() const
{
    try {
        return GCodeReader::parse_complex(this->word(1));
    } catch (const GCodeParseError &) {
        throw GCodeParseError(format("Malformed rotation in line \"%1%\"", std::string(m_raw)));
    }
}

void GCodeReader::parse_buffer(const std::string &buffer, callback_t callback)
{
    for (std::string_view raw : split_lines(buffer)) {
        GCodeLine gline(raw);
        callback(*this, gline);
    }
}

std::vector<std::string> GCodeReader::split_line_before_bracket_semicolon(std::string_view line)
{
    std::string_view cut = line;
    size_t first = cut.find_first_not_of(" \t");
    if (first == std::string_view::npos || cut[first] != '(') {
        size_t semicolon = cut.find(';');
        if (semicolon != std::string_view::npos)
            cut = cut.substr(0, semicolon);
        size_t bracket = cut.find('(');
        if (bracket != std::string_view::npos)
            cut = cut.substr(0, bracket);
    }
    std::vector<std::string> words;
    std::string              str(cut);
    boost::split(words, str, boost::is_any_of(" \t\v\f"), boost::token_compress_on);
    words.erase(std::remove_if(words.begin(), words.end(), [](const std::string &w) { return w.empty(); }), words.end());
    return words;
}

std::vector<std::string_view> GCodeReader::split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    size_t begin = 0;
    while (begin < text.size()) {
        size_t end = text.find_first_of("\r\n", begin);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(begin));
            break;
        }
        lines.emplace_back(text.substr(begin, end - begin));
        begin = end + ((text[end] == '\r' && end + 1 < text.size() && text[end + 1] == '\n') ? 2 : 1);
    }
    return lines;
}

std::complex<double> GCodeReader::parse_complex(const std::string &str)
{
    std::string s = boost::erase_all_copy(boost::erase_all_copy(str, "("), ")");
    auto number = [&str](std::string_view sv, double default_value) {
        if (sv.empty() || sv == "+")
            return default_value;
        if (sv == "-")
            return - default_value;
        double out;
        if (! parse_double_decimal_point(sv, out))
            throw GCodeParseError(format("Malformed complex number \"%1%\"", str));
        return out;
    };
    if (s.empty())
        throw GCodeParseError(format("Malformed complex number \"%1%\"", str));
    if (s.back() != 'j' && s.back() != 'J')
        return { number(s, 0.), 0. };
    std::string_view body(s.data(), s.size() - 1);
    // Split at the sign of the imaginary part, skipping the leading sign and the exponent signs.
    size_t split = std::string_view::npos;
    for (size_t i = body.size(); i > 1; -- i) {
        char c = body[i - 1];
        if ((c == '+' || c == '-') && body[i - 2] != 'e' && body[i - 2] != 'E') {
            split = i - 1;
            break;
        }
    }
    if (split == std::string_view::npos)
        return { 0., number(body, 1.) };
    return { number(body.substr(0, split), 0.), number(body.substr(split), 1.) };
}

} // namespace Skinner
