/*

html_text.cpp
-------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/algorithm/string/find.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/range/iterator_range.hpp>
#include <boost/regex.hpp>
#include <mailharvest/codec.hpp>
#include <mailharvest/html_text.hpp>


using std::invalid_argument;
using std::out_of_range;
using std::pair;
using std::string;
using std::vector;
using boost::iterator_range;
using boost::make_iterator_range;
using boost::regex;
using boost::regex_replace;
using boost::smatch;
using boost::algorithm::ifind_first;
using boost::algorithm::istarts_with;
using boost::algorithm::replace_all;


namespace mailharvest
{


namespace
{

/*
Replaced in the table order. `&amp;` comes before `&lt;` and `&gt;`, so `&amp;lt;` ends up as `<`.
*/
const vector<string> BLOCK_TAG_NAMES{"div", "p", "br", "li", "tr"};


const vector<pair<string, string>> NAMED_ENTITIES
{
    {"&nbsp;", " "},
    {"&amp;", "&"},
    {"&lt;", "<"},
    {"&gt;", ">"},
    {"&quot;", "\""},
    {"&#39;", "'"},
    {"&apos;", "'"},
    {"&cent;", "\xC2\xA2"},
    {"&pound;", "\xC2\xA3"},
    {"&yen;", "\xC2\xA5"},
    {"&euro;", "\xE2\x82\xAC"},
    {"&copy;", "\xC2\xA9"},
    {"&reg;", "\xC2\xAE"}
};


/*
Formatter of the decimal character references.
*/
struct numeric_reference_formatter
{
    string operator()(const smatch& match) const
    {
        try
        {
            const unsigned long code_point = std::stoul(match[1].str());
            const string encoded = code_point == 0 ? string() : codec::encode_utf8(code_point);
            return encoded.empty() ? match[0].str() : encoded;
        }
        catch (const out_of_range&)
        {
            return match[0].str();
        }
        catch (const invalid_argument&)
        {
            return match[0].str();
        }
    }
};


/*
Length in bytes of the whitespace character at the given position, zero if there is none.
*/
string::size_type whitespace_length(const string& text, string::size_type pos)
{
    const unsigned char ch = static_cast<unsigned char>(text[pos]);
    if (ch == ' ' || (ch >= '\t' && ch <= '\r') || (ch >= 0x1C && ch <= 0x1F))
        return 1;

    auto byte_at = [&text](string::size_type i) -> unsigned char
    {
        return i < text.size() ? static_cast<unsigned char>(text[i]) : 0;
    };
    const unsigned char b1 = byte_at(pos + 1);
    const unsigned char b2 = byte_at(pos + 2);
    // U+0085, U+00A0
    if (ch == 0xC2 && (b1 == 0x85 || b1 == 0xA0))
        return 2;
    // U+1680
    if (ch == 0xE1 && b1 == 0x9A && b2 == 0x80)
        return 3;
    // U+2000 to U+200A, U+2028, U+2029, U+202F, U+205F
    if (ch == 0xE2 && b1 == 0x80 && (b2 <= 0x8A || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) && b2 >= 0x80)
        return 3;
    if (ch == 0xE2 && b1 == 0x81 && b2 == 0x9F)
        return 3;
    // U+3000
    if (ch == 0xE3 && b1 == 0x80 && b2 == 0x80)
        return 3;
    return 0;
}

/*
Removing the elements from the opening tag up to the first closing tag after it, each replaced by a space. An element without the closing tag is kept
as it is, and so is everything after it.
*/
string remove_elements(const string& html, const string& opening, const string& closing)
{
    typedef iterator_range<string::const_iterator> range_t;

    string text;
    range_t rest = make_iterator_range(html.begin(), html.end());
    while (true)
    {
        range_t open_tag = ifind_first(rest, opening);
        if (open_tag.empty())
            break;
        string::const_iterator open_tag_end = std::find(open_tag.end(), rest.end(), '>');
        if (open_tag_end == rest.end())
            break;
        range_t content = make_iterator_range(open_tag_end + 1, rest.end());
        range_t close_tag = ifind_first(content, closing);
        if (close_tag.empty())
            break;
        text.append(rest.begin(), open_tag.begin());
        text += ' ';
        rest = make_iterator_range(close_tag.end(), rest.end());
    }
    text.append(rest.begin(), rest.end());
    return text;
}


/*
Checking whether the tag name starting at the given position is one of the block tags. Only the prefix is compared.
*/
bool is_block_tag(const string& text, string::size_type pos)
{
    auto name = make_iterator_range(text.begin() + pos, text.end());
    for (const auto& block_tag : BLOCK_TAG_NAMES)
        if (istarts_with(name, block_tag))
            return true;
    return pos + 1 < text.size() && (text[pos] == 'h' || text[pos] == 'H') && std::isdigit(static_cast<unsigned char>(text[pos + 1]));
}


/*
Replacing every tag from `<` to the next `>`. With `block_tags_only` the other tags are kept. Text after the last `>` keeps its `<` characters.
*/
string replace_tags(const string& text, const string& replacement, bool block_tags_only)
{
    string result;
    result.reserve(text.size());
    string::size_type pos = 0;
    string::size_type close_pos = 0;
    while (pos < text.size())
    {
        string::size_type open_pos = text.find('<', pos);
        if (open_pos == string::npos)
            break;
        if (close_pos <= open_pos)
        {
            close_pos = text.find('>', open_pos + 1);
            if (close_pos == string::npos)
                break;
        }

        if (block_tags_only && !is_block_tag(text, open_pos + 1))
        {
            result.append(text, pos, open_pos + 1 - pos);
            pos = open_pos + 1;
            continue;
        }
        result.append(text, pos, open_pos - pos);
        result += replacement;
        pos = close_pos + 1;
    }
    result.append(text, pos, string::npos);
    return result;
}

} // anonymous namespace


string html_to_text(const string& html)
{
    static const regex NUMERIC_REFERENCE_REGEX{"&#(\\d+);"};
    static const regex NEWLINES_REGEX{"\\n+"};

    string text = remove_elements(html, "<script", "</script>");
    text = remove_elements(text, "<style", "</style>");
    text = replace_tags(text, "\n", true);
    for (const auto& entity : NAMED_ENTITIES)
        replace_all(text, entity.first, entity.second);
    text = regex_replace(text, NUMERIC_REFERENCE_REGEX, numeric_reference_formatter());
    text = replace_tags(text, "", false);
    text = regex_replace(text, NEWLINES_REGEX, "\n");
    return normalize_whitespace(text);
}


string normalize_whitespace(const string& text)
{
    string normalized;
    normalized.reserve(text.size());
    bool pending_space = false;
    string::size_type pos = 0;
    while (pos < text.size())
    {
        string::size_type length = whitespace_length(text, pos);
        if (length > 0)
        {
            pending_space = !normalized.empty();
            pos += length;
            continue;
        }
        if (pending_space)
        {
            normalized += ' ';
            pending_space = false;
        }
        normalized += text[pos++];
    }
    return normalized;
}


} // namespace mailharvest
