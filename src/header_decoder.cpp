/*

header_decoder.cpp
------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <mailharvest/codec.hpp>
#include <mailharvest/header_decoder.hpp>


using std::string;
using std::vector;
using boost::iequals;
using boost::regex;
using boost::sregex_iterator;
using boost::algorithm::to_lower_copy;
using boost::algorithm::trim_copy;


namespace mailharvest
{


namespace
{

/*
Piece of the header value: either plain text or the bytes of consecutive encoded words sharing a charset.
*/
struct fragment_t
{
    string text;
    string charset;
    bool encoded;
};

} // anonymous namespace


string decode_header(const string& raw)
{
    static const regex ENCODED_WORD_REGEX{"=\\?([^?\\s]+)\\?([bBqQ])\\?([^?]*)\\?="};

    if (raw.empty())
        return raw;

    sregex_iterator word(raw.begin(), raw.end(), ENCODED_WORD_REGEX);
    const sregex_iterator end;
    if (word == end)
        return raw;

    vector<fragment_t> fragments;
    auto add_plain = [&fragments](const string& plain)
    {
        const string text = trim_copy(plain);
        if (!text.empty())
            fragments.push_back(fragment_t{text, string(), false});
    };

    string::const_iterator plain_begin = raw.begin();
    for (; word != end; ++word)
    {
        const auto& match = *word;
        const string plain(plain_begin, match[0].first);
        const bool follows_word = !fragments.empty() && fragments.back().encoded;
        if (!(follows_word && trim_copy(plain).empty()))
            add_plain(plain);

        // RFC 2231 allows a language after the asterisk.
        string charset = to_lower_copy(match[1].str());
        string::size_type lang_pos = charset.find('*');
        if (lang_pos != string::npos)
            charset.erase(lang_pos);

        const string bytes = iequals(match[2].str(), "b") ? codec::decode_base64(match[3].str()) :
            codec::decode_quoted_printable(match[3].str(), true);
        if (!fragments.empty() && fragments.back().encoded && trim_copy(plain).empty() && fragments.back().charset == charset)
            fragments.back().text += bytes;
        else
            fragments.push_back(fragment_t{bytes, charset, true});
        plain_begin = match[0].second;
    }
    add_plain(string(plain_begin, raw.end()));

    vector<string> decoded;
    for (const auto& frag : fragments)
    {
        string text = frag.encoded ? codec::to_utf8(frag.text, frag.charset) : codec::sanitize_utf8(frag.text);
        if (!text.empty())
            decoded.push_back(text);
    }
    return boost::algorithm::join(decoded, " ");
}


} // namespace mailharvest
