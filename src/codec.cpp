/*

codec.cpp
---------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/locale/encoding.hpp>
#include <mailharvest/codec.hpp>


using std::string;
using boost::algorithm::trim_copy;
using boost::algorithm::to_lower_copy;


namespace mailharvest
{


const string codec::END_OF_LINE{"\r\n"};
const string codec::CHARSET_UTF8{"utf-8"};
const string codec::REPLACEMENT_CHARACTER{"\xEF\xBF\xBD"};


namespace
{

const string BASE64_ALPHABET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};


int hex_digit(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    return -1;
}


/*
Length of the valid UTF-8 prefix at the given position: the full sequence length if the sequence is valid, otherwise the number of bytes
making the maximal invalid subpart (at least one), negated.
*/
int utf8_sequence(const string& text, string::size_type pos)
{
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80)
        return 1;

    int length = 0;
    unsigned char low = 0x80, high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
        length = 2;
    else if (lead == 0xE0)
    {
        length = 3;
        low = 0xA0;
    }
    else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF)
        length = 3;
    else if (lead == 0xED)
    {
        length = 3;
        high = 0x9F;
    }
    else if (lead == 0xF0)
    {
        length = 4;
        low = 0x90;
    }
    else if (lead >= 0xF1 && lead <= 0xF3)
        length = 4;
    else if (lead == 0xF4)
    {
        length = 4;
        high = 0x8F;
    }
    else
        return -1;

    for (int i = 1; i < length; i++)
    {
        if (pos + i >= text.size())
            return -i;
        const unsigned char ch = static_cast<unsigned char>(text[pos + i]);
        if (ch < low || ch > high)
            return -i;
        low = 0x80;
        high = 0xBF;
    }
    return length;
}

} // anonymous namespace


string codec::decode_base64(const string& text)
{
    string decoded;
    decoded.reserve(text.size() * 3 / 4);
    unsigned long buffer = 0;
    int bits = 0;
    for (char ch : text)
    {
        if (ch == EQUAL_CHAR)
            break;
        string::size_type value = BASE64_ALPHABET.find(ch);
        if (value == string::npos)
            continue;
        buffer = (buffer << 6) | static_cast<unsigned long>(value);
        bits += 6;
        if (bits >= 8)
        {
            bits -= 8;
            decoded += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    return decoded;
}


string codec::decode_quoted_printable(const string& text, bool q_encoding)
{
    string decoded;
    decoded.reserve(text.size());
    for (string::size_type i = 0; i < text.size(); i++)
    {
        const char ch = text[i];
        if (ch == UNDERSCORE_CHAR && q_encoding)
            decoded += ' ';
        else if (ch == EQUAL_CHAR)
        {
            // Soft line break, with or without the carriage return.
            if (i + 1 < text.size() && text[i + 1] == '\n')
            {
                i += 1;
                continue;
            }
            if (i + 2 < text.size() && text[i + 1] == '\r' && text[i + 2] == '\n')
            {
                i += 2;
                continue;
            }
            if (i + 2 < text.size())
            {
                int high = hex_digit(text[i + 1]);
                int low = hex_digit(text[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    decoded += static_cast<char>(high * 16 + low);
                    i += 2;
                    continue;
                }
            }
            decoded += ch;
        }
        else
            decoded += ch;
    }
    return decoded;
}


bool codec::is_utf8_string(const string& text)
{
    string::size_type pos = 0;
    while (pos < text.size())
    {
        int length = utf8_sequence(text, pos);
        if (length < 0)
            return false;
        pos += length;
    }
    return true;
}


string codec::sanitize_utf8(const string& text)
{
    string clean;
    clean.reserve(text.size());
    string::size_type pos = 0;
    while (pos < text.size())
    {
        int length = utf8_sequence(text, pos);
        if (length > 0)
        {
            clean.append(text, pos, length);
            pos += length;
        }
        else
        {
            clean += REPLACEMENT_CHARACTER;
            pos += -length;
        }
    }
    return clean;
}


string codec::to_utf8(const string& text, const string& charset)
{
    string cs = to_lower_copy(trim_copy(charset));
    if (cs.empty() || cs == CHARSET_UTF8 || cs == "utf8" || cs == "us-ascii" || cs == "ascii")
        return sanitize_utf8(text);

    try
    {
        return sanitize_utf8(boost::locale::conv::to_utf<char>(text, cs, boost::locale::conv::stop));
    }
    catch (const boost::locale::conv::invalid_charset_error&)
    {
        return sanitize_utf8(text);
    }
    catch (const boost::locale::conv::conversion_error&)
    {
        return sanitize_utf8(text);
    }
}


string codec::encode_utf8(unsigned long code_point)
{
    string encoded;
    if (code_point < 0x80)
        encoded += static_cast<char>(code_point);
    else if (code_point < 0x800)
    {
        encoded += static_cast<char>(0xC0 | (code_point >> 6));
        encoded += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    else if (code_point >= 0xD800 && code_point <= 0xDFFF)
        return encoded;
    else if (code_point < 0x10000)
    {
        encoded += static_cast<char>(0xE0 | (code_point >> 12));
        encoded += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        encoded += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    else if (code_point <= 0x10FFFF)
    {
        encoded += static_cast<char>(0xF0 | (code_point >> 18));
        encoded += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        encoded += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        encoded += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    return encoded;
}


string codec::escape_string(const string& text, const string& escaping_chars)
{
    string esc_str;
    esc_str.reserve(text.size());
    for (auto ch : text)
    {
        if (escaping_chars.find(ch) != string::npos)
            esc_str += BACKSLASH_CHAR;
        esc_str += ch;
    }
    return esc_str;
}


string codec::surround_string(const string& text)
{
    return QUOTE_CHAR + text + QUOTE_CHAR;
}


} // namespace mailharvest
