/*

codec.hpp
---------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include "export.hpp"


namespace mailharvest
{


/**
Decoding of the transfer encodings and conversion of the character sets.

Every decoder is lenient: malformed input is decoded as far as possible, nothing is thrown.
**/
class MAILHARVEST_EXPORT codec
{
public:

    /**
    End of line.
    **/
    static const std::string END_OF_LINE;

    /**
    Backslash character.
    **/
    static const char BACKSLASH_CHAR{'\\'};

    /**
    Double quote character.
    **/
    static const char QUOTE_CHAR{'"'};

    /**
    Equal character.
    **/
    static const char EQUAL_CHAR{'='};

    /**
    Question mark character.
    **/
    static const char QUESTION_MARK_CHAR{'?'};

    /**
    Underscore character, stands for the space in the Q encoding.
    **/
    static const char UNDERSCORE_CHAR{'_'};

    /**
    UTF-8 charset name.
    **/
    static const std::string CHARSET_UTF8;

    /**
    UTF-8 encoding of the U+FFFD replacement character.
    **/
    static const std::string REPLACEMENT_CHARACTER;

    /**
    Decoding a base64 string.

    Characters outside of the alphabet (line breaks, spaces) are skipped, missing padding is tolerated.

    @param text Encoded string.
    @return     Decoded bytes.
    **/
    static std::string decode_base64(const std::string& text);

    /**
    Decoding a quoted printable string.

    Soft line breaks are removed, an invalid escape is kept as it is.

    @param text       Encoded string.
    @param q_encoding Flag whether the underscore stands for the space, as in the encoded words of headers.
    @return           Decoded bytes.
    **/
    static std::string decode_quoted_printable(const std::string& text, bool q_encoding = false);

    /**
    Checking whether the bytes form a valid UTF-8 string.

    @param text Bytes to check.
    @return     True if valid UTF-8.
    **/
    static bool is_utf8_string(const std::string& text);

    /**
    Replacing every invalid UTF-8 sequence with the replacement character.

    @param text Bytes to clean.
    @return     Valid UTF-8 string.
    **/
    static std::string sanitize_utf8(const std::string& text);

    /**
    Converting the bytes from the given charset to UTF-8.

    An empty, unknown or UTF-8 compatible charset as well as a failed conversion fall back to `sanitize_utf8()`.

    @param text    Bytes in the given charset.
    @param charset Charset name as found in the message.
    @return        Valid UTF-8 string.
    **/
    static std::string to_utf8(const std::string& text, const std::string& charset);

    /**
    Encoding the code point as UTF-8.

    @param code_point Unicode scalar value.
    @return           UTF-8 sequence, empty for a surrogate or an out of range value.
    **/
    static std::string encode_utf8(unsigned long code_point);

    /**
    Escaping the specified characters with the backslash.

    @param text               String to escape.
    @param escaping_chars     Characters to be escaped.
    @return                   Escaped string.
    **/
    static std::string escape_string(const std::string& text, const std::string& escaping_chars);

    /**
    Surrounding the string with double quotes.

    @param text String to surround.
    @return     Quoted string.
    **/
    static std::string surround_string(const std::string& text);
};


} // namespace mailharvest
