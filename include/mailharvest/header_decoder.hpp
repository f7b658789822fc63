/*

header_decoder.hpp
------------------

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
Decoding the MIME encoded words of a header value into UTF-8 text.

Each encoded word `=?charset?B|Q?text?=` is decoded from base64 or the Q encoding and converted from its charset. Whitespace between two encoded words
is dropped and adjacent words of the same charset are joined before the conversion, so multibyte characters split across words survive. The
remaining fragments are trimmed and joined with a single space. Undecodable bytes become the replacement character, nothing is thrown.

@param raw Raw header value.
@return    Decoded text, the input itself if it has no encoded words.
**/
MAILHARVEST_EXPORT std::string decode_header(const std::string& raw);


} // namespace mailharvest
