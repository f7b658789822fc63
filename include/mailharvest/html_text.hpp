/*

html_text.hpp
-------------

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
Extracting the readable text of an HTML fragment.

The steps are applied in order:
1. `script` and `style` elements are removed together with their content.
2. Opening tags of `div`, `p`, `h1`-`h9`, `br`, `li` and `tr` become line breaks.
3. Common named entities are replaced by their characters.
4. Decimal character references are replaced by their UTF-8 encoding, invalid code points are kept as written.
5. All remaining tags are removed.
6. Line break runs collapse to one, then whitespace is normalized by `normalize_whitespace()`.

No markup validation is done, malformed HTML goes through the same steps.

@param html HTML fragment in UTF-8.
@return     Text without tags, with single spaces between words.
**/
MAILHARVEST_EXPORT std::string html_to_text(const std::string& html);

/**
Collapsing every whitespace run into a single space and trimming the ends.

Besides the ASCII whitespace, the Unicode space separators such as the no-break space are recognized in their UTF-8 form.

@param text UTF-8 text.
@return     Normalized text.
**/
MAILHARVEST_EXPORT std::string normalize_whitespace(const std::string& text);


} // namespace mailharvest
