/*

content_extractor.hpp
---------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include "export.hpp"
#include "mime.hpp"


namespace mailharvest
{


/**
Extracting the body text of a parsed message.

Non attachment `text/plain` parts are preferred, then the `text/html` parts converted by `html_to_text()`. If neither gives any text, every payload of
the message is joined regardless of its type and disposition; the result goes through `html_to_text()` when it contains both `<` and `>`. The text is
whitespace normalized in all cases.

@param message         Parsed message.
@param plain_text_only Flag whether the HTML parts are ignored when selecting the preferred body.
@return                Body text, empty only if the message has no payload at all.
**/
MAILHARVEST_EXPORT std::string extract_content(const mime& message, bool plain_text_only);


} // namespace mailharvest
