/*

date_normalizer.hpp
-------------------

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
Formatting the date header as `YYYY-MM-DD HH:MM:SS`.

The accepted form is `[Day,] DD Mon YYYY HH:MM[:SS] [zone]`. The month name is case insensitive, a two digit year above 68 belongs to the 1900s and
the other ones to the 2000s. The time is kept as written, the zone is not applied.

@param raw Date header value.
@return    Formatted date, or the input unchanged if it cannot be parsed.
**/
MAILHARVEST_EXPORT std::string normalize_date(const std::string& raw);


} // namespace mailharvest
