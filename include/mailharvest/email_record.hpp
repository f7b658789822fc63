/*

email_record.hpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>


namespace mailharvest
{


/**
Flat record of a harvested message.
**/
struct email_record
{
    /**
    Message sequence number in the mailbox, as decimal string.
    **/
    std::string id;

    /**
    Decoded subject.
    **/
    std::string subject;

    /**
    Decoded sender.
    **/
    std::string from;

    /**
    Date as `YYYY-MM-DD HH:MM:SS`, or the raw header if it could not be parsed.
    **/
    std::string date;

    /**
    Whitespace normalized body text.
    **/
    std::string content;
};


} // namespace mailharvest
