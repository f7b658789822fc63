/*

date_normalizer.cpp
-------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <stdexcept>
#include <string>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/regex.hpp>
#include <mailharvest/date_normalizer.hpp>


using std::out_of_range;
using std::stoi;
using std::string;
using boost::regex;
using boost::regex_match;
using boost::smatch;
using boost::algorithm::to_lower_copy;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::hours;
using boost::posix_time::minutes;
using boost::posix_time::seconds;


namespace mailharvest
{


namespace
{

const string MONTHS{"janfebmaraprmayjunjulaugsepoctnovdec"};

} // anonymous namespace


string normalize_date(const string& raw)
{
    // The weekday comma is optional and the zone may follow the time directly. Date fields are separated by spaces or dashes.
    static const regex DATE_REGEX{"\\s*(?:[A-Za-z]+(?:\\s*,\\s*|\\s+))?(\\d{1,2})(?:\\s+|-)([A-Za-z]{3,})\\.?(?:\\s+|-)(\\d{4}|\\d{2})\\s+"
        "(\\d{1,2}):(\\d{2})(?::(\\d{2}))?(?:[+-]\\d{4}.*|\\s+.*)?\\s*"};

    smatch match;
    if (!regex_match(raw, match, DATE_REGEX))
        return raw;

    string::size_type month_pos = MONTHS.find(to_lower_copy(match[2].str().substr(0, 3)));
    if (month_pos == string::npos || month_pos % 3 != 0)
        return raw;

    int year = stoi(match[3].str());
    if (match[3].length() == 2)
        year += year > 68 ? 1900 : 2000;
    const int hour = stoi(match[4].str());
    const int minute = stoi(match[5].str());
    const int second = match[6].matched ? stoi(match[6].str()) : 0;
    if (hour > 23 || minute > 59 || second > 59)
        return raw;

    try
    {
        date day(static_cast<unsigned short>(year), static_cast<unsigned short>(month_pos / 3 + 1), static_cast<unsigned short>(stoi(match[1].str())));
        string formatted = boost::posix_time::to_iso_extended_string(ptime(day, hours(hour) + minutes(minute) + seconds(second)));
        formatted[formatted.find('T')] = ' ';
        return formatted;
    }
    catch (const out_of_range&)
    {
        return raw;
    }
}


} // namespace mailharvest
