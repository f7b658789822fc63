/*

harvest_error.cpp
-----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <mailharvest/harvest_error.hpp>


using std::string;


namespace mailharvest
{


harvest_error::harvest_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string harvest_error::details() const
{
    return details_;
}


} // namespace mailharvest
