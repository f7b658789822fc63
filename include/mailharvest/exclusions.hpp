/*

exclusions.hpp
--------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <set>
#include <string>
#include <vector>
#include "export.hpp"


namespace mailharvest
{


/**
Lower case substrings of the senders to skip.
**/
typedef std::set<std::string> exclusion_list_t;


/**
Reading the exclusion file, one sender substring per line.

Lines are trimmed, empty lines and lines starting with `#` are skipped. A file which cannot be read is logged as an error and gives no entries.

@param path Path of the file.
@return     Entries in the file order.
**/
MAILHARVEST_EXPORT std::vector<std::string> load_exclusion_file(const std::string& path);

/**
Merging the exclusions given on the command line and read from the file.

@param cli_values  Values of the command line.
@param file_values Values of the exclusion file.
@return            Union of both, lower cased, blank values dropped.
**/
MAILHARVEST_EXPORT exclusion_list_t merge_exclusions(const std::vector<std::string>& cli_values, const std::vector<std::string>& file_values);

/**
Checking whether the sender contains any of the exclusions, case insensitively.

@param sender     Decoded sender.
@param exclusions Exclusion list.
@return           True if the message must be skipped.
**/
MAILHARVEST_EXPORT bool is_excluded(const std::string& sender, const exclusion_list_t& exclusions);


} // namespace mailharvest
