/*

exclusions.cpp
--------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <mailharvest/exclusions.hpp>
#include <mailharvest/log.hpp>


using std::ifstream;
using std::string;
using std::vector;
using boost::starts_with;
using boost::algorithm::to_lower_copy;
using boost::algorithm::trim_copy;


namespace mailharvest
{


namespace
{

const string COMMENT_PREFIX{"#"};

} // anonymous namespace


vector<string> load_exclusion_file(const string& path)
{
    vector<string> entries;
    ifstream file(path);
    if (!file)
    {
        logger()->error("Error loading exclusion list from {}: {}", path, std::strerror(errno));
        return entries;
    }

    string line;
    while (getline(file, line))
    {
        line = trim_copy(line);
        if (line.empty() || starts_with(line, COMMENT_PREFIX))
            continue;
        entries.push_back(line);
    }
    if (file.bad())
    {
        logger()->error("Error loading exclusion list from {}: read failure", path);
        return vector<string>();
    }
    return entries;
}


exclusion_list_t merge_exclusions(const vector<string>& cli_values, const vector<string>& file_values)
{
    exclusion_list_t exclusions;
    for (const auto* values : {&cli_values, &file_values})
        for (const auto& value : *values)
        {
            string entry = to_lower_copy(trim_copy(value));
            if (!entry.empty())
                exclusions.insert(entry);
        }
    return exclusions;
}


bool is_excluded(const string& sender, const exclusion_list_t& exclusions)
{
    const string lower_sender = to_lower_copy(sender);
    for (const auto& exclusion : exclusions)
        if (lower_sender.find(exclusion) != string::npos)
            return true;
    return false;
}


} // namespace mailharvest
