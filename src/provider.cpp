/*

provider.cpp
------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <utility>
#include <vector>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <mailharvest/provider.hpp>


using std::pair;
using std::string;
using std::vector;
using boost::iequals;
using boost::algorithm::trim_copy;


namespace mailharvest
{


namespace
{

const unsigned IMAPS_PORT = 993;

const vector<pair<provider_t, provider_profile>> PROVIDERS
{
    {provider_t::GMAIL, {"gmail", "imap.gmail.com", IMAPS_PORT}},
    {provider_t::OUTLOOK, {"outlook", "outlook.office365.com", IMAPS_PORT}},
    {provider_t::YAHOO, {"yahoo", "imap.mail.yahoo.com", IMAPS_PORT}},
    {provider_t::AOL, {"aol", "imap.aol.com", IMAPS_PORT}},
    {provider_t::ZOHO, {"zoho", "imap.zoho.com", IMAPS_PORT}}
};

} // anonymous namespace


provider_profile provider_profile_for(provider_t provider)
{
    for (const auto& entry : PROVIDERS)
        if (entry.first == provider)
            return entry.second;
    throw unsupported_provider("Unsupported provider.", "Tag=`" + std::to_string(static_cast<int>(provider)) + "`.");
}


provider_t provider_from_string(const string& name)
{
    const string trimmed = trim_copy(name);
    for (const auto& entry : PROVIDERS)
        if (iequals(entry.second.name, trimmed))
            return entry.first;
    throw unsupported_provider("Unsupported provider: " + name + ".", "Supported providers are " + boost::algorithm::join(provider_names(), ", ") +
        ".");
}


provider_profile resolve_provider(const string& name)
{
    return provider_profile_for(provider_from_string(name));
}


vector<string> provider_names()
{
    vector<string> names;
    for (const auto& entry : PROVIDERS)
        names.push_back(entry.second.name);
    return names;
}


} // namespace mailharvest
