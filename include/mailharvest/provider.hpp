/*

provider.hpp
------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <vector>
#include "export.hpp"
#include "harvest_error.hpp"


namespace mailharvest
{


/**
Supported mail providers.
**/
enum class provider_t {GMAIL, OUTLOOK, YAHOO, AOL, ZOHO};


/**
IMAP endpoint of a provider.
**/
struct MAILHARVEST_EXPORT provider_profile
{
    /**
    Provider name in lower case, e.g. `gmail`.
    **/
    std::string name;

    /**
    IMAP server hostname.
    **/
    std::string host;

    /**
    IMAP server port, implicit TLS.
    **/
    unsigned port;
};


/**
Getting the endpoint of the provider.

@param provider Provider tag.
@return         Provider endpoint.
**/
MAILHARVEST_EXPORT provider_profile provider_profile_for(provider_t provider);

/**
Getting the provider tag by its name.

@param name                 Provider name, case insensitive.
@return                     Provider tag.
@throw unsupported_provider Unknown provider name.
**/
MAILHARVEST_EXPORT provider_t provider_from_string(const std::string& name);

/**
Getting the endpoint of the provider by its name.

@param name                 Provider name, case insensitive.
@return                     Provider endpoint.
@throw unsupported_provider Unknown provider name.
**/
MAILHARVEST_EXPORT provider_profile resolve_provider(const std::string& name);

/**
Names of all supported providers, in the table order.
**/
MAILHARVEST_EXPORT std::vector<std::string> provider_names();


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
