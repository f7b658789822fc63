/*

harvest_error.hpp
-----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <stdexcept>
#include <string>
#include "export.hpp"


namespace mailharvest
{


/**
Base of the errors reported by the harvesting.
**/
class MAILHARVEST_EXPORT harvest_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor and storing the details.

    @param msg     Error message.
    @param details Detailed message.
    **/
    harvest_error(const std::string& msg, const std::string& details);

    harvest_error(const harvest_error&) = default;

    harvest_error(harvest_error&&) = default;

    ~harvest_error() = default;

    harvest_error& operator=(const harvest_error&) = default;

    harvest_error& operator=(harvest_error&&) = default;

    /**
    Getting the detailed error message.

    @return Detailed error message.
    **/
    std::string details() const;

protected:

    /**
    Detailed error message.
    **/
    std::string details_;
};


/**
Provider name not found in the provider table.
**/
class MAILHARVEST_EXPORT unsupported_provider : public harvest_error
{
public:
    using harvest_error::harvest_error;
};


/**
Missing or invalid configuration, credentials included.
**/
class MAILHARVEST_EXPORT config_error : public harvest_error
{
public:
    using harvest_error::harvest_error;
};


/**
Transport or authentication failure, or use of a session which is not connected.
**/
class MAILHARVEST_EXPORT connection_error : public harvest_error
{
public:
    using harvest_error::harvest_error;
};


/**
Selecting or searching the mailbox refused.
**/
class MAILHARVEST_EXPORT mailbox_error : public harvest_error
{
public:
    using harvest_error::harvest_error;
};


/**
Single message could not be fetched.
**/
class MAILHARVEST_EXPORT fetch_error : public harvest_error
{
public:
    using harvest_error::harvest_error;
};


/**
Single message could not be parsed.
**/
class MAILHARVEST_EXPORT decode_error : public harvest_error
{
public:
    using harvest_error::harvest_error;
};


/**
Records could not be written.
**/
class MAILHARVEST_EXPORT export_error : public harvest_error
{
public:
    using harvest_error::harvest_error;
};


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
