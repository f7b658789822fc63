/*

command_line.hpp
----------------

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
#include "config.hpp"
#include "export.hpp"
#include "harvest_error.hpp"


namespace mailharvest
{


/**
Commands of the program.
**/
enum class command_t {NONE, HELP, EXPORT};


/**
Parsed command line.
**/
struct command_line_t
{
    /**
    Requested command, `NONE` when missing.
    **/
    command_t command = command_t::NONE;

    /**
    Configuration, complete only for the `EXPORT` command.
    **/
    harvest_config config;
};


/**
Parsing the program arguments.

The options may also be given in an INI style file named by `--config`, the command line values win over the file ones.

@param argc         Number of arguments.
@param argv         Arguments, the program name first.
@return             Command and configuration.
@throw config_error Invalid or missing option, unknown command, unreadable configuration file.
@throw unsupported_provider Unknown provider name.
**/
MAILHARVEST_EXPORT command_line_t parse_command_line(int argc, const char* const argv[]);

/**
Usage text listing the commands and the options.
**/
MAILHARVEST_EXPORT std::string usage();


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
