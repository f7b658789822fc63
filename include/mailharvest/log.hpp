/*

log.hpp
-------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include "export.hpp"


namespace mailharvest
{


/**
Name of the logger shared by all components.
**/
MAILHARVEST_EXPORT extern const char* const LOGGER_NAME;

/**
Creating the console logger, or adjusting its level if it already exists.

@param level Minimal level of the written messages.
@return      The shared logger.
**/
MAILHARVEST_EXPORT std::shared_ptr<spdlog::logger> init_logger(spdlog::level::level_enum level);

/**
Getting the shared logger, created at the info level if `init_logger()` was not called.

@return The shared logger.
**/
MAILHARVEST_EXPORT std::shared_ptr<spdlog::logger> logger();


} // namespace mailharvest
