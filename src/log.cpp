/*

log.cpp
-------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <spdlog/sinks/stdout_color_sinks.h>
#include <mailharvest/log.hpp>


using std::shared_ptr;


namespace mailharvest
{


const char* const LOGGER_NAME = "mailharvest";


shared_ptr<spdlog::logger> init_logger(spdlog::level::level_enum level)
{
    auto log = spdlog::get(LOGGER_NAME);
    if (!log)
    {
        log = spdlog::stdout_color_mt(LOGGER_NAME);
        log->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    }
    log->set_level(level);
    return log;
}


shared_ptr<spdlog::logger> logger()
{
    auto log = spdlog::get(LOGGER_NAME);
    if (!log)
        log = init_logger(spdlog::level::info);
    return log;
}


} // namespace mailharvest
