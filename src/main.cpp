/*

main.cpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <mailharvest/command_line.hpp>
#include <mailharvest/config.hpp>
#include <mailharvest/dialog.hpp>
#include <mailharvest/harvest_service.hpp>
#include <mailharvest/json_exporter.hpp>
#include <mailharvest/log.hpp>
#include <mailharvest/mail_session.hpp>


using mailharvest::command_line_t;
using mailharvest::command_t;
using mailharvest::credentials_t;
using mailharvest::dialog_error;
using mailharvest::harvest_error;
using mailharvest::harvest_service;
using mailharvest::json_exporter;
using mailharvest::logger;
using mailharvest::mail_session;


int main(int argc, char* argv[])
{
    try
    {
        command_line_t command_line = mailharvest::parse_command_line(argc, argv);
        if (command_line.command == command_t::HELP)
        {
            std::cout << mailharvest::usage();
            return EXIT_SUCCESS;
        }
        if (command_line.command == command_t::NONE)
        {
            std::cerr << mailharvest::usage();
            return EXIT_FAILURE;
        }

        const mailharvest::harvest_config& config = command_line.config;
        mailharvest::init_logger(config.log_level);
        credentials_t credentials = mailharvest::load_credentials(config.provider);
        std::unique_ptr<mail_session> session = mailharvest::make_session(config.provider, credentials);
        json_exporter exporter;
        harvest_service service(*session, exporter);
        service.run(config.options);
    }
    catch (const harvest_error& exc)
    {
        logger()->error("{} {}", exc.what(), exc.details());
        return EXIT_FAILURE;
    }
    catch (const dialog_error& exc)
    {
        logger()->error("{} {}", exc.what(), exc.details());
        return EXIT_FAILURE;
    }
    catch (const std::exception& exc)
    {
        logger()->error("{}", exc.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
