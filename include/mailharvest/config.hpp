/*

config.hpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "export.hpp"
#include "harvest_error.hpp"
#include "provider.hpp"


namespace mailharvest
{


/**
Account credentials, the secret is an application password.
**/
struct credentials_t
{
    /**
    Account username.
    **/
    std::string username;

    /**
    Account secret.
    **/
    std::string secret;
};


/**
Parameters of a single harvest run.
**/
struct harvest_options
{
    /**
    Path of the JSON file to write.
    **/
    std::string output_path;

    /**
    Number of the most recent messages to keep, no limit if missing or not positive.
    **/
    std::optional<long> limit;

    /**
    Flag whether the HTML parts are ignored.
    **/
    bool plain_text_only = false;

    /**
    Sender substrings to skip, as given on the command line.
    **/
    std::vector<std::string> exclude_senders;

    /**
    File with more sender substrings to skip.
    **/
    std::optional<std::string> exclude_file;
};


/**
Complete configuration of the program, built once at the startup.
**/
struct harvest_config
{
    /**
    Mail provider.
    **/
    provider_t provider = provider_t::GMAIL;

    /**
    Run parameters.
    **/
    harvest_options options;

    /**
    Console log level.
    **/
    spdlog::level::level_enum log_level = spdlog::level::info;
};


/**
Default name of the file with the environment variables.
**/
MAILHARVEST_EXPORT extern const char* const DOTENV_FILE;

/**
Loading `KEY=VALUE` lines of the file into the environment.

Blank lines and lines starting with `#` are skipped, an optional `export ` prefix and quotes around the value are removed. Variables already set in
the environment are kept.

@param path Path of the file.
@return     False if the file does not exist or cannot be read.
**/
MAILHARVEST_EXPORT bool load_dotenv(const std::string& path = DOTENV_FILE);

/**
Name of the environment variable holding the username of the provider, e.g. `GMAIL_USERNAME`.
**/
MAILHARVEST_EXPORT std::string username_variable(provider_t provider);

/**
Name of the environment variable holding the application password of the provider, e.g. `GMAIL_APP_PASSWORD`.
**/
MAILHARVEST_EXPORT std::string password_variable(provider_t provider);

/**
Reading the credentials of the provider from the environment, after loading the `.env` file of the working directory if there is one.

@param provider     Mail provider.
@return             Credentials.
@throw config_error Username or password missing or empty.
**/
MAILHARVEST_EXPORT credentials_t load_credentials(provider_t provider);


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
