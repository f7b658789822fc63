/*

config.cpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <fstream>
#include <string>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <mailharvest/config.hpp>
#include <mailharvest/log.hpp>


using std::getenv;
using std::ifstream;
using std::string;
using boost::starts_with;
using boost::algorithm::to_upper_copy;
using boost::algorithm::trim_copy;


namespace mailharvest
{


const char* const DOTENV_FILE = ".env";


namespace
{

const string EXPORT_PREFIX{"export "};


bool set_variable(const string& name, const string& value)
{
#ifdef _WIN32
    return _putenv_s(name.c_str(), value.c_str()) == 0;
#else
    return setenv(name.c_str(), value.c_str(), 0) == 0;
#endif
}


string variable_value(const string& name)
{
    const char* value = getenv(name.c_str());
    return value == nullptr ? string() : string(value);
}

} // anonymous namespace


bool load_dotenv(const string& path)
{
    ifstream file(path);
    if (!file)
        return false;

    string line;
    unsigned line_no = 0;
    while (getline(file, line))
    {
        line_no++;
        line = trim_copy(line);
        if (line.empty() || starts_with(line, "#"))
            continue;
        if (starts_with(line, EXPORT_PREFIX))
            line = trim_copy(line.substr(EXPORT_PREFIX.size()));

        string::size_type equal_pos = line.find('=');
        if (equal_pos == string::npos)
        {
            logger()->warn("Skipping line {} of {}, no `=` found.", line_no, path);
            continue;
        }
        const string name = trim_copy(line.substr(0, equal_pos));
        string value = trim_copy(line.substr(equal_pos + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            value = value.substr(1, value.size() - 2);
        if (name.empty())
            continue;
        if (getenv(name.c_str()) == nullptr && !set_variable(name, value))
            logger()->warn("Setting the variable {} from {} failed.", name, path);
    }
    return !file.bad();
}


string username_variable(provider_t provider)
{
    return to_upper_copy(provider_profile_for(provider).name) + "_USERNAME";
}


string password_variable(provider_t provider)
{
    return to_upper_copy(provider_profile_for(provider).name) + "_APP_PASSWORD";
}


credentials_t load_credentials(provider_t provider)
{
    if (load_dotenv())
        logger()->debug("Environment loaded from {}.", DOTENV_FILE);

    const string user_var = username_variable(provider);
    const string pass_var = password_variable(provider);
    credentials_t credentials{variable_value(user_var), variable_value(pass_var)};
    if (credentials.username.empty() || credentials.secret.empty())
        throw config_error("Email credentials not found.", "Please set " + user_var + " and " + pass_var + " in the environment or the " +
            DOTENV_FILE + " file.");
    return credentials;
}


} // namespace mailharvest
