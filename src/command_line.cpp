/*

command_line.cpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <sstream>
#include <string>
#include <vector>
#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>
#include <mailharvest/command_line.hpp>
#include <mailharvest/provider.hpp>


using std::ostringstream;
using std::string;
using std::vector;

namespace po = boost::program_options;


namespace mailharvest
{


namespace
{

const string EXPORT_COMMAND{"export"};


/*
Options accepted both on the command line and in the configuration file.
*/
po::options_description harvest_options_description()
{
    po::options_description description("Export options");
    description.add_options()
        ("output,o", po::value<string>(), "Output file path")
        ("limit,l", po::value<long>(), "Maximum number of the most recent emails to export")
        ("provider,p", po::value<string>()->default_value("gmail"), ("Email provider: " + boost::algorithm::join(provider_names(), ", ")).c_str())
        ("plain-text", po::bool_switch(), "Extract only the plain text parts")
        ("exclude-sender", po::value<vector<string>>()->composing(), "Skip emails whose sender contains the value, may be repeated")
        ("exclude-file", po::value<string>(), "File with the senders to skip, one per line")
        ("verbose,v", po::bool_switch(), "Log the progress of every message")
        ("trace", po::bool_switch(), "Log the protocol traffic");
    return description;
}


po::options_description generic_options_description()
{
    po::options_description description("Generic options");
    description.add_options()
        ("help,h", "Print this help")
        ("config,c", po::value<string>(), "Configuration file with the export options");
    return description;
}

} // anonymous namespace


command_line_t parse_command_line(int argc, const char* const argv[])
{
    po::options_description hidden;
    hidden.add_options()("command", po::value<string>(), "Command");
    po::positional_options_description positional;
    positional.add("command", 1);

    po::options_description command_line_options;
    command_line_options.add(generic_options_description()).add(harvest_options_description()).add(hidden);

    command_line_t result;
    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(command_line_options).positional(positional).run(), vm);
        if (vm.count("help"))
        {
            result.command = command_t::HELP;
            return result;
        }

        if (vm.count("config"))
            po::store(po::parse_config_file<char>(vm["config"].as<string>().c_str(), harvest_options_description()), vm);
        po::notify(vm);
    }
    catch (const po::error& exc)
    {
        throw config_error("Invalid command line.", exc.what());
    }

    if (!vm.count("command"))
        return result;
    const string command = vm["command"].as<string>();
    if (command != EXPORT_COMMAND)
        throw config_error("Unknown command.", command);
    result.command = command_t::EXPORT;

    harvest_config& config = result.config;
    config.provider = provider_from_string(vm["provider"].as<string>());
    if (!vm.count("output") || vm["output"].as<string>().empty())
        throw config_error("Missing output file.", "The export command requires the --output option.");
    config.options.output_path = vm["output"].as<string>();
    if (vm.count("limit"))
        config.options.limit = vm["limit"].as<long>();
    config.options.plain_text_only = vm["plain-text"].as<bool>();
    if (vm.count("exclude-sender"))
        config.options.exclude_senders = vm["exclude-sender"].as<vector<string>>();
    if (vm.count("exclude-file"))
        config.options.exclude_file = vm["exclude-file"].as<string>();

    if (vm["trace"].as<bool>())
        config.log_level = spdlog::level::trace;
    else if (vm["verbose"].as<bool>())
        config.log_level = spdlog::level::debug;
    return result;
}


string usage()
{
    po::options_description visible;
    visible.add(generic_options_description()).add(harvest_options_description());

    ostringstream text;
    text << "Usage: mailharvest export -o PATH [options]" << std::endl << std::endl;
    text << "Commands:" << std::endl;
    text << "  export                Export the inbox of the provider account to a JSON file" << std::endl << std::endl;
    text << visible;
    return text.str();
}


} // namespace mailharvest
