/*

harvest_service.cpp
-------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <vector>
#include <mailharvest/exclusions.hpp>
#include <mailharvest/harvest_service.hpp>
#include <mailharvest/log.hpp>


using std::string;
using std::vector;


namespace mailharvest
{


harvest_service::harvest_service(mail_session& session, const json_exporter& exporter) : session_(session), exporter_(exporter)
{
}


std::size_t harvest_service::run(const harvest_options& options)
{
    vector<string> file_exclusions;
    if (options.exclude_file.has_value())
    {
        file_exclusions = load_exclusion_file(options.exclude_file.value());
        logger()->info("Loaded {} exclusions from {}", file_exclusions.size(), options.exclude_file.value());
    }
    const exclusion_list_t exclusions = merge_exclusions(options.exclude_senders, file_exclusions);

    try
    {
        session_.connect();
        logger()->info("Fetching emails...");
        vector<email_record> records = session_.fetch_all(options.limit, options.plain_text_only, exclusions);
        logger()->info("Found {} emails", records.size());

        logger()->info("Exporting to {}...", options.output_path);
        exporter_.write(records, options.output_path);
        session_.disconnect();
        logger()->info("Export completed successfully");
        return records.size();
    }
    catch (const harvest_error&)
    {
        session_.disconnect();
        throw;
    }
}


} // namespace mailharvest
