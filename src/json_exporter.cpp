/*

json_exporter.cpp
-----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <mailharvest/json_exporter.hpp>
#include <mailharvest/log.hpp>


using std::ofstream;
using std::string;
using std::vector;
using nlohmann::ordered_json;


namespace mailharvest
{


string json_exporter::to_json(const vector<email_record>& records)
{
    ordered_json document = ordered_json::array();
    for (const auto& record : records)
    {
        ordered_json object;
        object["id"] = record.id;
        object["subject"] = record.subject;
        object["from"] = record.from;
        object["date"] = record.date;
        object["content"] = record.content;
        document.push_back(std::move(object));
    }
    return document.dump(INDENTATION, ' ', false, ordered_json::error_handler_t::replace);
}


void json_exporter::write(const vector<email_record>& records, const string& path) const
{
    const string text = to_json(records);

    ofstream output(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!output.is_open())
        throw export_error("Error exporting to JSON.", path + ": " + std::strerror(errno));

    output << text;
    output.flush();
    if (!output)
        throw export_error("Error exporting to JSON.", path + ": " + std::strerror(errno));

    logger()->debug("Wrote {} records ({} bytes) to {}.", records.size(), text.size(), path);
}


} // namespace mailharvest
