/*

json_exporter_test.cpp
----------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <mailharvest/harvest_error.hpp>
#include <mailharvest/json_exporter.hpp>


using std::ifstream;
using std::string;
using std::vector;
using mailharvest::email_record;
using mailharvest::export_error;
using mailharvest::json_exporter;

namespace fs = std::filesystem;


namespace
{

string read_file(const fs::path& path)
{
    ifstream file(path, std::ios::binary);
    return string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // anonymous namespace


TEST(json_exporter, empty_array)
{
    EXPECT_EQ(json_exporter::to_json(vector<email_record>()), "[]");
}


TEST(json_exporter, key_order_and_indentation)
{
    vector<email_record> records{{"1", "Offer", "hr@acme.com", "2025-03-03 14:05:09", "Welcome aboard"}};
    const string expected =
        "[\n"
        "  {\n"
        "    \"id\": \"1\",\n"
        "    \"subject\": \"Offer\",\n"
        "    \"from\": \"hr@acme.com\",\n"
        "    \"date\": \"2025-03-03 14:05:09\",\n"
        "    \"content\": \"Welcome aboard\"\n"
        "  }\n"
        "]";
    EXPECT_EQ(json_exporter::to_json(records), expected);
}


TEST(json_exporter, non_ascii_kept_literal)
{
    vector<email_record> records{{"1", "Caf\xC3\xA9", "Ren\xC3\xA9" "e <r@example.com>", "", "\xE2\x82\xAC" "100 \"quoted\""}};
    const string text = json_exporter::to_json(records);
    EXPECT_NE(text.find("\"Caf\xC3\xA9\""), string::npos);
    EXPECT_NE(text.find("\\\"quoted\\\""), string::npos);
    EXPECT_EQ(text.find("\\u00e9"), string::npos);
}


TEST(json_exporter, invalid_utf8_replaced)
{
    vector<email_record> records{{"1", "bad \xFF byte", "", "", ""}};
    const string text = json_exporter::to_json(records);
    EXPECT_NE(text.find("bad \xEF\xBF\xBD byte"), string::npos);
}


TEST(json_exporter, write_file)
{
    const fs::path path = fs::temp_directory_path() / "mailharvest_json_exporter_test.json";
    vector<email_record> records{
        {"1", "First", "a@example.com", "2025-01-01 00:00:00", "one"},
        {"2", "Second", "b@example.com", "2025-01-02 00:00:00", "two"}};

    json_exporter exporter;
    exporter.write(records, path.string());
    const string text = read_file(path);
    EXPECT_EQ(text, json_exporter::to_json(records));

    nlohmann::json parsed = nlohmann::json::parse(text);
    ASSERT_TRUE(parsed.is_array());
    ASSERT_EQ(parsed.size(), 2U);
    EXPECT_EQ(parsed[1]["id"].get<string>(), "2");
    EXPECT_EQ(parsed[1]["content"].get<string>(), "two");

    exporter.write(vector<email_record>(), path.string());
    EXPECT_EQ(read_file(path), "[]");
    fs::remove(path);
}


TEST(json_exporter, unwritable_path)
{
    const fs::path path = fs::temp_directory_path() / "mailharvest_no_such_directory" / "out.json";
    json_exporter exporter;
    try
    {
        exporter.write(vector<email_record>(), path.string());
        FAIL() << "Writing into a missing directory succeeded.";
    }
    catch (const export_error& exc)
    {
        EXPECT_STREQ(exc.what(), "Error exporting to JSON.");
        EXPECT_NE(exc.details().find(path.string()), string::npos);
    }
}
