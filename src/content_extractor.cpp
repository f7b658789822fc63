/*

content_extractor.cpp
---------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <vector>
#include <boost/algorithm/string/join.hpp>
#include <mailharvest/content_extractor.hpp>
#include <mailharvest/html_text.hpp>
#include <mailharvest/log.hpp>


using std::string;
using std::vector;


namespace mailharvest
{


namespace
{

const string MEDIA_TEXT_PLAIN{"text/plain"};
const string MEDIA_TEXT_HTML{"text/html"};


/*
Joining every payload of the message, used when no text part gave anything.
*/
string deep_fallback(const mime& message)
{
    vector<string> payloads;
    for (const mime* entity : message.walk())
    {
        if (entity->is_multipart())
            continue;
        string payload = entity->text_content();
        if (!payload.empty())
            payloads.push_back(payload);
    }
    if (payloads.empty())
        return string();

    string combined = boost::algorithm::join(payloads, " ");
    // Crude, but the payloads of unknown type are mostly markup.
    if (combined.find('<') != string::npos && combined.find('>') != string::npos)
        return html_to_text(combined);
    return combined;
}

} // anonymous namespace


string extract_content(const mime& message, bool plain_text_only)
{
    string plain_content;
    string html_content;

    if (message.is_multipart())
    {
        for (const mime* part : message.walk())
        {
            if (part->is_attachment())
                continue;

            const string media_type = part->content_type().media_type();
            if (media_type == MEDIA_TEXT_PLAIN)
                plain_content += part->text_content();
            else if (media_type == MEDIA_TEXT_HTML && !plain_text_only)
                html_content += part->text_content();
        }
    }
    else
    {
        const string media_type = message.content_type().media_type();
        if (media_type == MEDIA_TEXT_PLAIN)
            plain_content = message.text_content();
        else if (media_type == MEDIA_TEXT_HTML && !plain_text_only)
            html_content = message.text_content();
    }

    string content;
    if (!plain_content.empty())
        content = plain_content;
    else if (!html_content.empty())
        content = html_to_text(html_content);
    content = normalize_whitespace(content);

    if (content.empty())
    {
        logger()->debug("No text part found, scanning all payloads.");
        content = normalize_whitespace(deep_fallback(message));
    }
    return content;
}


} // namespace mailharvest
